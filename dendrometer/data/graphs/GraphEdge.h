/***************************************************************************************************
 * Copyright (c) 2016 - 2024
 * Blue Brain Project (BBP) / Ecole Polytechnique Federale de Lausanne (EPFL)
 *
 * This file is part of Dendrometer
 *
 * This library is free software; you can redistribute it and/or modify it under the terms of the
 * GNU General Public License version 3.0 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * You should have received a copy of the GNU General Public License along with this library;
 * if not, write to the Free Software Foundation, Inc., 59 Temple Place - Suite 330, Boston,
 * MA 02111-1307, USA.
 * You can also find it on the GNU web site < https://www.gnu.org/licenses/gpl-3.0.en.html >
 **************************************************************************************************/

#pragma once

#include <common/Headers.hh>

namespace Dendrometer
{

/// Forward declaration
class GraphNode;

/**
 * @brief The GraphEdge class
 * A directed weighted edge between two nodes of a DirectedWeightedGraph. The edge is owned by
 * the graph, and its end points are only referenced.
 */
class GraphEdge
{
public:

    /**
     * @brief GraphEdge
     * @param source
     * @param target
     * @param weight
     */
    GraphEdge(GraphNode* source, GraphNode* target, const double& weight)
        : source(source)
        , target(target)
        , weight(weight)
    {
        /// EMPTY CONSTRUCTOR
    }

public:

    /**
     * @brief source
     * The node where the edge starts, i.e. the parent.
     */
    GraphNode* source;

    /**
     * @brief target
     * The node where the edge ends, i.e. the child.
     */
    GraphNode* target;

    /**
     * @brief weight
     * A non-negative weight, by default the Euclidean distance between the two nodes.
     */
    double weight;
};

/**
 * @brief GraphEdges
 */
typedef std::vector< GraphEdge* > GraphEdges;

}
