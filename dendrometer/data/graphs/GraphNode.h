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

#include <math/Vector3f.h>
#include <data/graphs/GraphEdge.h>
#include <common/Defines.h>

namespace Dendrometer
{

/**
 * @brief The GraphNode class
 * A node of a DirectedWeightedGraph. Nodes are identified by their address, two nodes at the
 * same location are distinct.
 */
class GraphNode
{
public:

    /**
     * @brief GraphNode
     * @param graphIndex
     * The index of the node in the list of nodes of the graph.
     * @param point
     * The position of the node in space.
     * @param index
     * The index of the morphology sample this node represents.
     * @param radius
     * The radius of the sample.
     * @param type
     * The structure type of the sample.
     */
    GraphNode(const size_t& graphIndex,
              const Vector3f& point,
              const int64_t& index,
              const float& radius = 0.f,
              const size_t& type = 0);

    /**
     * @brief inDegree
     * @return
     * Returns the number of incoming edges.
     */
    size_t inDegree() const { return incomingEdges.size(); }

    /**
     * @brief outDegree
     * @return
     * Returns the number of outgoing edges.
     */
    size_t outDegree() const { return outgoingEdges.size(); }

    /**
     * @brief distance
     * @param other
     * @return
     * Returns the Euclidean distance to the other node.
     */
    double distance(const GraphNode* other) const;

    /**
     * @brief isSameLocation
     * @param other
     * @return
     * Returns true if the two nodes share the same location, even if they are different nodes.
     */
    bool isSameLocation(const GraphNode* other) const;

public:

    /**
     * @brief graphIndex
     * The index of the node in the graph, in [0, numberNodes).
     */
    size_t graphIndex;

    /**
     * @brief index
     * The index of the corresponding morphology sample.
     */
    int64_t index;

    /**
     * @brief parentIndex
     * The index of the parent sample, refreshed by DirectedWeightedGraph::updateNodeIndices.
     */
    int64_t parentIndex = ROOT_PARENT_INDEX;

    /**
     * @brief point
     */
    Vector3f point;

    /**
     * @brief radius
     */
    float radius;

    /**
     * @brief type
     */
    size_t type;

    /**
     * @brief incomingEdges
     * The edges ending at this node. A node of a valid tree has at most one.
     */
    GraphEdges incomingEdges;

    /**
     * @brief outgoingEdges
     * The edges starting at this node, in insertion order.
     */
    GraphEdges outgoingEdges;
};

/**
 * @brief GraphNodes
 */
typedef std::vector< GraphNode* > GraphNodes;

/**
 * @brief ConstGraphNodes
 */
typedef std::vector< const GraphNode* > ConstGraphNodes;

}
