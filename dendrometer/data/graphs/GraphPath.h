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

#include <data/graphs/GraphNode.h>

namespace Dendrometer
{

/**
 * @brief The GraphPath class
 * An ordered sequence of nodes connected by edges, and the total length of the path, i.e. the
 * sum of the weights of the traversed edges. The nodes are owned by the graph.
 */
class GraphPath
{
public:

    /**
     * @brief GraphPath
     * Constructs an empty path.
     */
    GraphPath();

    /**
     * @brief appendNode
     * Adds a node at the end of the path.
     * @param node
     */
    void appendNode(const GraphNode* node);

    /**
     * @brief prependNode
     * Adds a node at the beginning of the path.
     * @param node
     */
    void prependNode(const GraphNode* node);

    /**
     * @brief reverse
     * Reverses the order of the nodes, the length is unchanged.
     */
    void reverse();

    /**
     * @brief contains
     * @param node
     * @return
     * Returns true if the node belongs to the path.
     */
    bool contains(const GraphNode* node) const;

    /**
     * @brief isEmpty
     * @return
     */
    bool isEmpty() const { return _nodes.empty(); }

    /**
     * @brief size
     * @return
     * Returns the number of nodes in the path.
     */
    size_t size() const { return _nodes.size(); }

    /**
     * @brief getNode
     * @param i
     * @return
     */
    const GraphNode* getNode(const size_t& i) const { return _nodes.at(i); }

    /**
     * @brief getFirstNode
     * @return
     */
    const GraphNode* getFirstNode() const { return _nodes.front(); }

    /**
     * @brief getLastNode
     * @return
     */
    const GraphNode* getLastNode() const { return _nodes.back(); }

    /**
     * @brief getNodes
     * @return
     */
    const std::deque< const GraphNode* >& getNodes() const { return _nodes; }

    /**
     * @brief getSampleIndices
     * @return
     * Returns the morphology sample indices of the nodes, in path order.
     */
    std::vector< int64_t > getSampleIndices() const;

    /**
     * @brief getLength
     * @return
     */
    double getLength() const { return _length; }

    /**
     * @brief setLength
     * @param length
     */
    void setLength(const double& length) { _length = length; }

    /**
     * @brief printPath
     * Prints the sample indices of the path and its length.
     */
    void printPath() const;

private:

    /**
     * @brief _nodes
     */
    std::deque< const GraphNode* > _nodes;

    /**
     * @brief _length
     */
    double _length;
};

/**
 * @brief GraphPaths
 */
typedef std::vector< GraphPath > GraphPaths;

}
