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

#include <data/graphs/DirectedWeightedGraph.h>

namespace Dendrometer
{

/**
 * @brief PathIndices
 * The graph indices of the nodes along a path.
 */
typedef std::vector< size_t > PathIndices;

/**
 * @brief The ShortestPathFinder class
 * A generic single-source shortest path search (Dijkstra with a binary heap) over the directed
 * edges of a graph. It makes no assumption on the topology of the graph, and is therefore used
 * as a reference to validate the tree-specific algorithms.
 *
 * The adjacency data is built once, and all the queries are const, so a single finder can be
 * shared by several threads.
 */
class ShortestPathFinder
{
public:

    /**
     * @brief ShortestPathFinder
     * @param graph
     * The graph to search, only read during the construction.
     */
    explicit ShortestPathFinder(const DirectedWeightedGraph& graph);

    /**
     * @brief findPath
     * Finds the shortest path between two nodes following the direction of the edges.
     * @param source
     * The graph index of the first node.
     * @param target
     * The graph index of the last node.
     * @param pathLength
     * If given, receives the length of the path, or infinity if there is no path.
     * @return
     * The graph indices of the nodes from source to target, or an empty list if the target
     * cannot be reached.
     */
    PathIndices findPath(const size_t& source,
                         const size_t& target,
                         double* pathLength = nullptr) const;

    /**
     * @brief findDistances
     * @param source
     * @return
     * The shortest distance from the source to every node, infinity for unreachable nodes.
     */
    std::vector< double > findDistances(const size_t& source) const;

    /**
     * @brief getNumberNodes
     * @return
     */
    size_t getNumberNodes() const { return _numberNodes; }

private:

    /**
     * @brief _search
     * Runs the search from the source, stopping as soon as the target is settled.
     * @param source
     * @param target
     * Pass _numberNodes to settle every reachable node.
     * @param distances
     * @param predecessors
     */
    void _search(const size_t& source,
                 const size_t& target,
                 std::vector< double >& distances,
                 std::vector< size_t >& predecessors) const;

    /**
     * @brief _verifyIndex
     * @param index
     */
    void _verifyIndex(const size_t& index) const;

private:

    /**
     * @brief _numberNodes
     */
    size_t _numberNodes;

    /**
     * @brief _adjacencyList
     * For every node, the list of (target, weight) pairs of its outgoing edges.
     */
    std::vector< std::vector< std::pair< size_t, double > > > _adjacencyList;
};

}
