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

#include "ShortestPathFinder.h"
#include <queue>

namespace Dendrometer
{

ShortestPathFinder::ShortestPathFinder(const DirectedWeightedGraph& graph)
    : _numberNodes(graph.getNumberNodes())
{
    _adjacencyList.resize(_numberNodes);
    for (const auto edge : graph.getEdges())
    {
        _adjacencyList[edge->source->graphIndex].push_back(
                    std::make_pair(edge->target->graphIndex, edge->weight));
    }
}

void ShortestPathFinder::_verifyIndex(const size_t& index) const
{
    if (index >= _numberNodes)
        throw std::out_of_range("The node index [ " + std::to_string(index) +
                                " ] is out of range [ 0, " + std::to_string(_numberNodes) + " )");
}

void ShortestPathFinder::_search(const size_t& source,
                                 const size_t& target,
                                 std::vector< double >& distances,
                                 std::vector< size_t >& predecessors) const
{
    typedef std::pair< double, size_t > QueueEntry;

    distances.assign(_numberNodes, std::numeric_limits< double >::infinity());
    predecessors.assign(_numberNodes, _numberNodes);

    std::priority_queue< QueueEntry, std::vector< QueueEntry >, std::greater< QueueEntry > > queue;
    distances[source] = 0.0;
    queue.push(QueueEntry(0.0, source));

    while (!queue.empty())
    {
        const QueueEntry entry = queue.top();
        queue.pop();

        const double distance = entry.first;
        const size_t node = entry.second;

        // Stale entry, the node was already settled with a shorter distance
        if (distance > distances[node]) continue;

        if (node == target) return;

        for (const auto& neighbour : _adjacencyList[node])
        {
            const double candidate = distance + neighbour.second;
            if (candidate < distances[neighbour.first])
            {
                distances[neighbour.first] = candidate;
                predecessors[neighbour.first] = node;
                queue.push(QueueEntry(candidate, neighbour.first));
            }
        }
    }
}

PathIndices ShortestPathFinder::findPath(const size_t& source,
                                         const size_t& target,
                                         double* pathLength) const
{
    _verifyIndex(source);
    _verifyIndex(target);

    std::vector< double > distances;
    std::vector< size_t > predecessors;
    _search(source, target, distances, predecessors);

    if (pathLength != nullptr)
        *pathLength = distances[target];

    PathIndices path;
    if (distances[target] == std::numeric_limits< double >::infinity())
        return path;

    // Walk back from the target
    for (size_t node = target; node != _numberNodes; node = predecessors[node])
        path.push_back(node);
    std::reverse(path.begin(), path.end());

    return path;
}

std::vector< double > ShortestPathFinder::findDistances(const size_t& source) const
{
    _verifyIndex(source);

    std::vector< double > distances;
    std::vector< size_t > predecessors;
    _search(source, _numberNodes, distances, predecessors);
    return distances;
}

}
