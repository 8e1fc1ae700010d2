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

#include "GraphDiameterAnalyzer.h"
#include "ShortestPathFinder.h"
#include <common/Common.h>

namespace Dendrometer
{

void GraphDiameterAnalyzer::_computeDistancesFromRoot(const DirectedWeightedGraph& graph,
                                                      const GraphNode* root,
                                                      std::vector< double >& distances,
                                                      ConstGraphNodes& parents)
{
    const size_t numberNodes = graph.getNumberNodes();
    distances.assign(numberNodes, 0.0);
    parents.assign(numberNodes, nullptr);

    std::vector< bool > visited(numberNodes, false);
    std::vector< const GraphNode* > stack;
    stack.push_back(root);
    visited[root->graphIndex] = true;
    size_t numberVisitedNodes = 1;

    while (!stack.empty())
    {
        const GraphNode* node = stack.back();
        stack.pop_back();

        for (const auto edge : node->outgoingEdges)
        {
            const GraphNode* child = edge->target;

            // In a tree, every node is reached only once from the root
            if (visited[child->graphIndex])
            {
                throw InvalidGraphError("The node [ " + std::to_string(child->index) +
                                        " ] is reached twice from the root, the graph has a "
                                        "cycle or a node with multiple parents");
            }

            visited[child->graphIndex] = true;
            numberVisitedNodes++;

            distances[child->graphIndex] = distances[node->graphIndex] + edge->weight;
            parents[child->graphIndex] = node;
            stack.push_back(child);
        }
    }

    if (numberVisitedNodes != numberNodes)
    {
        throw InvalidGraphError("[ " + std::to_string(numberNodes - numberVisitedNodes) +
                                " ] nodes are not reachable from the root, the graph is "
                                "disconnected");
    }
}

void GraphDiameterAnalyzer::_computeUndirectedDistances(const DirectedWeightedGraph& graph,
                                                        const GraphNode* source,
                                                        std::vector< double >& distances,
                                                        ConstGraphNodes& parents)
{
    const size_t numberNodes = graph.getNumberNodes();
    distances.assign(numberNodes, 0.0);
    parents.assign(numberNodes, nullptr);

    std::vector< bool > visited(numberNodes, false);
    std::vector< const GraphNode* > stack;
    stack.push_back(source);
    visited[source->graphIndex] = true;

    while (!stack.empty())
    {
        const GraphNode* node = stack.back();
        stack.pop_back();

        // Children first, then the parent
        for (const auto edge : node->outgoingEdges)
        {
            const GraphNode* neighbour = edge->target;
            if (visited[neighbour->graphIndex]) continue;

            visited[neighbour->graphIndex] = true;
            distances[neighbour->graphIndex] = distances[node->graphIndex] + edge->weight;
            parents[neighbour->graphIndex] = node;
            stack.push_back(neighbour);
        }

        for (const auto edge : node->incomingEdges)
        {
            const GraphNode* neighbour = edge->source;
            if (visited[neighbour->graphIndex]) continue;

            visited[neighbour->graphIndex] = true;
            distances[neighbour->graphIndex] = distances[node->graphIndex] + edge->weight;
            parents[neighbour->graphIndex] = node;
            stack.push_back(neighbour);
        }
    }
}

const GraphNode* GraphDiameterAnalyzer::_selectFarthestNode(const ConstGraphNodes& candidates,
                                                            const std::vector< double >& distances)
{
    // Replace only on strict improvement to keep the first of equally far candidates
    const GraphNode* farthestNode = nullptr;
    double maximumDistance = -1.0;
    for (const auto candidate : candidates)
    {
        const double distance = distances[candidate->graphIndex];
        if (distance > maximumDistance)
        {
            maximumDistance = distance;
            farthestNode = candidate;
        }
    }
    return farthestNode;
}

GraphPath GraphDiameterAnalyzer::_constructPath(const GraphNode* node,
                                                const ConstGraphNodes& parents,
                                                const double& length)
{
    GraphPath path;
    for (const GraphNode* current = node; current != nullptr;
         current = parents[current->graphIndex])
    {
        path.prependNode(current);
    }
    path.setLength(length);
    return path;
}

GraphPath GraphDiameterAnalyzer::computeDiameter(const DirectedWeightedGraph& graph,
                                                 const bool verbose)
{
    VERBOSE_LOG(LOG_STATUS("Computing Graph Diameter [Tree Traversal]"), verbose);
    TIMER_SET;

    const GraphNode* root = graph.getRoot();

    std::vector< double > distances;
    ConstGraphNodes parents;
    _computeDistancesFromRoot(graph, root, distances, parents);

    // A graph without tips has only its root
    const GraphNodes tips = graph.getTips();
    if (tips.empty())
        return _constructPath(root, parents, 0.0);

    const ConstGraphNodes candidates(tips.begin(), tips.end());
    const GraphNode* farthestTip = _selectFarthestNode(candidates, distances);
    GraphPath path = _constructPath(farthestTip, parents, distances[farthestTip->graphIndex]);

    VERBOSE_LOG(LOG_SUCCESS("Diameter [ %f ] across [ %zu ] nodes from [ %zu ] tips",
                            path.getLength(), path.size(), tips.size()), verbose);
    VERBOSE_LOG(LOG_STATS(GET_TIME_SECONDS), verbose);

    return path;
}

GraphPath GraphDiameterAnalyzer::computeDiameterGeneric(const DirectedWeightedGraph& graph,
                                                        const bool verbose)
{
    VERBOSE_LOG(LOG_STATUS("Computing Graph Diameter [Dijkstra]"), verbose);
    TIMER_SET;

    // Dijkstra accepts any graph, the rooted tree must be verified explicitly
    graph.verifyTree();
    const GraphNode* root = graph.getRoot();
    const GraphNodes tips = graph.getTips();
    const GraphNodes& nodes = graph.getNodes();

    // Generate the ShortestPathFinder only once for all the tips
    const ShortestPathFinder pathFinder(graph);

    GraphPath longestPath;
    longestPath.appendNode(root);
    double maximumLength = -1.0;

    PROGRESS_SET;
    VERBOSE_LOG(LOOP_STARTS("Searching Root-to-tip Paths"), verbose);
    for (size_t i = 0; i < tips.size(); ++i)
    {
        const GraphNode* tip = tips[i];

        double pathLength = 0.0;
        const PathIndices pathIndices = pathFinder.findPath(root->graphIndex, tip->graphIndex,
                                                            &pathLength);
        if (pathIndices.empty())
        {
            throw InvalidGraphError("The tip [ " + std::to_string(tip->index) +
                                    " ] cannot be reached from the root");
        }

        if (pathLength > maximumLength)
        {
            maximumLength = pathLength;

            longestPath = GraphPath();
            for (const auto& index : pathIndices)
                longestPath.appendNode(nodes[index]);
            longestPath.setLength(pathLength);
        }

        VERBOSE_LOG(LOOP_PROGRESS(PROGRESS, tips.size()), verbose);
        PROGRESS_UPDATE;
    }
    VERBOSE_LOG(LOOP_DONE, verbose);

    VERBOSE_LOG(LOG_SUCCESS("Diameter [ %f ] across [ %zu ] nodes from [ %zu ] tips",
                            longestPath.getLength(), longestPath.size(), tips.size()), verbose);
    VERBOSE_LOG(LOG_STATS(GET_TIME_SECONDS), verbose);

    return longestPath;
}

GraphPath GraphDiameterAnalyzer::computeUndirectedDiameter(const DirectedWeightedGraph& graph,
                                                           const bool verbose)
{
    VERBOSE_LOG(LOG_STATUS("Computing Undirected Graph Diameter"), verbose);
    TIMER_SET;

    graph.verifyTree();
    const GraphNode* root = graph.getRoot();

    // The end points are searched among the tips and the root
    const GraphNodes tips = graph.getTips();
    ConstGraphNodes candidates(tips.begin(), tips.end());
    if (root->outDegree() > 0)
        candidates.push_back(root);

    std::vector< double > distances;
    ConstGraphNodes parents;

    // The farthest candidate from any node is an end of a longest path
    _computeUndirectedDistances(graph, root, distances, parents);
    const GraphNode* firstEnd = _selectFarthestNode(candidates, distances);

    _computeUndirectedDistances(graph, firstEnd, distances, parents);
    const GraphNode* secondEnd = _selectFarthestNode(candidates, distances);

    // The path is constructed backwards from the second end to the first one
    GraphPath path = _constructPath(secondEnd, parents, distances[secondEnd->graphIndex]);

    VERBOSE_LOG(LOG_SUCCESS("Undirected diameter [ %f ] across [ %zu ] nodes",
                            path.getLength(), path.size()), verbose);
    VERBOSE_LOG(LOG_STATS(GET_TIME_SECONDS), verbose);

    return path;
}

GraphPath GraphDiameterAnalyzer::compute(const DirectedWeightedGraph& graph,
                                         const DiameterOptions& options)
{
    if (options.mode == DIAMETER_MODE::UNDIRECTED)
    {
        if (options.algorithm != DIAMETER_ALGORITHM::TREE_TRAVERSAL)
            throw std::invalid_argument("The undirected diameter is only computed with the "
                                        "tree traversal algorithm");
        return computeUndirectedDiameter(graph, options.verbose);
    }

    if (options.algorithm == DIAMETER_ALGORITHM::DIJKSTRA)
        return computeDiameterGeneric(graph, options.verbose);

    return computeDiameter(graph, options.verbose);
}

GraphPaths GraphDiameterAnalyzer::computeDiameters(
        const std::vector< const DirectedWeightedGraph* >& graphs,
        const DiameterOptions& options)
{
    const size_t numberGraphs = graphs.size();
    GraphPaths diameters(numberGraphs);
    std::vector< std::exception_ptr > errors(numberGraphs);

    // The per-graph logs would interleave between the threads
    DiameterOptions taskOptions = options;
    taskOptions.verbose = SILENT;

    TIMER_SET;
    PROGRESS_SET;
    VERBOSE_LOG(LOOP_STARTS("Computing Graph Diameters *"), options.verbose);
    OMP_PARALLEL_FOR
    for (size_t i = 0; i < numberGraphs; ++i)
    {
        try
        {
            if (graphs[i] == nullptr)
                throw InvalidGraphError("Graph [ " + std::to_string(i) + " ] is null");

            diameters[i] = compute(*graphs[i], taskOptions);
        }
        catch (...)
        {
            // Exceptions cannot leave a parallel region, they are raised after the loop
            errors[i] = std::current_exception();
        }

        VERBOSE_LOG(LOOP_PROGRESS(PROGRESS, numberGraphs), options.verbose);
        PROGRESS_UPDATE;
    }
    VERBOSE_LOG(LOOP_DONE, options.verbose);
    VERBOSE_LOG(LOG_STATS(GET_TIME_SECONDS), options.verbose);

    for (size_t i = 0; i < numberGraphs; ++i)
    {
        if (errors[i])
            std::rethrow_exception(errors[i]);
    }

    return diameters;
}

DIAMETER_ALGORITHM GraphDiameterAnalyzer::getAlgorithm(const std::string& name)
{
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast< char >(std::tolower(c)); });

    if (lower == "tree" || lower == "tree-traversal")
        return DIAMETER_ALGORITHM::TREE_TRAVERSAL;

    if (lower == "dijkstra" || lower == "generic")
        return DIAMETER_ALGORITHM::DIJKSTRA;

    throw std::invalid_argument("Unknown diameter algorithm [ " + name +
                                " ], use either 'tree' or 'dijkstra'");
}

std::string GraphDiameterAnalyzer::getAlgorithmName(const DIAMETER_ALGORITHM& algorithm)
{
    switch (algorithm)
    {
    case DIAMETER_ALGORITHM::TREE_TRAVERSAL: return "tree";
    case DIAMETER_ALGORITHM::DIJKSTRA: return "dijkstra";
    }
    return "tree";
}

}
