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

#include "DirectedWeightedGraph.h"
#include <common/Exceptions.h>

namespace Dendrometer
{

DirectedWeightedGraph::DirectedWeightedGraph()
{
    /// EMPTY CONSTRUCTOR
}

DirectedWeightedGraph::DirectedWeightedGraph(const MorphologySamples& samples,
                                             const bool assignDistancesToWeights)
{
    // The destructor is not called if the constructor throws
    try
    {
        _constructFromSamples(samples, assignDistancesToWeights);
    }
    catch (const InvalidGraphError&)
    {
        _clear();
        throw;
    }
}

DirectedWeightedGraph::~DirectedWeightedGraph()
{
    _clear();
}

void DirectedWeightedGraph::_clear()
{
    for (auto edge : _edges) { delete edge; }
    _edges.clear();
    _edges.shrink_to_fit();

    for (auto node : _nodes) { delete node; }
    _nodes.clear();
    _nodes.shrink_to_fit();
}

void DirectedWeightedGraph::_constructFromSamples(const MorphologySamples& samples,
                                                  const bool assignDistancesToWeights)
{
    // Map the indices of the samples to the nodes
    std::unordered_map< int64_t, GraphNode* > indexToNode;
    indexToNode.reserve(samples.size());
    _nodes.reserve(samples.size());

    for (const auto& sample : samples)
    {
        if (indexToNode.find(sample.index) != indexToNode.end())
        {
            throw InvalidGraphError("Duplicate sample index [ " +
                                    std::to_string(sample.index) + " ]");
        }

        GraphNode* node = addNode(sample.point, sample.index, sample.radius, sample.type);
        node->parentIndex = sample.parentIndex;
        indexToNode[sample.index] = node;
    }

    // Connect every sample to its parent
    for (const auto& sample : samples)
    {
        if (sample.isRoot()) continue;

        auto parent = indexToNode.find(sample.parentIndex);
        if (parent == indexToNode.end())
        {
            throw InvalidGraphError("The parent [ " + std::to_string(sample.parentIndex) +
                                    " ] of sample [ " + std::to_string(sample.index) +
                                    " ] does not exist");
        }

        GraphNode* child = indexToNode[sample.index];
        const double weight = assignDistancesToWeights ? parent->second->distance(child) : 1.0;
        addEdge(parent->second, child, weight);
    }
}

GraphNode* DirectedWeightedGraph::addNode(const Vector3f& point,
                                          const int64_t& index,
                                          const float& radius,
                                          const size_t& type)
{
    const size_t graphIndex = _nodes.size();
    const int64_t sampleIndex = (index < 0) ? static_cast< int64_t >(graphIndex) : index;

    GraphNode* node = new GraphNode(graphIndex, point, sampleIndex, radius, type);
    _nodes.push_back(node);
    return node;
}

bool DirectedWeightedGraph::containsNode(const GraphNode* node) const
{
    if (node == nullptr) return false;
    return node->graphIndex < _nodes.size() && _nodes[node->graphIndex] == node;
}

GraphEdge* DirectedWeightedGraph::addEdge(GraphNode* source, GraphNode* target,
                                          const double& weight)
{
    if (!containsNode(source) || !containsNode(target))
        throw InvalidGraphError("Cannot add an edge to a node that is not in the graph");

    if (source == target)
        throw InvalidGraphError("Self loops are not allowed, node [ " +
                                std::to_string(source->index) + " ]");

    if (getEdge(source, target) != nullptr)
        throw InvalidGraphError("The edge [ " + std::to_string(source->index) + " -> " +
                                std::to_string(target->index) + " ] already exists");

    if (!(weight >= 0.0))
        throw InvalidGraphError("Edge weights must be non-negative");

    GraphEdge* edge = new GraphEdge(source, target, weight);
    source->outgoingEdges.push_back(edge);
    target->incomingEdges.push_back(edge);
    _edges.push_back(edge);
    return edge;
}

bool DirectedWeightedGraph::removeEdge(GraphEdge* edge)
{
    auto iterator = std::find(_edges.begin(), _edges.end(), edge);
    if (iterator == _edges.end())
        return false;

    auto& outgoing = edge->source->outgoingEdges;
    outgoing.erase(std::remove(outgoing.begin(), outgoing.end(), edge), outgoing.end());

    auto& incoming = edge->target->incomingEdges;
    incoming.erase(std::remove(incoming.begin(), incoming.end(), edge), incoming.end());

    _edges.erase(iterator);
    delete edge;
    return true;
}

GraphEdge* DirectedWeightedGraph::getEdge(const GraphNode* source, const GraphNode* target) const
{
    for (auto edge : source->outgoingEdges)
    {
        if (edge->target == target)
            return edge;
    }
    return nullptr;
}

GraphNode* DirectedWeightedGraph::getParent(const GraphNode* node) const
{
    if (node->incomingEdges.empty())
        return nullptr;
    return node->incomingEdges.front()->source;
}

GraphNodes DirectedWeightedGraph::getChildren(const GraphNode* node) const
{
    GraphNodes children;
    children.reserve(node->outgoingEdges.size());
    for (const auto edge : node->outgoingEdges)
        children.push_back(edge->target);
    return children;
}

GraphNode* DirectedWeightedGraph::getRoot() const
{
    GraphNode* root = nullptr;
    size_t numberRoots = 0;
    for (const auto node : _nodes)
    {
        if (node->inDegree() == 0)
        {
            if (root == nullptr) root = node;
            numberRoots++;
        }
    }

    if (numberRoots == 0)
        throw InvalidGraphError("The graph has no root");

    if (numberRoots > 1)
        throw InvalidGraphError("The graph has [ " + std::to_string(numberRoots) +
                                " ] roots, i.e. multiple connected components");

    return root;
}

GraphNodes DirectedWeightedGraph::getTips() const
{
    GraphNodes tips;
    for (const auto node : _nodes)
    {
        if (node->outDegree() == 0)
            tips.push_back(node);
    }
    return tips;
}

GraphNodes DirectedWeightedGraph::getBranchPoints() const
{
    GraphNodes branchPoints;
    for (const auto node : _nodes)
    {
        if (node->outDegree() > 1)
            branchPoints.push_back(node);
    }
    return branchPoints;
}

double DirectedWeightedGraph::sumEdgeWeights() const
{
    double sum = 0.0;
    for (const auto edge : _edges)
        sum += edge->weight;
    return sum;
}

void DirectedWeightedGraph::assignEdgeWeightsEuclidean()
{
    for (auto edge : _edges)
        edge->weight = edge->source->distance(edge->target);
}

void DirectedWeightedGraph::scale(const float& xScale, const float& yScale, const float& zScale,
                                  const bool updateEdgeWeightsEuclidean)
{
    for (auto node : _nodes)
        node->point.scale(xScale, yScale, zScale);

    if (updateEdgeWeightsEuclidean)
        assignEdgeWeightsEuclidean();
}

double DirectedWeightedGraph::_getEdgeWeightBetween(const GraphNode* node1,
                                                    const GraphNode* node2) const
{
    const GraphEdge* edge = getEdge(node1, node2);
    if (edge == nullptr)
        edge = getEdge(node2, node1);
    return edge->weight;
}

GraphPath DirectedWeightedGraph::getShortestPath(const GraphNode* v1, const GraphNode* v2) const
{
    GraphPath path;
    if (!containsNode(v1) || !containsNode(v2) || v1 == v2)
        return path;

    // The ancestors of v1 including v1 itself, mapped to their position in the list
    ConstGraphNodes ancestors1;
    std::unordered_map< const GraphNode*, size_t > ancestors1Positions;
    const GraphNode* currentNode = v1;
    while (currentNode != nullptr)
    {
        if (ancestors1Positions.find(currentNode) != ancestors1Positions.end())
            throw InvalidGraphError("A cycle was found while traversing the ancestors of node [ " +
                                    std::to_string(v1->index) + " ]");

        ancestors1Positions[currentNode] = ancestors1.size();
        ancestors1.push_back(currentNode);
        currentNode = getParent(currentNode);
    }

    ConstGraphNodes pathNodes;
    auto v2Position = ancestors1Positions.find(v2);
    if (v2Position != ancestors1Positions.end())
    {
        // v2 is an ancestor of v1
        pathNodes.assign(ancestors1.begin(), ancestors1.begin() + v2Position->second + 1);
    }
    else
    {
        // Climb from v2 until the least common ancestor is found
        ConstGraphNodes ancestors2;
        currentNode = v2;
        ancestors2.push_back(currentNode);

        size_t commonAncestorPosition = ancestors1.size();
        while ((currentNode = getParent(currentNode)) != nullptr)
        {
            if (ancestors2.size() > _nodes.size())
                throw InvalidGraphError("A cycle was found while traversing the ancestors of "
                                        "node [ " + std::to_string(v2->index) + " ]");

            ancestors2.push_back(currentNode);
            auto position = ancestors1Positions.find(currentNode);
            if (position != ancestors1Positions.end())
            {
                commonAncestorPosition = position->second;
                break;
            }
        }

        // The two nodes are not connected
        if (commonAncestorPosition == ancestors1.size())
            return path;

        pathNodes.assign(ancestors1.begin(), ancestors1.begin() + commonAncestorPosition);
        pathNodes.insert(pathNodes.end(), ancestors2.rbegin(), ancestors2.rend());
    }

    double length = 0.0;
    for (size_t i = 0; i < pathNodes.size(); ++i)
    {
        if (i > 0) length += _getEdgeWeightBetween(pathNodes[i - 1], pathNodes[i]);
        path.appendNode(pathNodes[i]);
    }
    path.setLength(length);
    return path;
}

std::unique_ptr< DirectedWeightedGraph > DirectedWeightedGraph::getSimplifiedGraph() const
{
    std::unique_ptr< DirectedWeightedGraph > simplifiedGraph =
            std::make_unique< DirectedWeightedGraph >();

    // The relevant nodes are the root, the branch points and the tips, without duplicates
    const GraphNode* root = getRoot();
    ConstGraphNodes relevantNodes;
    relevantNodes.push_back(root);
    for (const auto node : _nodes)
    {
        if (node != root && node->outDegree() != 1)
            relevantNodes.push_back(node);
    }

    // Copy the relevant nodes into the new graph
    std::unordered_map< const GraphNode*, GraphNode* > nodesMapper;
    for (const auto node : relevantNodes)
    {
        GraphNode* copy = simplifiedGraph->addNode(node->point, node->index,
                                                   node->radius, node->type);
        copy->parentIndex = node->parentIndex;
        nodesMapper[node] = copy;
    }

    for (const auto node : relevantNodes)
    {
        // Climb to the first ancestor that is either the root or a branch point
        const GraphNode* ancestor = nullptr;
        const GraphNode* currentNode = node;
        double chainWeight = 0.0;
        size_t steps = 0;
        while (!currentNode->incomingEdges.empty())
        {
            if (++steps > _nodes.size())
                throw InvalidGraphError("A cycle was found while simplifying the graph");

            const GraphEdge* edge = currentNode->incomingEdges.front();
            chainWeight += edge->weight;

            const GraphNode* parent = edge->source;
            if (parent->inDegree() == 0 || parent->outDegree() > 1)
            {
                ancestor = parent;
                break;
            }
            currentNode = parent;
        }

        if (ancestor != nullptr && chainWeight > 0.0)
            simplifiedGraph->addEdge(nodesMapper[ancestor], nodesMapper[node], chainWeight);
    }

    // Dropping zero-weight chains may detach some nodes, they can then not be renumbered
    size_t numberRoots = 0;
    for (const auto node : simplifiedGraph->getNodes())
    {
        if (node->inDegree() == 0) numberRoots++;
    }
    if (numberRoots == 1)
        simplifiedGraph->updateNodeIndices();

    return simplifiedGraph;
}

void DirectedWeightedGraph::_reverseEdge(GraphEdge* edge)
{
    auto& outgoing = edge->source->outgoingEdges;
    outgoing.erase(std::remove(outgoing.begin(), outgoing.end(), edge), outgoing.end());

    auto& incoming = edge->target->incomingEdges;
    incoming.erase(std::remove(incoming.begin(), incoming.end(), edge), incoming.end());

    std::swap(edge->source, edge->target);
    edge->source->outgoingEdges.push_back(edge);
    edge->target->incomingEdges.push_back(edge);
}

void DirectedWeightedGraph::setRoot(GraphNode* newRoot)
{
    if (!containsNode(newRoot))
        throw InvalidGraphError("The new root is not contained in the graph");

    std::vector< bool > visited(_nodes.size(), false);
    std::vector< GraphNode* > stack;
    stack.push_back(newRoot);
    visited[newRoot->graphIndex] = true;

    while (!stack.empty())
    {
        GraphNode* node = stack.back();
        stack.pop_back();

        // Copy the incident edges, the lists are edited while reversing the edges
        GraphEdges incidentEdges = node->incomingEdges;
        incidentEdges.insert(incidentEdges.end(),
                             node->outgoingEdges.begin(), node->outgoingEdges.end());

        for (auto edge : incidentEdges)
        {
            GraphNode* neighbour = (edge->source == node) ? edge->target : edge->source;
            if (visited[neighbour->graphIndex]) continue;

            // The edge must point away from the new root
            if (edge->target == node)
                _reverseEdge(edge);

            visited[neighbour->graphIndex] = true;
            stack.push_back(neighbour);
        }
    }
}

GraphNodes DirectedWeightedGraph::getDepthFirstOrder(const GraphNode* start) const
{
    GraphNodes order;
    if (!containsNode(start))
        return order;

    std::vector< bool > visited(_nodes.size(), false);
    std::vector< GraphNode* > stack;
    stack.push_back(_nodes[start->graphIndex]);

    while (!stack.empty())
    {
        GraphNode* node = stack.back();
        stack.pop_back();

        if (visited[node->graphIndex]) continue;
        visited[node->graphIndex] = true;
        order.push_back(node);

        // Push the children in reverse to visit them in insertion order
        for (auto edge = node->outgoingEdges.rbegin(); edge != node->outgoingEdges.rend(); ++edge)
        {
            if (!visited[(*edge)->target->graphIndex])
                stack.push_back((*edge)->target);
        }
    }

    return order;
}

void DirectedWeightedGraph::updateNodeIndices()
{
    const GraphNodes order = getDepthFirstOrder(getRoot());

    int64_t currentIndex = 1;
    for (auto node : order)
    {
        node->index = currentIndex++;

        // The parent precedes its children in pre-order, so its index is already updated
        const GraphNode* parent = getParent(node);
        node->parentIndex = (parent == nullptr) ? ROOT_PARENT_INDEX : parent->index;
    }
}

void DirectedWeightedGraph::verifyTree() const
{
    const GraphNode* root = getRoot();

    for (const auto node : _nodes)
    {
        if (node->inDegree() > 1)
        {
            throw InvalidGraphError("The node [ " + std::to_string(node->index) + " ] has [ " +
                                    std::to_string(node->inDegree()) + " ] parents");
        }
    }

    // With a single root and a single parent per node, unreachable nodes can only be in cycles
    const size_t numberReachableNodes = getDepthFirstOrder(root).size();
    if (numberReachableNodes != _nodes.size())
    {
        throw InvalidGraphError("[ " + std::to_string(_nodes.size() - numberReachableNodes) +
                                " ] nodes are not reachable from the root, the graph has a cycle "
                                "or a disconnected component");
    }
}

}
