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
#include <data/graphs/GraphEdge.h>
#include <data/graphs/GraphPath.h>
#include <data/morphologies/MorphologySample.h>

namespace Dendrometer
{

/**
 * @brief The DirectedWeightedGraph class
 * A directed weighted graph that represents a traced morphology. The graph is expected to be a
 * rooted tree, where the root (typically the soma) is the only node without a parent, but this
 * invariant is only verified on demand (verifyTree) or by the algorithms that rely on it, so
 * invalid inputs can be constructed and reported.
 *
 * The graph owns its nodes and edges. The nodes are kept in insertion order, which defines the
 * order in which the tips and the branch points are enumerated.
 */
class DirectedWeightedGraph
{
public:

    /**
     * @brief DirectedWeightedGraph
     * Constructs an empty graph.
     */
    DirectedWeightedGraph();

    /**
     * @brief DirectedWeightedGraph
     * Constructs a graph from a list of morphology samples. Every sample becomes a node and
     * every sample with a parent is connected to it with an edge from the parent to the child.
     * @param samples
     * A list of samples with unique indices.
     * @param assignDistancesToWeights
     * If set, the Euclidean distance between the parent and the child is used as the weight of
     * the edge, otherwise the weight is 1.0.
     */
    DirectedWeightedGraph(const MorphologySamples& samples,
                          const bool assignDistancesToWeights = true);

    ~DirectedWeightedGraph();

    DirectedWeightedGraph(const DirectedWeightedGraph&) = delete;
    DirectedWeightedGraph& operator=(const DirectedWeightedGraph&) = delete;

public:

    /**
     * @brief addNode
     * @param point
     * @param index
     * The index of the morphology sample, if -1 the graph index of the node is used.
     * @param radius
     * @param type
     * @return
     * A pointer to the new node, owned by the graph.
     */
    GraphNode* addNode(const Vector3f& point,
                       const int64_t& index = -1,
                       const float& radius = 0.f,
                       const size_t& type = 0);

    /**
     * @brief addEdge
     * Adds a directed edge from the source to the target node. Cycles are not checked here.
     * @param source
     * @param target
     * @param weight
     * @return
     * A pointer to the new edge, owned by the graph.
     * @throws InvalidGraphError if any of the nodes does not belong to the graph, for self
     * loops, duplicate edges and negative weights.
     */
    GraphEdge* addEdge(GraphNode* source, GraphNode* target, const double& weight = 1.0);

    /**
     * @brief removeEdge
     * @param edge
     * @return
     * True if the edge was found and removed.
     */
    bool removeEdge(GraphEdge* edge);

    /**
     * @brief getEdge
     * @param source
     * @param target
     * @return
     * The edge from source to target, or nullptr if the two nodes are not connected.
     */
    GraphEdge* getEdge(const GraphNode* source, const GraphNode* target) const;

    /**
     * @brief containsNode
     * @param node
     * @return
     */
    bool containsNode(const GraphNode* node) const;

    const GraphNodes& getNodes() const { return _nodes; }
    const GraphEdges& getEdges() const { return _edges; }
    size_t getNumberNodes() const { return _nodes.size(); }
    size_t getNumberEdges() const { return _edges.size(); }

    size_t inDegreeOf(const GraphNode* node) const { return node->inDegree(); }
    size_t outDegreeOf(const GraphNode* node) const { return node->outDegree(); }

    /**
     * @brief getParent
     * @param node
     * @return
     * The source of the first incoming edge of the node, or nullptr for a root.
     */
    GraphNode* getParent(const GraphNode* node) const;

    /**
     * @brief getChildren
     * @param node
     * @return
     */
    GraphNodes getChildren(const GraphNode* node) const;

    /**
     * @brief getRoot
     * @return
     * The only node with in-degree 0.
     * @throws InvalidGraphError if the graph has no root or more than one root.
     */
    GraphNode* getRoot() const;

    /**
     * @brief getTips
     * @return
     * The nodes with out-degree 0 in insertion order.
     */
    GraphNodes getTips() const;

    /**
     * @brief getBranchPoints
     * @return
     * The nodes with out-degree larger than 1 in insertion order.
     */
    GraphNodes getBranchPoints() const;

    /**
     * @brief sumEdgeWeights
     * @return
     * The total cable length when the weights are Euclidean distances.
     */
    double sumEdgeWeights() const;

    /**
     * @brief assignEdgeWeightsEuclidean
     * Sets the weight of every edge to the Euclidean distance between its two nodes.
     */
    void assignEdgeWeightsEuclidean();

    /**
     * @brief scale
     * Scales the positions of all the nodes.
     * @param xScale
     * @param yScale
     * @param zScale
     * @param updateEdgeWeightsEuclidean
     * If set, the weights are re-assigned from the scaled inter-node distances.
     */
    void scale(const float& xScale, const float& yScale, const float& zScale,
               const bool updateEdgeWeightsEuclidean);

    /**
     * @brief getShortestPath
     * Finds the path between two nodes using their least common ancestor, the direction of the
     * edges is ignored. This is linear in the depth of the nodes and requires no preprocessing.
     * @param v1
     * The first node of the path.
     * @param v2
     * The last node of the path.
     * @return
     * The path from v1 to v2, or an empty path if any of the two nodes is not in the graph,
     * if both are the same node or if they are not connected.
     */
    GraphPath getShortestPath(const GraphNode* v1, const GraphNode* v2) const;

    /**
     * @brief getSimplifiedGraph
     * Constructs a new graph that only contains the root, the branch points and the tips of
     * this one, where every chain of intermediate nodes is collapsed into a single edge whose
     * weight is the accumulated weight of the chain. Chains of zero weight are dropped.
     * @return
     */
    std::unique_ptr< DirectedWeightedGraph > getSimplifiedGraph() const;

    /**
     * @brief setRoot
     * Reorients the edges of the graph, keeping their weights, such that all the other nodes
     * descend from the given node.
     * @param newRoot
     * @throws InvalidGraphError if the node does not belong to the graph.
     */
    void setRoot(GraphNode* newRoot);

    /**
     * @brief updateNodeIndices
     * Renumbers the sample indices of the nodes in depth-first order starting from the root,
     * which gets the index 1, and updates the parent index of every node.
     */
    void updateNodeIndices();

    /**
     * @brief getDepthFirstOrder
     * @param start
     * @return
     * The nodes reachable from the start node following the edges, in pre-order.
     */
    GraphNodes getDepthFirstOrder(const GraphNode* start) const;

    /**
     * @brief verifyTree
     * Verifies that the graph is a rooted tree.
     * @throws InvalidGraphError describing the first violation found.
     */
    void verifyTree() const;

private:

    /**
     * @brief _constructFromSamples
     * @param samples
     * @param assignDistancesToWeights
     */
    void _constructFromSamples(const MorphologySamples& samples,
                               const bool assignDistancesToWeights);

    /**
     * @brief _getEdgeWeightBetween
     * @param node1
     * @param node2
     * @return
     * The weight of the edge connecting the two nodes in any direction.
     */
    double _getEdgeWeightBetween(const GraphNode* node1, const GraphNode* node2) const;

    /**
     * @brief _reverseEdge
     * Swaps the source and the target of the edge.
     * @param edge
     */
    void _reverseEdge(GraphEdge* edge);

    /**
     * @brief _clear
     * Releases all the nodes and edges.
     */
    void _clear();

private:

    /**
     * @brief _nodes
     */
    GraphNodes _nodes;

    /**
     * @brief _edges
     */
    GraphEdges _edges;
};

}
