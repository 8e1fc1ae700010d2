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
#include <data/graphs/GraphPath.h>

namespace Dendrometer
{

/**
 * @brief The DIAMETER_ALGORITHM enum
 */
enum class DIAMETER_ALGORITHM
{
    // A single depth-first traversal from the root, linear in the size of the tree
    TREE_TRAVERSAL,

    // A Dijkstra search from the root to every tip
    DIJKSTRA
};

/**
 * @brief The DIAMETER_MODE enum
 */
enum class DIAMETER_MODE
{
    // The longest path between the root and a tip
    DIRECTED,

    // The longest path between any two nodes of the tips and the root, ignoring the directions
    UNDIRECTED
};

/**
 * @brief The DiameterOptions struct
 */
struct DiameterOptions
{
    DIAMETER_ALGORITHM algorithm = DIAMETER_ALGORITHM::TREE_TRAVERSAL;
    DIAMETER_MODE mode = DIAMETER_MODE::DIRECTED;
    bool verbose = SILENT;
};

/**
 * @brief The GraphDiameterAnalyzer class
 * Computes the diameter of a morphology graph, i.e. its longest shortest path. For a rooted
 * tree, this is the longest path between the root and any of the tips.
 *
 * All the operations are read-only over the graph. When several tips are equally far from the
 * root, the first one in the tip enumeration order of the graph is selected.
 */
class GraphDiameterAnalyzer
{
public:

    /**
     * @brief computeDiameter
     * Computes the directed diameter with a single traversal from the root, O(V + E).
     * @param graph
     * A rooted tree.
     * @param verbose
     * @return
     * The path from the root to the farthest tip, with its length. A graph made of a single
     * node returns that node with a zero length.
     * @throws InvalidGraphError if the graph has no root, several roots, a node with several
     * parents, a cycle or a disconnected component.
     */
    static GraphPath computeDiameter(const DirectedWeightedGraph& graph,
                                     const bool verbose = SILENT);

    /**
     * @brief computeDiameterGeneric
     * Computes the directed diameter with a Dijkstra search from the root to every tip. This is
     * O(T (V + E) log V) for T tips, and only used to validate computeDiameter.
     * @param graph
     * @param verbose
     * @return
     * @throws InvalidGraphError if the root is not unique or a tip cannot be reached.
     */
    static GraphPath computeDiameterGeneric(const DirectedWeightedGraph& graph,
                                            const bool verbose = SILENT);

    /**
     * @brief computeUndirectedDiameter
     * Computes the longest path between any two nodes of the tips and the root, ignoring the
     * directions of the edges, with two farthest-node sweeps.
     * @param graph
     * @param verbose
     * @return
     * The path from one end to the other.
     * @throws InvalidGraphError if the graph is not a rooted tree.
     */
    static GraphPath computeUndirectedDiameter(const DirectedWeightedGraph& graph,
                                               const bool verbose = SILENT);

    /**
     * @brief compute
     * Computes the diameter selected by the options.
     * @param graph
     * @param options
     * @return
     * @throws std::invalid_argument for the undirected Dijkstra combination.
     */
    static GraphPath compute(const DirectedWeightedGraph& graph, const DiameterOptions& options);

    /**
     * @brief computeDiameters
     * Computes the diameters of a list of independent graphs, in parallel if OpenMP is enabled.
     * @param graphs
     * @param options
     * @return
     * The diameters in the order of the input graphs.
     * @throws The error of the first failing graph in the input order, after all the graphs are
     * processed.
     */
    static GraphPaths computeDiameters(const std::vector< const DirectedWeightedGraph* >& graphs,
                                       const DiameterOptions& options);

    /**
     * @brief getAlgorithm
     * @param name
     * "tree" or "dijkstra", case insensitive.
     * @return
     */
    static DIAMETER_ALGORITHM getAlgorithm(const std::string& name);

    /**
     * @brief getAlgorithmName
     * @param algorithm
     * @return
     */
    static std::string getAlgorithmName(const DIAMETER_ALGORITHM& algorithm);

private:

    /**
     * @brief _computeDistancesFromRoot
     * Accumulates the edge weights from the root to every node along the directed edges, and
     * verifies that every node is reached exactly once.
     * @param graph
     * @param root
     * @param distances
     * Indexed by the graph index of the nodes.
     * @param parents
     * The node each node was reached from, nullptr for the root.
     */
    static void _computeDistancesFromRoot(const DirectedWeightedGraph& graph,
                                          const GraphNode* root,
                                          std::vector< double >& distances,
                                          ConstGraphNodes& parents);

    /**
     * @brief _computeUndirectedDistances
     * Accumulates the edge weights from a node to every other node ignoring the directions.
     * @param graph
     * A valid tree.
     * @param source
     * @param distances
     * @param parents
     */
    static void _computeUndirectedDistances(const DirectedWeightedGraph& graph,
                                            const GraphNode* source,
                                            std::vector< double >& distances,
                                            ConstGraphNodes& parents);

    /**
     * @brief _selectFarthestNode
     * @param candidates
     * @param distances
     * @return
     * The first candidate with the largest distance.
     */
    static const GraphNode* _selectFarthestNode(const ConstGraphNodes& candidates,
                                                const std::vector< double >& distances);

    /**
     * @brief _constructPath
     * Constructs the path from the source of a traversal to the given node.
     * @param node
     * @param parents
     * @param length
     * @return
     */
    static GraphPath _constructPath(const GraphNode* node,
                                    const ConstGraphNodes& parents,
                                    const double& length);
};

}
