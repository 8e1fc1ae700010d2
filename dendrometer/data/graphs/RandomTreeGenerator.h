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
 * @brief The RandomTreeGenerator class
 * Generates synthetic morphology trees with reproducible topologies and weights. The nodes are
 * placed in space such that the Euclidean distance between a parent and its child matches the
 * weight of the edge between them (up to the float precision of the positions).
 */
class RandomTreeGenerator
{
public:

    /**
     * @brief generateRandomTree
     * Generates a random recursive tree, where every node attaches to an earlier node selected
     * uniformly. The root is the first node.
     * @param numberNodes
     * The number of nodes in the tree, at least 1.
     * @param minimumWeight
     * The minimum weight of an edge, non-negative.
     * @param maximumWeight
     * The maximum weight of an edge, at least minimumWeight.
     * @param seed
     * The seed of the random generator.
     * @return
     */
    static std::unique_ptr< DirectedWeightedGraph > generateRandomTree(
            const size_t& numberNodes,
            const double& minimumWeight,
            const double& maximumWeight,
            const uint32_t& seed);

    /**
     * @brief generateBalancedTree
     * Generates a complete tree where every non-tip node has the same number of children.
     * @param depth
     * The number of edges between the root and every tip.
     * @param branchingFactor
     * The number of children of every non-tip node, at least 1.
     * @param weight
     * The weight of every edge.
     * @return
     */
    static std::unique_ptr< DirectedWeightedGraph > generateBalancedTree(
            const size_t& depth,
            const size_t& branchingFactor,
            const double& weight);

    /**
     * @brief generateRandomSamples
     * Generates the samples of a random tree, the parents always precede their children.
     * @param numberNodes
     * @param minimumWeight
     * @param maximumWeight
     * @param seed
     * @return
     */
    static MorphologySamples generateRandomSamples(const size_t& numberNodes,
                                                   const double& minimumWeight,
                                                   const double& maximumWeight,
                                                   const uint32_t& seed);
};

}
