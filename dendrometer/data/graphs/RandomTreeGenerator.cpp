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

#include "RandomTreeGenerator.h"
#include <random>

namespace Dendrometer
{

namespace
{

void verifyParameters(const size_t& numberNodes,
                      const double& minimumWeight,
                      const double& maximumWeight)
{
    if (numberNodes == 0)
        throw std::invalid_argument("A tree requires at least one node");

    if (minimumWeight < 0.0 || maximumWeight < minimumWeight)
        throw std::invalid_argument("The weights must be within a valid non-negative range");
}

Vector3f generateRandomDirection(std::mt19937& generator)
{
    std::normal_distribution< float > distribution(0.f, 1.f);
    const Vector3f direction(distribution(generator),
                             distribution(generator),
                             distribution(generator));

    // Degenerate draw
    if (direction.abs() == 0.f)
        return Vector3f(1.f, 0.f, 0.f);

    return direction.normalized();
}

}

MorphologySamples RandomTreeGenerator::generateRandomSamples(const size_t& numberNodes,
                                                             const double& minimumWeight,
                                                             const double& maximumWeight,
                                                             const uint32_t& seed)
{
    verifyParameters(numberNodes, minimumWeight, maximumWeight);

    std::mt19937 generator(seed);
    std::uniform_real_distribution< double > weightDistribution(minimumWeight, maximumWeight);

    MorphologySamples samples;
    samples.reserve(numberNodes);
    samples.push_back(MorphologySample(1, ROOT_PARENT_INDEX, Vector3f::ZERO, 1.f, 1));

    for (size_t i = 1; i < numberNodes; ++i)
    {
        std::uniform_int_distribution< size_t > parentDistribution(0, i - 1);
        const MorphologySample& parent = samples[parentDistribution(generator)];

        const double weight = weightDistribution(generator);
        const Vector3f direction = generateRandomDirection(generator);
        const Vector3f point = parent.point + direction * static_cast< float >(weight);

        samples.push_back(MorphologySample(static_cast< int64_t >(i + 1), parent.index,
                                           point, 0.5f, 3));
    }

    return samples;
}

std::unique_ptr< DirectedWeightedGraph > RandomTreeGenerator::generateRandomTree(
        const size_t& numberNodes,
        const double& minimumWeight,
        const double& maximumWeight,
        const uint32_t& seed)
{
    verifyParameters(numberNodes, minimumWeight, maximumWeight);

    std::mt19937 generator(seed);
    std::uniform_real_distribution< double > weightDistribution(minimumWeight, maximumWeight);

    std::unique_ptr< DirectedWeightedGraph > graph = std::make_unique< DirectedWeightedGraph >();
    GraphNodes nodes;
    nodes.reserve(numberNodes);
    nodes.push_back(graph->addNode(Vector3f::ZERO, 1, 1.f, 1));

    for (size_t i = 1; i < numberNodes; ++i)
    {
        std::uniform_int_distribution< size_t > parentDistribution(0, i - 1);
        GraphNode* parent = nodes[parentDistribution(generator)];

        // The exact weight is kept on the edge, the position only approximates it
        const double weight = weightDistribution(generator);
        const Vector3f direction = generateRandomDirection(generator);
        const Vector3f point = parent->point + direction * static_cast< float >(weight);

        GraphNode* child = graph->addNode(point, static_cast< int64_t >(i + 1), 0.5f, 3);
        child->parentIndex = parent->index;
        graph->addEdge(parent, child, weight);
        nodes.push_back(child);
    }

    return graph;
}

std::unique_ptr< DirectedWeightedGraph > RandomTreeGenerator::generateBalancedTree(
        const size_t& depth,
        const size_t& branchingFactor,
        const double& weight)
{
    if (branchingFactor == 0)
        throw std::invalid_argument("The branching factor must be at least 1");

    if (weight < 0.0)
        throw std::invalid_argument("The weight must be non-negative");

    std::unique_ptr< DirectedWeightedGraph > graph = std::make_unique< DirectedWeightedGraph >();
    GraphNodes currentLevel;
    currentLevel.push_back(graph->addNode(Vector3f::ZERO, 1, 1.f, 1));

    const float angleIncrement = static_cast< float >(2.0 * M_PI / branchingFactor);
    for (size_t level = 0; level < depth; ++level)
    {
        GraphNodes nextLevel;
        nextLevel.reserve(currentLevel.size() * branchingFactor);

        for (auto parent : currentLevel)
        {
            for (size_t i = 0; i < branchingFactor; ++i)
            {
                // Spread the children on a circle below their parent
                const float angle = i * angleIncrement;
                const Vector3f direction(std::cos(angle), std::sin(angle), 1.f);
                const Vector3f point = parent->point +
                        direction.normalized() * static_cast< float >(weight);

                GraphNode* child = graph->addNode(point, -1, 0.5f, 3);
                child->index = static_cast< int64_t >(child->graphIndex + 1);
                child->parentIndex = parent->index;
                graph->addEdge(parent, child, weight);
                nextLevel.push_back(child);
            }
        }
        currentLevel.swap(nextLevel);
    }

    return graph;
}

}
