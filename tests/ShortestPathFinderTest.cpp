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

#include <gtest/gtest.h>
#include <algorithms/graphs/ShortestPathFinder.h>

using namespace Dendrometer;

namespace
{

// A directed graph with a shortcut that is longer than the detour
//     0 -> 1 (1), 0 -> 2 (4), 1 -> 2 (1), 2 -> 3 (1), 1 -> 3 (5)
void createGraph(DirectedWeightedGraph& graph)
{
    GraphNodes nodes;
    for (size_t i = 0; i < 4; ++i)
        nodes.push_back(graph.addNode(Vector3f(static_cast< float >(i), 0.f, 0.f)));

    graph.addEdge(nodes[0], nodes[1], 1.0);
    graph.addEdge(nodes[0], nodes[2], 4.0);
    graph.addEdge(nodes[1], nodes[2], 1.0);
    graph.addEdge(nodes[2], nodes[3], 1.0);
    graph.addEdge(nodes[1], nodes[3], 5.0);
}

}

TEST(ShortestPathFinderTest, FindPath)
{
    DirectedWeightedGraph graph;
    createGraph(graph);
    const ShortestPathFinder pathFinder(graph);

    double length = 0.0;
    const PathIndices path = pathFinder.findPath(0, 3, &length);

    EXPECT_EQ(path, PathIndices({ 0, 1, 2, 3 }));
    EXPECT_DOUBLE_EQ(length, 3.0);
    EXPECT_EQ(pathFinder.getNumberNodes(), 4u);
}

TEST(ShortestPathFinderTest, FindPath_SameNode)
{
    DirectedWeightedGraph graph;
    createGraph(graph);
    const ShortestPathFinder pathFinder(graph);

    double length = -1.0;
    EXPECT_EQ(pathFinder.findPath(2, 2, &length), PathIndices({ 2 }));
    EXPECT_DOUBLE_EQ(length, 0.0);
}

TEST(ShortestPathFinderTest, FindPath_Unreachable)
{
    DirectedWeightedGraph graph;
    createGraph(graph);
    const ShortestPathFinder pathFinder(graph);

    // The edges are directed
    double length = 0.0;
    EXPECT_TRUE(pathFinder.findPath(3, 0, &length).empty());
    EXPECT_EQ(length, std::numeric_limits< double >::infinity());
}

TEST(ShortestPathFinderTest, FindPath_OutOfRange)
{
    DirectedWeightedGraph graph;
    createGraph(graph);
    const ShortestPathFinder pathFinder(graph);

    EXPECT_THROW(pathFinder.findPath(0, 4), std::out_of_range);
    EXPECT_THROW(pathFinder.findPath(7, 0), std::out_of_range);
    EXPECT_THROW(pathFinder.findDistances(4), std::out_of_range);
}

TEST(ShortestPathFinderTest, FindDistances)
{
    DirectedWeightedGraph graph;
    createGraph(graph);
    const ShortestPathFinder pathFinder(graph);

    const std::vector< double > fromFirst = pathFinder.findDistances(0);
    EXPECT_EQ(fromFirst, std::vector< double >({ 0.0, 1.0, 2.0, 3.0 }));

    const std::vector< double > fromLast = pathFinder.findDistances(3);
    EXPECT_EQ(fromLast[0], std::numeric_limits< double >::infinity());
    EXPECT_EQ(fromLast[3], 0.0);
}
