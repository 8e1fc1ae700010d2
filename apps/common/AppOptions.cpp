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

#include "AppOptions.h"
#include <algorithms/graphs/GraphDiameterAnalyzer.h>
#include <filesystem>

namespace Dendrometer
{

void AppOptions::verifyGraphGenerationArguments()
{
    if (numberGraphs < 1)
    {
        LOG_ERROR("The number of graphs [ %" PRId64 " ] must be at least 1!", numberGraphs);
    }

    if (isBalanced())
    {
        if (branchingFactor < 1)
        {
            LOG_ERROR("The branching factor [ %" PRId64 " ] must be at least 1!", branchingFactor);
        }

        if (!(minimumWeight > 0.f))
        {
            LOG_ERROR("The weight of the balanced tree [ %f ] must be positive!", minimumWeight);
        }
        return;
    }

    if (numberNodes < 1)
    {
        LOG_ERROR("The number of nodes [ %" PRId64 " ] must be at least 1!", numberNodes);
    }

    if (minimumWeight < 0.f || maximumWeight < minimumWeight)
    {
        LOG_ERROR("Invalid weight range [ %f, %f ]!", minimumWeight, maximumWeight);
    }

    if (seed < 0 || seed > static_cast< int64_t >(std::numeric_limits< uint32_t >::max()))
    {
        LOG_ERROR("The seed [ %" PRId64 " ] must be a 32-bit unsigned integer!", seed);
    }
}

void AppOptions::verifyAnalysisArguments()
{
    DIAMETER_ALGORITHM selected = DIAMETER_ALGORITHM::TREE_TRAVERSAL;
    try
    {
        selected = GraphDiameterAnalyzer::getAlgorithm(algorithm);
    }
    catch (const std::invalid_argument&)
    {
        LOG_ERROR("Unknown diameter algorithm [ %s ], use [ tree ] or [ dijkstra ]!",
                  algorithm.c_str());
    }

    if (undirected && selected == DIAMETER_ALGORITHM::DIJKSTRA)
    {
        LOG_WARNING("The undirected diameter is always computed with the tree traversal");
    }
}

void AppOptions::verifyOutputDirectoryArgument()
{
    if (!writeStatistics)
        return;

    if (outputDirectory.empty())
    {
        LOG_ERROR("An output directory is required to write the statistics, use "
                  "--output-directory!");
    }

    if (std::filesystem::exists(outputDirectory) &&
        !std::filesystem::is_directory(outputDirectory))
    {
        LOG_ERROR("The output path [ %s ] is not a directory!", outputDirectory.c_str());
    }
}

void AppOptions::verifyPrefixArgument()
{
    if (prefix.empty())
    {
        prefix = isBalanced() ? "balanced" : "random";
        LOG_WARNING("No prefix is given, using [ %s ]", prefix.c_str());
    }
}

void AppOptions::initializeContext()
{
    if (writeStatistics)
    {
        std::error_code error;
        std::filesystem::create_directories(outputDirectory, error);
        if (error)
        {
            LOG_ERROR("Cannot create the output directory [ %s ]: %s",
                      outputDirectory.c_str(), error.message().c_str());
        }
    }

    outputPrefix = (std::filesystem::path(outputDirectory) / prefix).string();
}

}
