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

#include <common/Common.h>

namespace Dendrometer
{

/**
 * @brief The AppOptions class
 * The options of the dendrometer applications, filled from the command line arguments.
 */
class AppOptions
{
public:

    /// EMPTY CONSTRUCTOR
    AppOptions() { }

public:

    /**
     * @brief verifyGraphGenerationArguments
     * Verifies the number of graphs, the number of nodes and the weight range, or the
     * balanced tree parameters if a balanced depth is given.
     */
    void verifyGraphGenerationArguments();

    /**
     * @brief verifyAnalysisArguments
     * Verifies the diameter algorithm and its combination with the undirected mode.
     */
    void verifyAnalysisArguments();

    /**
     * @brief verifyOutputDirectoryArgument
     */
    void verifyOutputDirectoryArgument();

    /**
     * @brief verifyPrefixArgument
     */
    void verifyPrefixArgument();

    /**
     * @brief initializeContext
     * Creates the output directory, if needed, and sets the prefix of the output files.
     * Must be called after all the arguments are verified.
     */
    void initializeContext();

    /**
     * @brief isBalanced
     * @return
     * True if balanced trees are generated instead of random ones.
     */
    bool isBalanced() const { return balancedDepth > 0; }

public:

    // Graph generation
    int64_t numberGraphs = 1;
    int64_t numberNodes = 100;
    float minimumWeight = 0.1f;
    float maximumWeight = 100.f;
    int64_t seed = 0;
    int64_t balancedDepth = 0;
    int64_t branchingFactor = 2;

    // Analysis
    std::string algorithm;
    bool verify = false;
    bool undirected = false;
    bool simplify = false;

    // Output
    std::string outputDirectory;
    std::string prefix;
    bool writeStatistics = false;

    /**
     * @brief outputPrefix
     * The output directory joined with the prefix, set by initializeContext().
     */
    std::string outputPrefix;
};

}
