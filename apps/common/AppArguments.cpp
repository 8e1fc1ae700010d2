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

#include "AppArguments.h"

namespace Dendrometer
{

AppArguments::AppArguments(const int& argc, const char** argv, const std::string& help)
{
    _args = std::make_unique< Args >(argc, argv, help);
}

void AppArguments::addGraphGenerationArguments()
{
    _args->addArgument(new Argument(
        "--number-graphs", ARGUMENT_TYPE::INTEGER,
        "The number of generated trees.",
        ARGUMENT_PRESENCE::OPTIONAL, "1"));

    _args->addArgument(new Argument(
        "--number-nodes", ARGUMENT_TYPE::INTEGER,
        "The number of nodes of every random tree.",
        ARGUMENT_PRESENCE::OPTIONAL, "100"));

    _args->addArgument(new Argument(
        "--min-weight", ARGUMENT_TYPE::FLOAT,
        "The minimum edge weight. Balanced trees use it as the weight of every edge.",
        ARGUMENT_PRESENCE::OPTIONAL, "0.1"));

    _args->addArgument(new Argument(
        "--max-weight", ARGUMENT_TYPE::FLOAT,
        "The maximum edge weight of the random trees.",
        ARGUMENT_PRESENCE::OPTIONAL, "100.0"));

    _args->addArgument(new Argument(
        "--seed", ARGUMENT_TYPE::INTEGER,
        "The seed of the first random tree, the following trees use the next seeds.",
        ARGUMENT_PRESENCE::OPTIONAL, "0"));

    _args->addArgument(new Argument(
        "--balanced-depth", ARGUMENT_TYPE::INTEGER,
        "Generates balanced trees of this depth instead of random trees.",
        ARGUMENT_PRESENCE::OPTIONAL, "0"));

    _args->addArgument(new Argument(
        "--branching-factor", ARGUMENT_TYPE::INTEGER,
        "The number of children of every internal node of the balanced trees.",
        ARGUMENT_PRESENCE::OPTIONAL, "2"));
}

void AppArguments::addDiameterArguments()
{
    _args->addArgument(new Argument(
        "--algorithm", ARGUMENT_TYPE::STRING,
        "The diameter algorithm, [ tree ] or [ dijkstra ].",
        ARGUMENT_PRESENCE::OPTIONAL, "tree"));

    _args->addArgument(new Argument(
        "--verify", ARGUMENT_TYPE::BOOL,
        "Recomputes the diameters with the Dijkstra baseline and compares the results."));

    _args->addArgument(new Argument(
        "--undirected", ARGUMENT_TYPE::BOOL,
        "Computes the undirected diameters between the tips and the root."));

    _args->addArgument(new Argument(
        "--simplify", ARGUMENT_TYPE::BOOL,
        "Analyzes the simplified graphs, only with the root, the branch points and the tips."));
}

void AppArguments::addOutputArguments()
{
    _args->addArgument(new Argument(
        "--output-directory", ARGUMENT_TYPE::STRING,
        "The directory where the statistics are written."));

    _args->addArgument(new Argument(
        "--prefix", ARGUMENT_TYPE::STRING,
        "The prefix of the output files."));

    _args->addArgument(new Argument(
        "--stats", ARGUMENT_TYPE::BOOL,
        "Writes the diameter of every graph to a CSV file."));
}

AppOptions* AppArguments::getOptions()
{
    _args->parse();

    AppOptions* options = new AppOptions();

    // Graph generation
    options->numberGraphs = _args->getIntegerValue("--number-graphs");
    options->numberNodes = _args->getIntegerValue("--number-nodes");
    options->minimumWeight = _args->getFloatValue("--min-weight");
    options->maximumWeight = _args->getFloatValue("--max-weight");
    options->seed = _args->getIntegerValue("--seed");
    options->balancedDepth = _args->getIntegerValue("--balanced-depth");
    options->branchingFactor = _args->getIntegerValue("--branching-factor");

    // Analysis
    options->algorithm = _args->getStringValue("--algorithm");
    options->verify = _args->getBoolValue("--verify");
    options->undirected = _args->getBoolValue("--undirected");
    options->simplify = _args->getBoolValue("--simplify");

    // Output
    options->outputDirectory = _args->getStringValue("--output-directory");
    options->prefix = _args->getStringValue("--prefix");
    options->writeStatistics = _args->getBoolValue("--stats");

    return options;
}

}
