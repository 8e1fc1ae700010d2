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

#include <AppCommon.h>
#include "DiameterOperations.h"

namespace Dendrometer
{

AppOptions* parseArguments(const int& argc , const char** argv)
{
    std::unique_ptr< AppArguments > args = std::make_unique< AppArguments >(
        argc, argv, COPYRIGHT
        "This application measures the diameter of rooted neuronal trees, the longest "
        "weighted path from the root to a tip. The trees are generated randomly, or as "
        "balanced trees, and analyzed in batch. The diameters can be verified against a "
        "Dijkstra baseline, and complemented with the undirected diameter between the tips.");

    args->addGraphGenerationArguments();
    args->addDiameterArguments();
    args->addOutputArguments();

    // Get all the options
    AppOptions* options = args->getOptions();

    LOG_TITLE("Creating Context");

    // Verify the arguments after parsing them and extracting the application options.
    options->verifyGraphGenerationArguments();
    options->verifyAnalysisArguments();
    options->verifyOutputDirectoryArgument();
    options->verifyPrefixArgument();

    // Initialize context, once everything is in place and all the options are verified
    options->initializeContext();

    return options;
}

void run(int argc , const char** argv)
{
    // Parse the arguments and get the tool options
    std::unique_ptr< AppOptions > options(parseArguments(argc, argv));

    // Generate the trees
    auto graphs = generateGraphs(options.get());

    // Analyze the simplified trees
    if (options->simplify)
        simplifyGraphs(graphs);

    // Compute the diameters
    const DiameterRecords records = computeDiameterRecords(options.get(), graphs);

    // Compare against the baseline
    if (options->verify)
        verifyDiameterRecords(records);

    logDiameterSummary(records);

    // Write the statistics
    if (options->writeStatistics)
        exportDiameterRecords(options.get(), records);
}

}

int main(int argc , const char** argv)
{
    TIMER_SET;

    try
    {
        Dendrometer::run(argc, argv);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("%s", e.what());
    }

    LOG_STATUS_IMPORTANT("Dendrometer Stats.");
    LOG_STATS(GET_TIME_SECONDS);

    DENDROMETER_DONE;
}
