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

#include "DiameterOperations.h"
#include <Dendrometer.h>

namespace Dendrometer
{

DirectedWeightedGraphs generateGraphs(const AppOptions* options)
{
    LOG_TITLE("Generating Graphs");

    DirectedWeightedGraphs graphs;
    graphs.resize(static_cast< size_t >(options->numberGraphs));

    TIMER_SET;
    LOOP_STARTS("Generating Trees");
    for (size_t i = 0; i < graphs.size(); ++i)
    {
        if (options->isBalanced())
        {
            graphs[i] = RandomTreeGenerator::generateBalancedTree(
                        static_cast< size_t >(options->balancedDepth),
                        static_cast< size_t >(options->branchingFactor),
                        options->minimumWeight);
        }
        else
        {
            const uint32_t seed = static_cast< uint32_t >(options->seed + i);
            graphs[i] = RandomTreeGenerator::generateRandomTree(
                        static_cast< size_t >(options->numberNodes),
                        options->minimumWeight, options->maximumWeight, seed);
        }
        LOOP_PROGRESS(i, graphs.size());
    }
    LOOP_DONE;
    LOG_STATS(GET_TIME_SECONDS);

    return graphs;
}

void simplifyGraphs(DirectedWeightedGraphs& graphs)
{
    LOG_TITLE("Simplifying Graphs");

    size_t numberNodes = 0, numberSimplifiedNodes = 0;

    TIMER_SET;
    LOOP_STARTS("Simplification");
    for (size_t i = 0; i < graphs.size(); ++i)
    {
        numberNodes += graphs[i]->getNumberNodes();
        graphs[i] = graphs[i]->getSimplifiedGraph();
        numberSimplifiedNodes += graphs[i]->getNumberNodes();
        LOOP_PROGRESS(i, graphs.size());
    }
    LOOP_DONE;
    LOG_STATS(GET_TIME_SECONDS);

    LOG_DETAIL("Nodes [ %zu ] -> [ %zu ]", numberNodes, numberSimplifiedNodes);
}

DiameterRecords computeDiameterRecords(const AppOptions* options,
                                       const DirectedWeightedGraphs& graphs)
{
    LOG_TITLE("Computing Diameters");

    std::vector< const DirectedWeightedGraph* > batch;
    for (const auto& graph : graphs)
        batch.push_back(graph.get());

    DiameterOptions diameterOptions;
    diameterOptions.algorithm = GraphDiameterAnalyzer::getAlgorithm(options->algorithm);

    DiameterRecords records(graphs.size());
    for (size_t i = 0; i < graphs.size(); ++i)
    {
        const auto& graph = graphs[i];
        records[i].numberNodes = graph->getNumberNodes();
        records[i].numberTips = graph->getTips().size();
        records[i].numberBranchPoints = graph->getBranchPoints().size();
        records[i].cableLength = graph->sumEdgeWeights();
    }

    LOG_DETAIL("Threads [ %d ]", OMP_MAX_THREADS);

    TIMER_SET;
    LOG_STATUS("Directed Diameters [ %s ]",
               GraphDiameterAnalyzer::getAlgorithmName(diameterOptions.algorithm).c_str());
    const GraphPaths diameters = GraphDiameterAnalyzer::computeDiameters(batch, diameterOptions);
    const double directedTime = GET_TIME_SECONDS;
    LOG_STATS(directedTime);

    for (size_t i = 0; i < diameters.size(); ++i)
    {
        records[i].diameter = diameters[i].getLength();
        records[i].diameterNodes = diameters[i].size();
        records[i].farthestTip = diameters[i].getLastNode()->index;
    }

    // A single graph is small enough to show its diameter
    if (diameters.size() == 1)
        diameters.front().printPath();

    if (options->verify)
    {
        // The baseline is always the other algorithm
        DiameterOptions baselineOptions = diameterOptions;
        baselineOptions.algorithm =
                (diameterOptions.algorithm == DIAMETER_ALGORITHM::TREE_TRAVERSAL) ?
                    DIAMETER_ALGORITHM::DIJKSTRA : DIAMETER_ALGORITHM::TREE_TRAVERSAL;

        TIMER_RESET;
        LOG_STATUS("Baseline Diameters [ %s ]",
                   GraphDiameterAnalyzer::getAlgorithmName(baselineOptions.algorithm).c_str());
        const GraphPaths baseline =
                GraphDiameterAnalyzer::computeDiameters(batch, baselineOptions);
        const double baselineTime = GET_TIME_SECONDS;
        LOG_STATS(baselineTime);

        for (size_t i = 0; i < baseline.size(); ++i)
            records[i].genericDiameter = baseline[i].getLength();

        if (directedTime > 0.0)
            LOG_DETAIL("Speedup [ %f ]", baselineTime / directedTime);
    }

    if (options->undirected)
    {
        DiameterOptions undirectedOptions;
        undirectedOptions.mode = DIAMETER_MODE::UNDIRECTED;

        TIMER_RESET;
        LOG_STATUS("Undirected Diameters");
        const GraphPaths undirected =
                GraphDiameterAnalyzer::computeDiameters(batch, undirectedOptions);
        LOG_STATS(GET_TIME_SECONDS);

        for (size_t i = 0; i < undirected.size(); ++i)
            records[i].undirectedDiameter = undirected[i].getLength();
    }

    return records;
}

size_t verifyDiameterRecords(const DiameterRecords& records)
{
    LOG_TITLE("Verification");

    size_t disagreements = 0;
    for (size_t i = 0; i < records.size(); ++i)
    {
        const auto& record = records[i];
        if (std::isnan(record.genericDiameter))
            continue;

        const double difference = std::abs(record.diameter - record.genericDiameter);
        if (difference > DIAMETER_TOLERANCE)
        {
            LOG_WARNING("Graph [ %zu ]: diameter [ %f ] differs from the baseline [ %f ]",
                        i, record.diameter, record.genericDiameter);
            disagreements++;
        }
    }

    if (disagreements == 0)
        LOG_SUCCESS("All the [ %zu ] diameters agree with the baseline", records.size());
    else
        LOG_WARNING("[ %zu ] of [ %zu ] diameters disagree", disagreements, records.size());

    return disagreements;
}

static void _logStatistics(const char* title, const std::vector< double >& values)
{
    const auto statistics = Utilities::computeDescriptiveStatistics(values);

    LOG_HEADER("%s", title);
    LOG_INFO("Mean      [ %f ]", statistics.mean);
    LOG_INFO("Median    [ %f ]", statistics.median);
    LOG_INFO("Std. Dev. [ %f ]", statistics.standardDeviation);
    LOG_INFO("Min.      [ %f ]", statistics.minimum);
    LOG_INFO("Max.      [ %f ]", statistics.maximum);
}

void logDiameterSummary(const DiameterRecords& records)
{
    LOG_TITLE("Summary");

    if (records.empty())
    {
        LOG_WARNING("No graphs were analyzed");
        return;
    }

    std::vector< double > diameters, cableLengths, undirected;
    for (const auto& record : records)
    {
        diameters.push_back(record.diameter);
        cableLengths.push_back(record.cableLength);
        if (!std::isnan(record.undirectedDiameter))
            undirected.push_back(record.undirectedDiameter);
    }

    LOG_DETAIL("Graphs [ %zu ]", records.size());
    _logStatistics("Directed Diameter", diameters);
    _logStatistics("Cable Length", cableLengths);
    if (!undirected.empty())
        _logStatistics("Undirected Diameter", undirected);
}

void exportDiameterRecords(const AppOptions* options, const DiameterRecords& records)
{
    std::stringstream sstream;
    sstream << options->outputPrefix << DIAMETERS_SUFFIX << CSV_EXTENSION;
    const std::string filePath = sstream.str();

    LOG_STATUS("Exporting Diameters: [ %s ]", filePath.c_str());

    std::fstream stream;
    stream.open(filePath, std::ios::out);
    if (!stream.is_open())
    {
        LOG_ERROR("Cannot open the file [ %s ] for writing!", filePath.c_str());
    }

    stream.precision(std::numeric_limits< double >::max_digits10);

    stream << "graph,nodes,tips,branch_points,cable_length,diameter,diameter_nodes,"
              "farthest_tip,generic_diameter,undirected_diameter" << NEW_LINE;

    for (size_t i = 0; i < records.size(); ++i)
    {
        const auto& record = records[i];
        stream << i << COMMA
               << record.numberNodes << COMMA
               << record.numberTips << COMMA
               << record.numberBranchPoints << COMMA
               << record.cableLength << COMMA
               << record.diameter << COMMA
               << record.diameterNodes << COMMA
               << record.farthestTip << COMMA;

        // Missing values are left empty
        if (!std::isnan(record.genericDiameter))
            stream << record.genericDiameter;
        stream << COMMA;
        if (!std::isnan(record.undirectedDiameter))
            stream << record.undirectedDiameter;
        stream << NEW_LINE;
    }

    stream.close();
}

}
