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

#include <AppOptions.h>
#include <data/graphs/DirectedWeightedGraph.h>

namespace Dendrometer
{

/**
 * @brief The DiameterRecord struct
 * The measurements of a single analyzed graph.
 */
struct DiameterRecord
{
    size_t numberNodes = 0;
    size_t numberTips = 0;
    size_t numberBranchPoints = 0;
    double cableLength = 0.0;

    // Directed diameter
    double diameter = 0.0;
    size_t diameterNodes = 0;
    int64_t farthestTip = ROOT_PARENT_INDEX;

    // Only set with --verify and --undirected, NaN otherwise
    double genericDiameter = std::numeric_limits< double >::quiet_NaN();
    double undirectedDiameter = std::numeric_limits< double >::quiet_NaN();
};

typedef std::vector< DiameterRecord > DiameterRecords;

typedef std::vector< std::unique_ptr< DirectedWeightedGraph > > DirectedWeightedGraphs;

/**
 * @brief generateGraphs
 * Generates the random or balanced trees requested in the options. The i-th random tree
 * uses the seed (seed + i).
 * @param options
 * @return
 */
DirectedWeightedGraphs generateGraphs(const AppOptions* options);

/**
 * @brief simplifyGraphs
 * Replaces every graph by its simplified version.
 * @param graphs
 */
void simplifyGraphs(DirectedWeightedGraphs& graphs);

/**
 * @brief computeDiameterRecords
 * Computes the diameters of all the graphs in batch, and the baseline and undirected
 * diameters if requested.
 * @param options
 * @param graphs
 * @return
 */
DiameterRecords computeDiameterRecords(const AppOptions* options,
                                       const DirectedWeightedGraphs& graphs);

/**
 * @brief verifyDiameterRecords
 * Reports the graphs where the two algorithms disagree.
 * @param records
 * @return
 * The number of disagreements.
 */
size_t verifyDiameterRecords(const DiameterRecords& records);

/**
 * @brief logDiameterSummary
 * @param records
 */
void logDiameterSummary(const DiameterRecords& records);

/**
 * @brief exportDiameterRecords
 * Writes the records to <output-directory>/<prefix>-diameters.csv.
 * @param options
 * @param records
 */
void exportDiameterRecords(const AppOptions* options, const DiameterRecords& records);

}
