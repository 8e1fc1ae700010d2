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
#include <math/Vector3f.h>
#include <data/morphologies/MorphologySample.h>
#include <data/graphs/GraphNode.h>
#include <data/graphs/GraphEdge.h>
#include <data/graphs/GraphPath.h>
#include <data/graphs/DirectedWeightedGraph.h>
#include <data/graphs/RandomTreeGenerator.h>
#include <algorithms/graphs/ShortestPathFinder.h>
#include <algorithms/graphs/GraphDiameterAnalyzer.h>
#include <utilities/Statistics.h>
