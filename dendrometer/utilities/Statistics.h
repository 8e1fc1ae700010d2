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

#include <common/Headers.hh>

namespace Dendrometer
{
namespace Utilities
{

/**
 * @brief The DescriptiveStatistics struct
 * A summary of a list of values. The standard deviation is the population one, i.e. normalized
 * by the number of values.
 */
struct DescriptiveStatistics
{
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double standardDeviation = 0.0;
    double minimum = 0.0;
    double maximum = 0.0;
    double sum = 0.0;
};

/**
 * @brief computeMean
 * @param values
 * @return
 * @throws std::invalid_argument if the list is empty.
 */
double computeMean(const std::vector< double >& values);

/**
 * @brief computeMedian
 * The mean of the two middle values for lists with an even number of values.
 * @param values
 * @return
 * @throws std::invalid_argument if the list is empty.
 */
double computeMedian(std::vector< double > values);

/**
 * @brief computePopulationStandardDeviation
 * sqrt(sum((x - mean)^2) / n)
 * @param values
 * @return
 * @throws std::invalid_argument if the list is empty.
 */
double computePopulationStandardDeviation(const std::vector< double >& values);

/**
 * @brief computeSampleStandardDeviation
 * sqrt(sum((x - mean)^2) / (n - 1))
 * @param values
 * @return
 * @throws std::invalid_argument if the list has less than two values.
 */
double computeSampleStandardDeviation(const std::vector< double >& values);

/**
 * @brief computeDescriptiveStatistics
 * @param values
 * @return
 * @throws std::invalid_argument if the list is empty.
 */
DescriptiveStatistics computeDescriptiveStatistics(const std::vector< double >& values);

}
}
