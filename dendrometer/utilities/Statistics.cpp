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

#include "Statistics.h"

namespace Dendrometer
{
namespace Utilities
{

namespace
{

void verifyNotEmpty(const std::vector< double >& values)
{
    if (values.empty())
        throw std::invalid_argument("Statistics cannot be computed for an empty list");
}

double computeSumOfSquaredDeviations(const std::vector< double >& values)
{
    const double mean = computeMean(values);

    double sum = 0.0;
    for (const auto& value : values)
        sum += (value - mean) * (value - mean);
    return sum;
}

}

double computeMean(const std::vector< double >& values)
{
    verifyNotEmpty(values);

    double sum = 0.0;
    for (const auto& value : values)
        sum += value;
    return sum / values.size();
}

double computeMedian(std::vector< double > values)
{
    verifyNotEmpty(values);

    std::sort(values.begin(), values.end());
    const size_t middle = values.size() / 2;
    if (values.size() % 2 == 0)
        return 0.5 * (values[middle - 1] + values[middle]);
    return values[middle];
}

double computePopulationStandardDeviation(const std::vector< double >& values)
{
    verifyNotEmpty(values);
    return std::sqrt(computeSumOfSquaredDeviations(values) / values.size());
}

double computeSampleStandardDeviation(const std::vector< double >& values)
{
    if (values.size() < 2)
        throw std::invalid_argument("The sample standard deviation requires two values at least");
    return std::sqrt(computeSumOfSquaredDeviations(values) / (values.size() - 1));
}

DescriptiveStatistics computeDescriptiveStatistics(const std::vector< double >& values)
{
    verifyNotEmpty(values);

    DescriptiveStatistics statistics;
    statistics.count = values.size();
    statistics.mean = computeMean(values);
    statistics.median = computeMedian(values);
    statistics.standardDeviation = computePopulationStandardDeviation(values);
    statistics.minimum = *std::min_element(values.begin(), values.end());
    statistics.maximum = *std::max_element(values.begin(), values.end());
    for (const auto& value : values)
        statistics.sum += value;

    return statistics;
}

}
}
