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

#include "Progress.h"

namespace Dendrometer
{

void printProgressBar(const size_t& current, const size_t& total, const size_t barLength)
{
    if (total == 0) return;

    const float percentage = (100.f * current) / (1.f * total);
    if (static_cast< size_t >(percentage) % 10 != 0) return;

    const size_t stars = static_cast< size_t >(std::floor((percentage * barLength) / 100.f));
    const size_t spaces = barLength > stars ? barLength - stars : 0;

    std::string bar = "* Progress |";
    bar.append(stars, '#');
    bar.append(spaces, ' ');
    bar += "|";

    printf("\r\t%s (%2.2f %%)", bar.c_str(), percentage);
    fflush(stdout);
}

void progressUpdate(size_t& progressValue)
{
#ifdef DENDROMETER_USE_OPENMP
#pragma omp atomic
#endif
    ++progressValue;
}

}
