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

/**
 * @brief printProgressBar
 * Prints the progress bar of a loop, the bar is only refreshed every 10%.
 *
 * @param current
 * Current count.
 * @param total
 * Total count.
 * @param barLength
 * The total length of the progress bar in characters.
 */
void printProgressBar(const size_t& current,
                      const size_t& total,
                      const size_t barLength = 50);

/**
 * @brief progressUpdate
 * Atomically increments the progress value of a (parallel) loop.
 *
 * @param progressValue
 * The progress value to be updated.
 */
void progressUpdate(size_t& progressValue);

}

// Prints a simple message before starting the loop
#define LOOP_STARTS(MESSAGE) (printf("\t%s \n", MESSAGE))

#ifdef DENDROMETER_ENABLE_PROGRESS_BAR

#define LOOP_PROGRESS(PROGRESS, TOTAL) (Dendrometer::printProgressBar(PROGRESS, TOTAL))
#define LOOP_DONE { LOOP_PROGRESS(100, 100); printf(" \n"); }
#define PROGRESS DENDROMETER_PROGRESS
#define PROGRESS_SET size_t DENDROMETER_PROGRESS = 0
#define PROGRESS_UPDATE (Dendrometer::progressUpdate(DENDROMETER_PROGRESS))

#else

#define LOOP_PROGRESS(PROGRESS, TOTAL) { }
#define LOOP_DONE { }
#define PROGRESS 0
#define PROGRESS_SET { }
#define PROGRESS_UPDATE { }

#endif
