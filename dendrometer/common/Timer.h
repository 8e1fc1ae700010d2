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
 * @brief The Timer class
 * A wall-clock timer used to profile the different stages of the analysis.
 */
class Timer
{
public:

    /**
     * @brief Timer
     * Constructs and starts the timer.
     */
    Timer();

    /**
     * @brief start
     * (Re)starts the timer.
     */
    void start();

    /**
     * @brief elapsedTimeInSeconds
     * @return
     * Returns the time elapsed since the last start in seconds.
     */
    double elapsedTimeInSeconds() const;

private:

    /**
     * @brief _startTime
     */
    std::chrono::steady_clock::time_point _startTime;
};

}

#define TIMER_SET Dendrometer::Timer DENDROMETER_TIMER; DENDROMETER_TIMER.start()
#define TIMER_RESET DENDROMETER_TIMER.start()
#define GET_TIME_SECONDS DENDROMETER_TIMER.elapsedTimeInSeconds()
