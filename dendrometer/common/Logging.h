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
 * @brief The LOG_LEVEL enum
 * The level of the message that is printed to the console.
 */
enum class LOG_LEVEL
{
    TITLE,
    HEADER,
    STATUS,
    STATUS_IMPORTANT,
    INFO,
    DETAIL,
    SUCCESS,
    WARNING,
    ERROR,
    STATS
};

/**
 * @brief Log
 * Prints a formatted message to the console.
 *
 * @param logLevel
 * The level of the message, which defines its color and its prefix.
 * @param filePath
 * The source file from which the message is logged, used by the ERROR level.
 * @param lineNumber
 * The line in the source file.
 * @param functionName
 * The function from which the message is logged.
 * @param format
 * printf-like format string followed by the arguments.
 */
void Log(const LOG_LEVEL& logLevel,
         const char* filePath,
         const int& lineNumber,
         const char* functionName,
         const char* format, ...);

}

#define LOG_TITLE(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::TITLE, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_HEADER(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::HEADER, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_STATUS(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::STATUS, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_STATUS_IMPORTANT(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::STATUS_IMPORTANT, \
                     __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_INFO(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::INFO, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_DETAIL(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::DETAIL, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_SUCCESS(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::SUCCESS, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define LOG_WARNING(...) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::WARNING, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

// Fatal, the process is terminated after the message is printed
#define LOG_ERROR(...)                                                                             \
    {                                                                                              \
        Dendrometer::Log(Dendrometer::LOG_LEVEL::ERROR, __FILE__, __LINE__, __FUNCTION__,          \
                         __VA_ARGS__);                                                             \
        exit(EXIT_FAILURE);                                                                        \
    }

#define LOG_STATS(TIME) \
    Dendrometer::Log(Dendrometer::LOG_LEVEL::STATS, __FILE__, __LINE__, __FUNCTION__, \
                     "Time [ %f ] seconds", TIME)

// Only logs if the verbose flag is set
#define VERBOSE_LOG(LOG, VERBOSE) { if (VERBOSE) { LOG; } }
