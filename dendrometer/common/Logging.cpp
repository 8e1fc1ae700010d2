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

#include "Logging.h"

// Console colors
#define STD_RED     "\x1b[31m"
#define STD_GREEN   "\x1b[32m"
#define STD_YELLOW  "\x1b[33m"
#define STD_BLUE    "\x1b[34m"
#define STD_MAGENTA "\x1b[35m"
#define STD_CYAN    "\x1b[36m"
#define STD_BOLD    "\x1b[1m"
#define STD_RESET   "\x1b[0m"

// The maximum length of a single message
#define MAX_MESSAGE_LENGTH 1024

namespace Dendrometer
{

void Log(const LOG_LEVEL& logLevel,
         const char* filePath,
         const int& lineNumber,
         const char* functionName,
         const char* format, ...)
{
    // Compose the message
    char message[MAX_MESSAGE_LENGTH];
    va_list arguments;
    va_start(arguments, format);
    vsnprintf(message, MAX_MESSAGE_LENGTH, format, arguments);
    va_end(arguments);

    switch (logLevel)
    {
    case LOG_LEVEL::TITLE:
    {
        // Underline the title with the same length
        const std::string line(strlen(message) + 4, '*');
        printf("\n" STD_BOLD STD_CYAN "%s\n* %s *\n%s" STD_RESET "\n",
               line.c_str(), message, line.c_str());
    } break;

    case LOG_LEVEL::HEADER:
        printf("\n" STD_BOLD STD_BLUE "* %s" STD_RESET "\n", message);
        break;

    case LOG_LEVEL::STATUS:
        printf(STD_CYAN "* %s" STD_RESET "\n", message);
        break;

    case LOG_LEVEL::STATUS_IMPORTANT:
        printf("\n" STD_BOLD STD_MAGENTA "* %s" STD_RESET "\n", message);
        break;

    case LOG_LEVEL::INFO:
        printf("\t%s\n", message);
        break;

    case LOG_LEVEL::DETAIL:
        printf("\t* %s\n", message);
        break;

    case LOG_LEVEL::SUCCESS:
        printf(STD_GREEN "\t* %s" STD_RESET "\n", message);
        break;

    case LOG_LEVEL::WARNING:
        printf(STD_YELLOW "\t* WARNING: %s" STD_RESET "\n", message);
        break;

    case LOG_LEVEL::ERROR:
        fprintf(stderr, STD_RED "* ERROR: %s\n\t[%s:%d] %s()" STD_RESET "\n",
                message, filePath, lineNumber, functionName);
        break;

    case LOG_LEVEL::STATS:
        printf(STD_GREEN "\t* %s" STD_RESET "\n", message);
        break;
    }

    fflush(stdout);
}

}
