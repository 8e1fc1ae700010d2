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

// Verbosity flags
#define VERBOSE true
#define SILENT  false

// Strings
#define NEW_LINE            "\n"
#define EMPTY               ""
#define COMMA               ","

// Extensions
#define CSV_EXTENSION       ".csv"

// Suffixes
#define DIAMETERS_SUFFIX    "-diameters"

// The index of the parent of a root sample
#define ROOT_PARENT_INDEX   -1

// The tolerance used to compare lengths computed by different algorithms
#define DIAMETER_TOLERANCE  1e-9

#define COPYRIGHT "Copyright (c) BBP/EPFL 2016-2024. \n"

#define DENDROMETER_DONE { printf("\n"); return EXIT_SUCCESS; }
