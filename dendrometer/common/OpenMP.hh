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

#ifdef DENDROMETER_USE_OPENMP
#include <omp.h>
#endif

#ifdef DENDROMETER_USE_OPENMP
#define OMP_PARALLEL_FOR _Pragma("omp parallel for schedule(dynamic)")
#else
#define OMP_PARALLEL_FOR
#endif

#ifdef DENDROMETER_USE_OPENMP
#define OMP_MAX_THREADS omp_get_max_threads()
#else
#define OMP_MAX_THREADS 1
#endif
