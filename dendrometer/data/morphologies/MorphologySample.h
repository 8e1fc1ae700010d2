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

#include <math/Vector3f.h>
#include <common/Defines.h>

namespace Dendrometer
{

/**
 * @brief The MorphologySample class
 * A single sample of a traced morphology as handed over by the tracing host: its index, the
 * index of its parent sample (ROOT_PARENT_INDEX for the root), its position, radius and
 * structure type. This mirrors a record of an SWC file, but no file is involved.
 */
class MorphologySample
{
public:

    /**
     * @brief MorphologySample
     * @param index
     * The unique index of the sample.
     * @param parentIndex
     * The index of the parent sample, or ROOT_PARENT_INDEX for the root sample.
     * @param point
     * The position of the sample.
     * @param radius
     * The radius of the sample.
     * @param type
     * The structure type of the sample (soma, axon, dendrite, etc.).
     */
    MorphologySample(const int64_t& index,
                     const int64_t& parentIndex,
                     const Vector3f& point,
                     const float& radius = 0.f,
                     const size_t& type = 0)
        : index(index)
        , parentIndex(parentIndex)
        , point(point)
        , radius(radius)
        , type(type)
    {
        /// EMPTY CONSTRUCTOR
    }

    /**
     * @brief isRoot
     * @return
     */
    bool isRoot() const { return parentIndex == ROOT_PARENT_INDEX; }

public:

    /**
     * @brief index
     */
    int64_t index;

    /**
     * @brief parentIndex
     */
    int64_t parentIndex;

    /**
     * @brief point
     */
    Vector3f point;

    /**
     * @brief radius
     */
    float radius;

    /**
     * @brief type
     */
    size_t type;
};

/**
 * @brief MorphologySamples
 */
typedef std::vector< MorphologySample > MorphologySamples;

}
