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
 * @brief The Vector3f class
 * A three-dimensional vector with float components used to represent the positions of the
 * samples of a morphology in space.
 */
class Vector3f
{
public:

    /**
     * @brief Vector3f
     * Constructs a vector at the origin.
     */
    Vector3f();

    /**
     * @brief Vector3f
     * @param x
     * @param y
     * @param z
     */
    Vector3f(const float& x, const float& y, const float& z);

    float x() const { return _data[0]; }
    float y() const { return _data[1]; }
    float z() const { return _data[2]; }

    float& operator[](const size_t& index) { return _data[index]; }
    const float& operator[](const size_t& index) const { return _data[index]; }

    Vector3f operator+(const Vector3f& other) const;
    Vector3f operator-(const Vector3f& other) const;
    Vector3f operator*(const float& factor) const;
    bool operator==(const Vector3f& other) const;
    bool operator!=(const Vector3f& other) const { return !(*this == other); }

    /**
     * @brief abs
     * @return
     * Returns the length of the vector.
     */
    float abs() const;

    /**
     * @brief distance
     * @param other
     * @return
     * Returns the Euclidean distance between this point and the other one.
     */
    float distance(const Vector3f& other) const;

    /**
     * @brief normalized
     * @return
     * Returns a unit vector in the direction of this one. The zero vector is returned as is.
     */
    Vector3f normalized() const;

    /**
     * @brief scale
     * Scales each component of the vector by the corresponding factor.
     * @param xScale
     * @param yScale
     * @param zScale
     */
    void scale(const float& xScale, const float& yScale, const float& zScale);

public:

    /**
     * @brief ZERO
     */
    static const Vector3f ZERO;

private:

    /**
     * @brief _data
     */
    float _data[3];
};

/**
 * @brief Vectors3f
 */
typedef std::vector< Vector3f > Vectors3f;

}
