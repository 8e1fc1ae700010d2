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

#include "Vector3f.h"

namespace Dendrometer
{

const Vector3f Vector3f::ZERO = Vector3f(0.f, 0.f, 0.f);

Vector3f::Vector3f()
{
    _data[0] = 0.f;
    _data[1] = 0.f;
    _data[2] = 0.f;
}

Vector3f::Vector3f(const float& x, const float& y, const float& z)
{
    _data[0] = x;
    _data[1] = y;
    _data[2] = z;
}

Vector3f Vector3f::operator+(const Vector3f& other) const
{
    return Vector3f(_data[0] + other._data[0], _data[1] + other._data[1], _data[2] + other._data[2]);
}

Vector3f Vector3f::operator-(const Vector3f& other) const
{
    return Vector3f(_data[0] - other._data[0], _data[1] - other._data[1], _data[2] - other._data[2]);
}

Vector3f Vector3f::operator*(const float& factor) const
{
    return Vector3f(_data[0] * factor, _data[1] * factor, _data[2] * factor);
}

bool Vector3f::operator==(const Vector3f& other) const
{
    return _data[0] == other._data[0] && _data[1] == other._data[1] && _data[2] == other._data[2];
}

float Vector3f::abs() const
{
    return std::sqrt(_data[0] * _data[0] + _data[1] * _data[1] + _data[2] * _data[2]);
}

float Vector3f::distance(const Vector3f& other) const
{
    return (*this - other).abs();
}

Vector3f Vector3f::normalized() const
{
    const float length = abs();
    if (length == 0.f)
        return *this;
    return Vector3f(_data[0] / length, _data[1] / length, _data[2] / length);
}

void Vector3f::scale(const float& xScale, const float& yScale, const float& zScale)
{
    _data[0] *= xScale;
    _data[1] *= yScale;
    _data[2] *= zScale;
}

}
