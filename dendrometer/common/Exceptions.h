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
 * @brief The InvalidGraphError class
 * Raised when a graph does not satisfy the rooted-tree invariant: a single root, all the other
 * nodes with a single parent, no cycles and a single connected component. It is also raised
 * when the data given to construct or edit the graph is inconsistent.
 */
class InvalidGraphError : public std::runtime_error
{
public:

    /**
     * @brief InvalidGraphError
     * @param message
     */
    explicit InvalidGraphError(const std::string& message)
        : std::runtime_error(message)
    {
        /// EMPTY CONSTRUCTOR
    }
};

}
