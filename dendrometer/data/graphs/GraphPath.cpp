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

#include "GraphPath.h"
#include <common/Logging.h>

namespace Dendrometer
{

GraphPath::GraphPath()
    : _length(0.0)
{
    /// EMPTY CONSTRUCTOR
}

void GraphPath::appendNode(const GraphNode* node)
{
    _nodes.push_back(node);
}

void GraphPath::prependNode(const GraphNode* node)
{
    _nodes.push_front(node);
}

void GraphPath::reverse()
{
    std::reverse(_nodes.begin(), _nodes.end());
}

bool GraphPath::contains(const GraphNode* node) const
{
    return std::find(_nodes.begin(), _nodes.end(), node) != _nodes.end();
}

std::vector< int64_t > GraphPath::getSampleIndices() const
{
    std::vector< int64_t > indices;
    indices.reserve(_nodes.size());
    for (const auto& node : _nodes)
        indices.push_back(node->index);
    return indices;
}

void GraphPath::printPath() const
{
    std::stringstream stream;
    for (size_t i = 0; i < _nodes.size(); ++i)
    {
        if (i > 0) stream << " -> ";
        stream << _nodes[i]->index;
    }

    LOG_INFO("Path [ %s ], Length [ %f ]", stream.str().c_str(), _length);
}

}
