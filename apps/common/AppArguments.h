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

#include <Args.h>
#include <AppOptions.h>

namespace Dendrometer
{

/**
 * @brief The AppArguments class
 * Groups the command line arguments of the applications.
 */
class AppArguments
{
public:

    /**
     * @brief AppArguments
     * @param argc
     * @param argv
     * @param help
     */
    AppArguments(const int& argc, const char** argv, const std::string& help);

    /**
     * @brief addGraphGenerationArguments
     * Arguments of the random and balanced tree generators.
     */
    void addGraphGenerationArguments();

    /**
     * @brief addDiameterArguments
     */
    void addDiameterArguments();

    /**
     * @brief addOutputArguments
     */
    void addOutputArguments();

    /**
     * @brief getOptions
     * Parses the command line and returns the options. The caller owns the options.
     * @return
     */
    AppOptions* getOptions();

private:

    /**
     * @brief _args
     */
    std::unique_ptr< Args > _args;
};

}
