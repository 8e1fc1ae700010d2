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

#include <common/Common.h>

namespace Dendrometer
{

/**
 * @brief The ARGUMENT_TYPE enum
 */
enum class ARGUMENT_TYPE
{
    BOOL,
    INTEGER,
    FLOAT,
    STRING
};

/**
 * @brief The ARGUMENT_PRESENCE enum
 */
enum class ARGUMENT_PRESENCE
{
    OPTIONAL,
    MANDATORY
};

/**
 * @brief The Argument class
 * A single command line argument, given as "--name value", or only "--name" for flags.
 */
class Argument
{
public:

    /**
     * @brief Argument
     * @param name
     * The name of the argument, including the leading dashes.
     * @param type
     * @param help
     * @param presence
     * @param defaultValue
     * The value used if the argument is not given, flags are false by default.
     */
    Argument(const std::string& name,
             const ARGUMENT_TYPE& type,
             const std::string& help,
             const ARGUMENT_PRESENCE& presence = ARGUMENT_PRESENCE::OPTIONAL,
             const std::string& defaultValue = EMPTY)
        : name(name)
        , type(type)
        , help(help)
        , presence(presence)
        , defaultValue(defaultValue)
    {
        /// EMPTY CONSTRUCTOR
    }

public:

    std::string name;
    ARGUMENT_TYPE type;
    std::string help;
    ARGUMENT_PRESENCE presence;
    std::string defaultValue;

    /**
     * @brief value
     * The value given on the command line.
     */
    std::string value;

    /**
     * @brief specified
     * True if the argument was given on the command line.
     */
    bool specified = false;
};

/**
 * @brief The Args class
 * A minimal command line parser. Any parsing error is fatal and reported with LOG_ERROR.
 */
class Args
{
public:

    /**
     * @brief Args
     * @param argc
     * @param argv
     * @param help
     * A description of the application printed with --help.
     */
    Args(const int& argc, const char** argv, const std::string& help);
    ~Args();

    /**
     * @brief addArgument
     * @param argument
     * The parser takes the ownership of the argument.
     */
    void addArgument(Argument* argument);

    /**
     * @brief parse
     * Parses the command line. If --help is given, the help is printed and the application
     * exits.
     */
    void parse();

    /**
     * @brief isSpecified
     * @param name
     * @return
     */
    bool isSpecified(const std::string& name) const;

    bool getBoolValue(const std::string& name) const;
    int64_t getIntegerValue(const std::string& name) const;
    float getFloatValue(const std::string& name) const;
    std::string getStringValue(const std::string& name) const;

    /**
     * @brief printHelp
     */
    void printHelp() const;

private:

    /**
     * @brief _getArgument
     * @param name
     * @return
     */
    Argument* _getArgument(const std::string& name) const;

    /**
     * @brief _getValue
     * @param name
     * @return
     * The given value, or the default one.
     */
    std::string _getValue(const std::string& name) const;

private:

    /**
     * @brief _application
     */
    std::string _application;

    /**
     * @brief _help
     */
    std::string _help;

    /**
     * @brief _tokens
     */
    std::vector< std::string > _tokens;

    /**
     * @brief _arguments
     */
    std::vector< Argument* > _arguments;
};

}
