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

#include "Args.h"

namespace Dendrometer
{

Args::Args(const int& argc, const char** argv, const std::string& help)
    : _help(help)
{
    _application = (argc > 0) ? argv[0] : "dendrometer";
    for (int i = 1; i < argc; ++i)
        _tokens.push_back(argv[i]);

    addArgument(new Argument("--help", ARGUMENT_TYPE::BOOL, "Prints this help message."));
}

Args::~Args()
{
    for (auto argument : _arguments) { delete argument; }
    _arguments.clear();
}

void Args::addArgument(Argument* argument)
{
    if (_getArgument(argument->name) != nullptr)
    {
        LOG_ERROR("The argument [ %s ] is registered twice!", argument->name.c_str());
    }
    _arguments.push_back(argument);
}

Argument* Args::_getArgument(const std::string& name) const
{
    for (auto argument : _arguments)
    {
        if (argument->name == name)
            return argument;
    }
    return nullptr;
}

void Args::parse()
{
    for (size_t i = 0; i < _tokens.size(); ++i)
    {
        const std::string& token = _tokens[i];

        Argument* argument = _getArgument(token);
        if (argument == nullptr)
        {
            LOG_ERROR("Unknown argument [ %s ], use --help to list the arguments",
                      token.c_str());
        }

        argument->specified = true;

        // Flags do not have values
        if (argument->type == ARGUMENT_TYPE::BOOL)
        {
            argument->value = "true";
            continue;
        }

        if (i + 1 >= _tokens.size())
        {
            LOG_ERROR("The argument [ %s ] requires a value!", token.c_str());
        }
        argument->value = _tokens[++i];
    }

    if (isSpecified("--help"))
    {
        printHelp();
        exit(EXIT_SUCCESS);
    }

    for (const auto argument : _arguments)
    {
        if (argument->presence == ARGUMENT_PRESENCE::MANDATORY && !argument->specified)
        {
            LOG_ERROR("The argument [ %s ] is mandatory!", argument->name.c_str());
        }
    }
}

bool Args::isSpecified(const std::string& name) const
{
    const Argument* argument = _getArgument(name);
    return argument != nullptr && argument->specified;
}

std::string Args::_getValue(const std::string& name) const
{
    const Argument* argument = _getArgument(name);
    if (argument == nullptr)
    {
        LOG_ERROR("The argument [ %s ] is not registered!", name.c_str());
    }
    return argument->specified ? argument->value : argument->defaultValue;
}

bool Args::getBoolValue(const std::string& name) const
{
    return _getValue(name) == "true";
}

int64_t Args::getIntegerValue(const std::string& name) const
{
    const std::string value = _getValue(name);
    try
    {
        size_t position = 0;
        const int64_t result = std::stoll(value, &position);
        if (position != value.size())
            throw std::invalid_argument(value);
        return result;
    }
    catch (const std::exception&)
    {
        LOG_ERROR("The value [ %s ] of [ %s ] is not an integer!", value.c_str(), name.c_str());
    }
}

float Args::getFloatValue(const std::string& name) const
{
    const std::string value = _getValue(name);
    try
    {
        size_t position = 0;
        const float result = std::stof(value, &position);
        if (position != value.size())
            throw std::invalid_argument(value);
        return result;
    }
    catch (const std::exception&)
    {
        LOG_ERROR("The value [ %s ] of [ %s ] is not a number!", value.c_str(), name.c_str());
    }
}

std::string Args::getStringValue(const std::string& name) const
{
    return _getValue(name);
}

void Args::printHelp() const
{
    printf("\n%s\n\n", _help.c_str());
    printf("Usage: %s [ARGUMENTS]\n\n", _application.c_str());
    for (const auto argument : _arguments)
    {
        std::string entry = argument->name;
        switch (argument->type)
        {
        case ARGUMENT_TYPE::BOOL: break;
        case ARGUMENT_TYPE::INTEGER: entry += " <INTEGER>"; break;
        case ARGUMENT_TYPE::FLOAT: entry += " <FLOAT>"; break;
        case ARGUMENT_TYPE::STRING: entry += " <STRING>"; break;
        }

        printf("  %-32s %s", entry.c_str(), argument->help.c_str());
        if (argument->presence == ARGUMENT_PRESENCE::MANDATORY)
            printf(" [MANDATORY]");
        else if (!argument->defaultValue.empty())
            printf(" Default [ %s ]", argument->defaultValue.c_str());
        printf("\n");
    }
    printf("\n");
}

}
