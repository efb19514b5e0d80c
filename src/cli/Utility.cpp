/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cstring>


namespace carrier {
namespace cli {
namespace utility {

static bool hasDashPrefix(const char* s) {
    bool result = strlen(s) > 1 && s[0]=='-' && s[1]!='-';
    return result;
}

static bool hasDashDashPrefix(const char* s) {
    bool result = strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
    return result;
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    bool result = option->semantic()->max_tokens() > 0;
    return result;
}

static libcarrier::CLIArguments::const_iterator processPossibleValueInNextToken(libcarrier::CLIArguments::const_iterator arg,
        libcarrier::CLIArguments::const_iterator argsEnd, libcarrier::CLIArguments& argsGroup) {
    // always include the current token (the option)
    argsGroup.push_back(*arg);

    // if next arg token exists and does not start with dash it's the value: include it and skip over
    auto nextArg = arg+1;
    if (nextArg != argsEnd) {
        if(!hasDashPrefix(*nextArg)){
            argsGroup.push_back(*nextArg);
            ++arg;
        }
    }

    return arg;
}

static libcarrier::CLIArguments::const_iterator processDashDashOption(libcarrier::CLIArguments::const_iterator arg,
        libcarrier::CLIArguments::const_iterator argsEnd, libcarrier::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // adjacent style already provides the value
    if(argString.find('=') != std::string::npos) {
        argsGroup.push_back(argString);
    }
    else {
        auto argName = argString.substr(2);
        auto argOption = optionsDescription.find_nothrow(argName, false);

        // unknown option: Boost reports it later
        if(!argOption) {
            argsGroup.push_back(*arg);
            return arg;
        }

        if(optionTakesValue(argOption)) {
            arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
        }
        else {
            argsGroup.push_back(*arg);
        }
    }

    return arg;
}

static libcarrier::CLIArguments::const_iterator processDashOption(libcarrier::CLIArguments::const_iterator arg,
        libcarrier::CLIArguments::const_iterator argsEnd, libcarrier::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};
    auto argSubstring = argString.substr(1);

    for(auto it = argSubstring.cbegin(); it != argSubstring.cend(); ++it) {
        auto findArg = std::string{"-"} + *it;
        auto argOption = optionsDescription.find_nothrow(findArg, false);

        if(!argOption) {
            argsGroup.push_back(*arg);
            break;
        }

        if(optionTakesValue(argOption)) {
            if(it+1 == argSubstring.end()) {
                arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
            }
            else {
                argsGroup.push_back(*arg);
                break;
            }
        }
        else {
            // the token may continue with "sticky" short options
            if(it+1 == argSubstring.end()) {
                argsGroup.push_back(*arg);
            }
        }
    }

    return arg;
}

std::tuple<libcarrier::CLIArguments, libcarrier::CLIArguments> groupOptionsAndPositionalArguments(
        const libcarrier::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libcarrier::CLIArguments, libcarrier::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    // the first group starts with the name of the program or command
    if(isOption(args.argv()[0])) {
        auto message = boost::format("Expected a program or command name as first argument, got '%s'") % args.argv()[0];
        CARRIER_THROW_ERROR(message.str());
    }
    nameAndOptionArgs.push_back(args.argv()[0]);

    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libcarrier::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processDashDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else if(hasDashPrefix(*arg)) {
            arg = processDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libcarrier::CLIArguments, libcarrier::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libcarrier::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'carrier help %s'") % quantity % command % command;
        printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
    }
}

void printLog(const std::string& message, libcarrier::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libcarrier::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libcarrier::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
