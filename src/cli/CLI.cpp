/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CLI.hpp"

#include <iostream>
#include <string>
#include <tuple>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace carrier {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libcarrier::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    boost::program_options::variables_map values;
    auto factory = cli::CommandObjectsFactory{};
    auto& logger = libcarrier::Logger::getInstance();

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values); // throw if options are invalid
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'carrier help'") % e.what();
        logger.log(message, "CLI", libcarrier::LogLevel::GENERAL, std::cerr);
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
    }

    if(values.count("debug")) {
        logger.setLevel(libcarrier::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libcarrier::LogLevel::INFO);
    }
    else {
        logger.setLevel(libcarrier::LogLevel::WARN);
    }

    // --help and --version override other arguments and options
    if(values.count("help")) {
        return factory.makeCommandObject("help", libcarrier::CLIArguments{}, std::move(conf));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libcarrier::CLIArguments{}, std::move(conf));
    }

    if(positionalArgs.argc() == 0) {
        return factory.makeCommandObject("help");
    }

    auto commandName = std::string{positionalArgs.argv()[0]};

    bool isCommandHelpFollowedByAnArgument = commandName == "help" && positionalArgs.argc() > 1;
    if(isCommandHelpFollowedByAnArgument) {
        return parseCommandHelpOfCommand(positionalArgs);
    }

    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libcarrier::CLIArguments& args) const {
    auto optionsDescription = boost::program_options::options_description();
    libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    if(nameAndOptionArgs.argc() > 1) {
        auto message = boost::format("Command 'help' doesn't support options");
        utility::printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
    }
    if(positionalArgs.argc() > 1) {
        auto message = boost::format("Too many arguments for command 'help'"
                                     "\nSee 'carrier help help'");
        utility::printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
    }
    auto factory = cli::CommandObjectsFactory{};
    auto commandName = std::string{ positionalArgs.argv()[0] };
    return factory.makeCommandObjectHelpOfCommand(commandName);
}

} // namespace
} // namespace
