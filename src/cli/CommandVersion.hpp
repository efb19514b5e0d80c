/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_CommandVersion_hpp
#define carrier_cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include "libcarrier/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"


namespace carrier {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libcarrier::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        libcarrier::Logger::getInstance().log(conf->buildTime.version, "CommandVersion", libcarrier::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the carrier version information";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("carrier version")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libcarrier::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libcarrier::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the version command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'version' doesn't support options"
                                         "\nSee 'carrier help version'");
            utility::printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
            CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libcarrier::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
