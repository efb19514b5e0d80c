/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_CommandHelp_hpp
#define carrier_cli_CommandHelp_hpp

#include <iostream>
#include <algorithm>

#include "common/Config.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace carrier {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libcarrier::CLIArguments& args, std::shared_ptr<common::Config>) {
        auto optionsDescription = boost::program_options::options_description();
        libcarrier::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'help' doesn't support options");
            utility::printLog(message, libcarrier::LogLevel::GENERAL, std::cerr);
            CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout
        << "Usage: carrier COMMAND\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        auto commandNames = factory.getCommandNames();
        std::sort(commandNames.begin(), commandNames.end());
        for(const auto& name : commandNames) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("carrier help [COMMAND]")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }
};

}
}

#endif
