/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libcarrier/Logger.hpp"
#include "libcarrier/Error.hpp"
#include "cli/CommandCopy.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandVersion.hpp"


namespace carrier {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandCopy>("copy");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    validateCommandName(commandName);
    auto it = map.find(commandName);
    return it->second();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libcarrier::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    validateCommandName(commandName);
    auto it = mapWithArguments.find(commandName);
    return it->second(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    auto ptr = new cli::CommandHelpOfCommand{std::move(commandObject)};
    return std::unique_ptr<cli::Command>{ptr};
}

void CommandObjectsFactory::validateCommandName(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        auto message = boost::format("'%s' is not a carrier command\nSee 'carrier help'")
            % commandName;
        libcarrier::Logger::getInstance().log(message, "CommandObjectsFactory", libcarrier::LogLevel::GENERAL, std::cerr);
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::DEBUG);
    }
}

}
}
