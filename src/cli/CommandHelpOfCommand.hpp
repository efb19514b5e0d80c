/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_CommandHelpOfCommand_hpp
#define carrier_cli_CommandHelpOfCommand_hpp

#include <memory>

#include "libcarrier/Error.hpp"
#include "cli/Command.hpp"

namespace carrier {
namespace cli {

class CommandHelpOfCommand : public Command {
public:
    CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        command->printHelpMessage();
    }

    std::string getBriefDescription() const override {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "This function must not be executed."
                                  " The developer should review the program's logic.");
    }

    void printHelpMessage() const override {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, "This function must not be executed."
                                  " The developer should review the program's logic.");
    }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
