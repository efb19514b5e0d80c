/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_CLI_hpp
#define carrier_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "libcarrier/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace carrier {
namespace cli {

class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libcarrier::CLIArguments&, std::shared_ptr<common::Config>) const;

// these methods are public for test purpose
public:
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    std::unique_ptr<cli::Command> parseCommandHelpOfCommand(const libcarrier::CLIArguments&) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
