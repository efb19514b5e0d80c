/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_Utility_hpp
#define carrier_cli_Utility_hpp

#include <string>
#include <tuple>
#include <iostream>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libcarrier/Logger.hpp"
#include "libcarrier/Error.hpp"
#include "libcarrier/CLIArguments.hpp"

namespace carrier {
namespace cli {
namespace utility {

std::tuple<libcarrier::CLIArguments, libcarrier::CLIArguments> groupOptionsAndPositionalArguments(
        const libcarrier::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libcarrier::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

void printLog(  const std::string& message, libcarrier::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libcarrier::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
