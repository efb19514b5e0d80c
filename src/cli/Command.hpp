/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_cli_Command_hpp
#define carrier_cli_Command_hpp

#include <string>


namespace carrier {
namespace cli {

class Command {
public:
    virtual ~Command() {}
    virtual void execute() = 0;
    virtual std::string getBriefDescription() const = 0;
    virtual void printHelpMessage() const = 0;
};

}
}

#endif
