/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef libcarrier_utility_process_hpp
#define libcarrier_utility_process_hpp

#include <string>


namespace libcarrier {
namespace process {

std::string getHostname();
std::string getArchitecture();
std::string getOperatingSystem();

}}

#endif
