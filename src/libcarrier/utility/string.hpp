/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef libcarrier_utility_string_hpp
#define libcarrier_utility_string_hpp

#include <string>
#include <vector>


namespace libcarrier {
namespace string {

std::string generateRandom(size_t size);
std::string join(const std::vector<std::string>& elements, const std::string& separator);
std::string quote(const std::string&);

}}

#endif
