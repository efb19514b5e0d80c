/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_utility_base64_hpp
#define libcarrier_utility_base64_hpp

#include <string>


namespace libcarrier {
namespace base64 {

std::string encode(const std::string& data);
std::string decode(const std::string& encoded);

// URL-safe alphabet with optional padding (RFC 4648 section 5), as found in JWS
std::string decodeURL(const std::string& encoded);

}}

#endif
