/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "string.hpp"

#include <random>
#include <sstream>
#include <iomanip>

#include <boost/algorithm/string/join.hpp>

/**
 * Utility functions for string manipulation
 */

namespace libcarrier {
namespace string {

std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        auto randomCharacter = 'a' + dist(generator);
        string[i] = randomCharacter;
    }

    return string;
}

std::string join(const std::vector<std::string>& elements, const std::string& separator) {
    return boost::algorithm::join(elements, separator);
}

/**
 * Wraps the string in double quotes, escaping quotes, backslashes and
 * non-printable characters, so that values embedded in error messages
 * remain unambiguous.
 */
std::string quote(const std::string& input) {
    auto output = std::ostringstream{};
    output << '"';
    for(auto c : input) {
        auto u = static_cast<unsigned char>(c);
        if(c == '"' || c == '\\') {
            output << '\\' << c;
        }
        else if(c == '\n') {
            output << "\\n";
        }
        else if(c == '\t') {
            output << "\\t";
        }
        else if(u < 0x20 || u == 0x7f) {
            output << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(u) << std::dec;
        }
        else {
            output << c;
        }
    }
    output << '"';
    return output.str();
}

}}
