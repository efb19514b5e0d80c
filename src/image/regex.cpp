/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "image/regex.hpp"

#include <sstream>


namespace carrier {
namespace image {
namespace regex {
namespace strings {

// Lower case characters and digits only
const std::string alphaNumeric{"[a-z0-9]+"};

// One period, one or two underscores, or any number of dashes
const std::string separator{"(?:[._]|__|[-]+)"};

const std::string pathComponent = concatenate({ alphaNumeric,
                                                optional(repeated(separator + alphaNumeric))
                                              });

const std::string domainNameComponent{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};

// Compressed or uncompressed IPv6 in brackets, no zone identifiers
const std::string ipv6Address{"\\[(?:[a-fA-F0-9:]+)\\]"};

const std::string port{"\\:[0-9]+"};

const std::string domainName = concatenate({ domainNameComponent,
                                             optional(repeated("\\." + domainNameComponent))
                                           });

const std::string host = group(concatenate({domainName, "|", ipv6Address}));

const std::string domain = host + optional(port);

// One or more slash-delimited path components, e.g. "library/alpine"
const std::string remoteName = concatenate({ pathComponent,
                                             optional(repeated("\\/" + pathComponent))
                                           });

const std::string name = concatenate({ optional(domain + "\\/"),
                                       remoteName
                                     });

const std::string tag{"[\\w][\\w.-]{0,127}"};

const std::string digest{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};

// Capturing groups: 1 name, 2 tag, 3 digest
const std::string reference = anchored(capture(name)
                                       + optional("\\:" + capture(tag))
                                       + optional("\\@" + capture(digest))
                                      );

// A full image ID, not accepted as a repository name
const std::string identifier{"[a-f0-9]{64}"};

std::string concatenate(const std::initializer_list<std::string> expr) {
    auto output = std::stringstream{};
    for (const auto& exp : expr) {
        output << exp;
    }
    return output.str();
}

std::string optional(const std::string& expr) {
    return group(expr) + "?";
}

std::string repeated(const std::string& expr) {
    return group(expr) + "+";
}

// Non-capturing
std::string group(const std::string& expr) {
    return "(?:" + expr + ")";
}

std::string capture(const std::string& expr) {
    return "(" + expr + ")";
}

std::string anchored(const std::string& expr) {
    return "^" + expr + "$";
}

} // namespace

const boost::regex domain(strings::domain);
const boost::regex name(strings::name);
const boost::regex tag(strings::tag);
const boost::regex digest(strings::digest);
const boost::regex reference(strings::reference);
const boost::regex anchoredIdentifier(strings::anchored(strings::identifier));

} // namespace
} // namespace
} // namespace
