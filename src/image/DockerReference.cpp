/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DockerReference.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/regex.hpp"


namespace carrier {
namespace image {

const std::string DockerReference::DEFAULT_DOMAIN{"docker.io"};
const std::string DockerReference::LEGACY_DEFAULT_DOMAIN{"index.docker.io"};
const std::string DockerReference::OFFICIAL_REPOSITORY_NAMESPACE{"library"};
const std::string DockerReference::DEFAULT_TAG{"latest"};

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Image", level);
}

std::string DockerReference::getName() const {
    return domain + "/" + path;
}

std::string DockerReference::string() const {
    auto output = std::stringstream{};
    output << getName();
    if (!tag.empty()){
        output << ":" << tag;
    }
    if (!digest.empty()){
        output << "@" << digest;
    }
    return output.str();
}

bool DockerReference::isNameOnly() const {
    return tag.empty() && digest.empty();
}

DockerReference DockerReference::tagNameOnly() const {
    auto output = *this;
    if(isNameOnly()) {
        output.tag = DEFAULT_TAG;
    }
    return output;
}

DockerReference DockerReference::normalize() const {
    auto output = *this;
    if (!digest.empty() && !tag.empty()){
        output.tag.clear();
    }
    return output;
}

/**
 * Splits a repository name into domain and path. A first component which looks
 * like a host name (contains "." or ":", or is "localhost") is the domain,
 * otherwise the name refers to Docker Hub.
 */
static std::pair<std::string, std::string> splitDockerDomain(const std::string& name) {
    auto domain = std::string{};
    auto remainder = std::string{};

    auto separator = name.find('/');
    if(separator == std::string::npos) {
        domain = DockerReference::DEFAULT_DOMAIN;
        remainder = name;
    }
    else {
        auto first = name.substr(0, separator);
        if(first.find_first_of(".:") == std::string::npos && first != "localhost"
           && std::none_of(first.cbegin(), first.cend(), ::isupper)) {
            domain = DockerReference::DEFAULT_DOMAIN;
            remainder = name;
        }
        else {
            domain = first;
            remainder = name.substr(separator + 1);
        }
    }

    if(domain == DockerReference::LEGACY_DEFAULT_DOMAIN) {
        domain = DockerReference::DEFAULT_DOMAIN;
    }
    if(domain == DockerReference::DEFAULT_DOMAIN && remainder.find('/') == std::string::npos) {
        remainder = DockerReference::OFFICIAL_REPOSITORY_NAMESPACE + "/" + remainder;
    }
    return {domain, remainder};
}

/**
 * Parses a reference in the form accepted by "docker pull", e.g. "alpine",
 * "quay.io/org/image:tag" or "image@sha256:...", and normalizes it.
 */
DockerReference DockerReference::parse(const std::string& input) {
    printLog(boost::format("Parsing Docker reference from string: %s") % input, libcarrier::LogLevel::DEBUG);

    if(boost::regex_match(input, regex::anchoredIdentifier)) {
        auto message = boost::format("invalid repository name (%s), cannot specify 64-byte hexadecimal strings") % input;
        CARRIER_THROW_ERROR(message.str());
    }

    // the grammar only accepts lower case paths, validate the domain separately
    auto split = splitDockerDomain(input);
    auto pathAndSuffixes = split.second;
    auto pathEnd = pathAndSuffixes.find_first_of(":@");
    auto path = pathAndSuffixes.substr(0, pathEnd);
    if(std::any_of(path.cbegin(), path.cend(), ::isupper)) {
        auto message = boost::format("invalid reference format: repository name (%s) must be lowercase") % path;
        CARRIER_THROW_ERROR(message.str());
    }

    boost::smatch matches;
    auto canonical = split.first + "/" + pathAndSuffixes;
    if (!boost::regex_match(canonical, matches, regex::reference)) {
        auto message = boost::format("Invalid Docker reference '%s'") % input;
        CARRIER_THROW_ERROR(message.str());
    }

    auto reference = DockerReference{};
    reference.domain = split.first;
    reference.path = path;
    if (matches[2].matched) {
        reference.tag = matches[2].str();
    }
    if (matches[3].matched) {
        reference.digest = matches[3].str();
    }

    printLog(boost::format("Successfully parsed Docker reference %s") % reference, libcarrier::LogLevel::DEBUG);
    return reference;
}

bool operator==(const DockerReference& lhs, const DockerReference& rhs) {
    return lhs.domain == rhs.domain
        && lhs.path == rhs.path
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

bool operator!=(const DockerReference& lhs, const DockerReference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const DockerReference& reference) {
    os << reference.string();
    return os;
}

}
}
