/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Digest.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libcarrier/Error.hpp"
#include "image/Digester.hpp"


namespace carrier {
namespace image {

const std::string Digest::SHA256{"sha256"};
const std::string Digest::SHA512{"sha512"};

Digest::Digest(const std::string& algorithm, const std::string& encoded)
    : algorithm{algorithm}
    , encoded{encoded}
{}

Digest Digest::parse(const std::string& digest) {
    static const auto pattern = boost::regex{"^([a-z0-9]+(?:[.+_-][a-z0-9]+)*):([a-zA-Z0-9=_-]+)$"};

    auto matches = boost::smatch{};
    if(!boost::regex_match(digest, matches, pattern)) {
        auto message = boost::format("invalid digest %s: invalid checksum digest format") % digest;
        CARRIER_THROW_ERROR(message.str());
    }

    auto algorithm = matches[1].str();
    auto encoded = matches[2].str();

    auto expectedLength = size_t{};
    if(algorithm == SHA256) {
        expectedLength = 64;
    }
    else if(algorithm == SHA512) {
        expectedLength = 128;
    }
    else {
        auto message = boost::format("invalid digest %s: unsupported digest algorithm") % digest;
        CARRIER_THROW_ERROR(message.str());
    }

    static const auto hexPattern = boost::regex{"^[a-f0-9]*$"};
    if(encoded.size() != expectedLength || !boost::regex_match(encoded, hexPattern)) {
        auto message = boost::format("invalid digest %s: invalid checksum digest length") % digest;
        CARRIER_THROW_ERROR(message.str());
    }

    return Digest{algorithm, encoded};
}

Digest Digest::fromBytes(const std::string& data, const std::string& algorithm) {
    auto digester = Digester{algorithm};
    digester.update(data.data(), data.size());
    return digester.digest();
}

std::string Digest::string() const {
    if(empty()) {
        return "";
    }
    return algorithm + ":" + encoded;
}

bool Digest::isSupportedAlgorithm(const std::string& algorithm) {
    return algorithm == SHA256 || algorithm == SHA512;
}

bool operator==(const Digest& lhs, const Digest& rhs) {
    return lhs.getAlgorithm() == rhs.getAlgorithm() && lhs.getEncoded() == rhs.getEncoded();
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Digest& lhs, const Digest& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    os << digest.string();
    return os;
}

}
}
