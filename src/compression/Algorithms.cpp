/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Algorithms.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace compression {

const Algorithm Gzip{GZIP_ALGORITHM_NAME, "", std::string{"\x1F\x8B\x08", 3}};
const Algorithm Bzip2{BZIP2_ALGORITHM_NAME, "", std::string{"\x42\x5A\x68", 3}};
const Algorithm Xz{XZ_ALGORITHM_NAME, "", std::string{"\xFD\x37\x7A\x58\x5A\x00", 6}};
const Algorithm Zstd{ZSTD_ALGORITHM_NAME, "", std::string{"\x28\xB5\x2F\xFD", 4}};
const Algorithm ZstdChunked{ZSTD_CHUNKED_ALGORITHM_NAME, ZSTD_ALGORITHM_NAME, ""};

const std::string ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY{"io.github.containers.zstd-chunked.manifest-checksum"};
const std::string ZSTD_CHUNKED_CONTENT_DIGEST_KEY{"org.carrier.zstd-chunked.content-digest"};

const std::vector<Algorithm>& getAlgorithms() {
    static const auto algorithms = std::vector<Algorithm>{ Gzip, Bzip2, Xz, Zstd, ZstdChunked };
    return algorithms;
}

Algorithm algorithmByName(const std::string& name) {
    for(const auto& algorithm : getAlgorithms()) {
        if(algorithm.getName() == name) {
            return algorithm;
        }
    }
    auto message = boost::format("cannot find compressor for \"%s\"") % name;
    CARRIER_THROW_ERROR(message.str());
}

}
}
