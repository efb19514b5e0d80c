/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Detection.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Digest.hpp"
#include "compression/Algorithms.hpp"


namespace carrier {
namespace compression {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Compression", level);
}

boost::optional<Algorithm> detectCompression(stream::PeekableReader& reader) {
    auto longestPrefix = size_t{0};
    for(const auto& algorithm : getAlgorithms()) {
        longestPrefix = std::max(longestPrefix, algorithm.getPrefix().size());
    }

    const auto& header = reader.peek(longestPrefix);
    for(const auto& algorithm : getAlgorithms()) {
        const auto& prefix = algorithm.getPrefix();
        if(!prefix.empty() && header.size() >= prefix.size() && header.compare(0, prefix.size(), prefix) == 0) {
            printLog(boost::format("Detected compression format %s") % algorithm.getName(), libcarrier::LogLevel::DEBUG);
            return algorithm;
        }
    }
    printLog(boost::format("No compression detected"), libcarrier::LogLevel::DEBUG);
    return boost::none;
}

static std::map<std::string, std::string>::const_iterator findTOCDigest(const std::map<std::string, std::string>& annotations) {
    auto it = annotations.find(ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY);
    if(it != annotations.cend()) {
        return it;
    }
    return annotations.find(ZSTD_CHUNKED_CONTENT_DIGEST_KEY);
}

static bool hasValidTOCDigest(const std::map<std::string, std::string>& annotations) {
    auto it = findTOCDigest(annotations);
    if(it == annotations.cend()) {
        return false;
    }
    try {
        image::Digest::parse(it->second);
    }
    catch(libcarrier::Error& e) {
        printLog(boost::format("Ignoring invalid TOC digest annotation \"%s\": %s") % it->second % e.what(),
                 libcarrier::LogLevel::WARN);
        return false;
    }
    return true;
}

image::Digest getTOCDigest(const std::map<std::string, std::string>& annotations) {
    auto it = findTOCDigest(annotations);
    if(it == annotations.cend()) {
        return image::Digest{};
    }
    try {
        return image::Digest::parse(it->second);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("Failed to parse TOC digest annotation \"%s\"") % it->second;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

boost::optional<Algorithm> detectCompressionFormat(stream::PeekableReader& reader,
                                                   const std::map<std::string, std::string>& annotations) {
    auto algorithm = detectCompression(reader);
    if(algorithm && *algorithm == Zstd && hasValidTOCDigest(annotations)) {
        return ZstdChunked;
    }
    return algorithm;
}

}
}
