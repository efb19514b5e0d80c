/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "MemoryCache.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "compression/Algorithms.hpp"


namespace carrier {
namespace blobinfocache {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "BlobInfoCache", level);
}

const size_t MemoryCache::MAX_CANDIDATES;
const size_t MemoryCache::MAX_UNKNOWN_LOCATION_CANDIDATES;

image::Digest MemoryCache::uncompressedDigest(const image::Digest& anyDigest) {
    std::lock_guard<std::mutex> lock{mutex};
    return uncompressedDigestLocked(anyDigest);
}

image::Digest MemoryCache::uncompressedDigestLocked(const image::Digest& anyDigest) const {
    auto it = uncompressedDigests.find(anyDigest);
    if(it != uncompressedDigests.cend()) {
        return it->second;
    }
    // a digest known to be the uncompressed version of other blobs is itself uncompressed
    auto others = digestsByUncompressed.find(anyDigest);
    if(others != digestsByUncompressed.cend() && !others->second.empty()) {
        return anyDigest;
    }
    return image::Digest{};
}

void MemoryCache::recordDigestUncompressedPair(const image::Digest& anyDigest, const image::Digest& uncompressed) {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = uncompressedDigests.find(anyDigest);
    if(it != uncompressedDigests.cend() && it->second != uncompressed) {
        printLog(boost::format("Uncompressed digest for blob %s previously recorded as %s, now %s")
                    % anyDigest % it->second % uncompressed,
                 libcarrier::LogLevel::WARN);
    }
    uncompressedDigests[anyDigest] = uncompressed;
    digestsByUncompressed[uncompressed].insert(anyDigest);
}

image::Digest MemoryCache::uncompressedDigestForTOC(const image::Digest& tocDigest) {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = uncompressedDigestsByTOC.find(tocDigest);
    if(it != uncompressedDigestsByTOC.cend()) {
        return it->second;
    }
    return image::Digest{};
}

void MemoryCache::recordTOCUncompressedPair(const image::Digest& tocDigest, const image::Digest& uncompressed) {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = uncompressedDigestsByTOC.find(tocDigest);
    if(it != uncompressedDigestsByTOC.cend() && it->second != uncompressed) {
        printLog(boost::format("Uncompressed digest for blob with TOC %s previously recorded as %s, now %s")
                    % tocDigest % it->second % uncompressed,
                 libcarrier::LogLevel::WARN);
    }
    uncompressedDigestsByTOC[tocDigest] = uncompressed;
}

void MemoryCache::recordKnownLocation(const std::string& transport, const TransportScope& scope,
                                      const image::Digest& digest, const LocationReference& location) {
    std::lock_guard<std::mutex> lock{mutex};
    auto key = LocationKey{transport, scope.opaque, digest};
    knownLocations[key][location.opaque] = ++generation;
}

void MemoryCache::recordDigestCompressorData(const image::Digest& anyDigest, const DigestCompressorData& newData) {
    std::lock_guard<std::mutex> lock{mutex};
    auto data = newData;
    auto it = compressors.find(anyDigest);
    if(it != compressors.cend()) {
        const auto& previous = it->second;
        if(previous.baseVariantCompressor != data.baseVariantCompressor) {
            printLog(boost::format("Base compressor for blob with digest %s previously recorded as %s, now %s")
                        % anyDigest % previous.baseVariantCompressor % data.baseVariantCompressor,
                     libcarrier::LogLevel::WARN);
        }
        else if(!previous.specificVariantCompressor.empty()
                && !data.specificVariantCompressor.empty()
                && previous.specificVariantCompressor != data.specificVariantCompressor) {
            printLog(boost::format("Specific compressor for blob with digest %s previously recorded as %s, now %s")
                        % anyDigest % previous.specificVariantCompressor % data.specificVariantCompressor,
                     libcarrier::LogLevel::WARN);
        }
        // don't forget a known specific variant when only the base variant is being recorded
        if(data.baseVariantCompressor != UNKNOWN_COMPRESSION
           && data.specificVariantCompressor.empty()
           && !previous.specificVariantCompressor.empty()) {
            data.specificVariantCompressor = previous.specificVariantCompressor;
            data.specificVariantAnnotations = previous.specificVariantAnnotations;
        }
    }
    if(data.baseVariantCompressor == UNKNOWN_COMPRESSION) {
        compressors.erase(anyDigest);
        return;
    }
    compressors[anyDigest] = data;
}

namespace {

// The compression-related fields of the candidates for a digest, or none if the digest can't be reused
boost::optional<ReplacementCandidate> makeCandidateTemplate(const image::Digest& digest,
                                                           const DigestCompressorData& data,
                                                           const CandidateLocationsOptions& options) {
    if(data.baseVariantCompressor == UNCOMPRESSED) {
        if(!image::candidateCompressionMatchesReuseConditions(options.reuseConditions, boost::none)) {
            printLog(boost::format("Ignoring BlobInfoCache record of digest %s, uncompressed format does not match the reuse conditions")
                        % digest,
                     libcarrier::LogLevel::DEBUG);
            return boost::none;
        }
        auto candidate = ReplacementCandidate{};
        candidate.digest = digest;
        candidate.compressionOperation = image::CompressionOperation::Decompress;
        return candidate;
    }
    if(data.baseVariantCompressor == UNKNOWN_COMPRESSION) {
        printLog(boost::format("Ignoring BlobInfoCache record of digest %s with unknown compression") % digest,
                 libcarrier::LogLevel::DEBUG);
        return boost::none;
    }

    if(!data.specificVariantCompressor.empty()) {
        try {
            auto algorithm = compression::algorithmByName(data.specificVariantCompressor);
            if(image::candidateCompressionMatchesReuseConditions(options.reuseConditions, algorithm)) {
                auto candidate = ReplacementCandidate{};
                candidate.digest = digest;
                candidate.compressionOperation = image::CompressionOperation::Compress;
                candidate.compressionAlgorithm = algorithm;
                candidate.compressionAnnotations = data.specificVariantAnnotations;
                return candidate;
            }
            printLog(boost::format("Ignoring specific compression variant %s for BlobInfoCache record of digest %s,"
                                   " it does not match the reuse conditions")
                        % data.specificVariantCompressor % digest,
                     libcarrier::LogLevel::DEBUG);
        }
        catch(const libcarrier::Error& e) {
            printLog(boost::format("Not considering unrecognized specific compression variant %s for digest %s: %s")
                        % data.specificVariantCompressor % digest % e.what(),
                     libcarrier::LogLevel::DEBUG);
        }
    }

    auto algorithm = compression::Algorithm{};
    try {
        algorithm = compression::algorithmByName(data.baseVariantCompressor);
    }
    catch(const libcarrier::Error& e) {
        printLog(boost::format("Ignoring BlobInfoCache record of digest %s with unrecognized compression %s: %s")
                    % digest % data.baseVariantCompressor % e.what(),
                 libcarrier::LogLevel::DEBUG);
        return boost::none;
    }
    if(!image::candidateCompressionMatchesReuseConditions(options.reuseConditions, algorithm)) {
        printLog(boost::format("Ignoring BlobInfoCache record of digest %s, compression %s does not match the reuse conditions")
                    % digest % data.baseVariantCompressor,
                 libcarrier::LogLevel::DEBUG);
        return boost::none;
    }
    auto candidate = ReplacementCandidate{};
    candidate.digest = digest;
    candidate.compressionOperation = image::CompressionOperation::Compress;
    candidate.compressionAlgorithm = algorithm;
    return candidate;
}

}

void MemoryCache::appendReplacementCandidates(std::vector<CandidateWithAge>& candidates,
                                              const std::string& transport,
                                              const TransportScope& scope,
                                              const image::Digest& digest,
                                              const CandidateLocationsOptions& options) const {
    auto data = DigestCompressorData{UNKNOWN_COMPRESSION, "", {}};
    auto compressor = compressors.find(digest);
    if(compressor != compressors.cend()) {
        data = compressor->second;
    }
    auto templ = makeCandidateTemplate(digest, data, options);
    if(!templ) {
        return;
    }

    auto locations = knownLocations.find(LocationKey{transport, scope.opaque, digest});
    if(locations != knownLocations.cend() && !locations->second.empty()) {
        for(const auto& location : locations->second) {
            auto candidate = *templ;
            candidate.location = LocationReference{location.first};
            candidates.push_back(CandidateWithAge{candidate, location.second});
        }
    }
    else {
        auto candidate = *templ;
        candidate.unknownLocation = true;
        candidates.push_back(CandidateWithAge{candidate, 0});
    }
}

std::vector<ReplacementCandidate> MemoryCache::candidateLocations(const std::string& transport,
                                                                  const TransportScope& scope,
                                                                  const image::Digest& primaryDigest,
                                                                  const CandidateLocationsOptions& options) {
    std::lock_guard<std::mutex> lock{mutex};
    auto candidates = std::vector<CandidateWithAge>{};
    appendReplacementCandidates(candidates, transport, scope, primaryDigest, options);

    auto uncompressed = image::Digest{};
    if(options.canSubstitute) {
        uncompressed = uncompressedDigestLocked(primaryDigest);
        if(!uncompressed.empty()) {
            auto others = digestsByUncompressed.find(uncompressed);
            if(others != digestsByUncompressed.cend()) {
                for(const auto& other : others->second) {
                    if(other != primaryDigest && other != uncompressed) {
                        appendReplacementCandidates(candidates, transport, scope, other, options);
                    }
                }
            }
            if(uncompressed != primaryDigest) {
                appendReplacementCandidates(candidates, transport, scope, uncompressed, options);
            }
        }
    }
    return prioritize(std::move(candidates), primaryDigest, uncompressed);
}

/**
 * Orders the candidates: the primary digest first, then the other compressed
 * variants, then the uncompressed digest. Within a group, the most recently
 * seen locations come first.
 */
std::vector<ReplacementCandidate> MemoryCache::prioritize(std::vector<CandidateWithAge> candidates,
                                                          const image::Digest& primaryDigest,
                                                          const image::Digest& uncompressedDigest) const {
    auto rank = [&](const image::Digest& digest) {
        if(digest == primaryDigest) {
            return 0;
        }
        if(!uncompressedDigest.empty() && digest == uncompressedDigest) {
            return 2;
        }
        return 1;
    };
    std::stable_sort(candidates.begin(), candidates.end(), [&](const CandidateWithAge& lhs, const CandidateWithAge& rhs) {
        auto lhsRank = rank(lhs.candidate.digest);
        auto rhsRank = rank(rhs.candidate.digest);
        if(lhsRank != rhsRank) {
            return lhsRank < rhsRank;
        }
        if(lhs.lastSeen != rhs.lastSeen) {
            return lhs.lastSeen > rhs.lastSeen;
        }
        return lhs.candidate.digest < rhs.candidate.digest;
    });

    auto result = std::vector<ReplacementCandidate>{};
    auto unknown = std::vector<ReplacementCandidate>{};
    for(const auto& candidate : candidates) {
        if(candidate.candidate.unknownLocation) {
            unknown.push_back(candidate.candidate);
        }
        else if(result.size() < MAX_CANDIDATES) {
            result.push_back(candidate.candidate);
        }
    }
    auto remaining = MAX_CANDIDATES - result.size();
    for(size_t i=0; i<unknown.size() && i<remaining && i<MAX_UNKNOWN_LOCATION_CANDIDATES; ++i) {
        result.push_back(unknown[i]);
    }
    return result;
}

}
}
