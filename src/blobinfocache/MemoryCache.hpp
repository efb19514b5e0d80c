/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_blobinfocache_MemoryCache_hpp
#define carrier_blobinfocache_MemoryCache_hpp

#include <string>
#include <vector>
#include <map>
#include <set>
#include <tuple>
#include <mutex>
#include <cstdint>

#include "blobinfocache/BlobInfoCache.hpp"


namespace carrier {
namespace blobinfocache {

/**
 * A BlobInfoCache kept in memory for the lifetime of the process.
 * All the methods are thread safe.
 */
class MemoryCache : public BlobInfoCache {
public:
    // At most this many candidates are returned, with at most
    // MAX_UNKNOWN_LOCATION_CANDIDATES of them without a known location
    static const size_t MAX_CANDIDATES = 5;
    static const size_t MAX_UNKNOWN_LOCATION_CANDIDATES = 2;

public:
    image::Digest uncompressedDigest(const image::Digest& anyDigest) override;
    void recordDigestUncompressedPair(const image::Digest& anyDigest, const image::Digest& uncompressed) override;
    image::Digest uncompressedDigestForTOC(const image::Digest& tocDigest) override;
    void recordTOCUncompressedPair(const image::Digest& tocDigest, const image::Digest& uncompressed) override;
    void recordKnownLocation(const std::string& transport, const TransportScope& scope,
                             const image::Digest& digest, const LocationReference& location) override;
    void recordDigestCompressorData(const image::Digest& anyDigest, const DigestCompressorData& data) override;
    std::vector<ReplacementCandidate> candidateLocations(const std::string& transport,
                                                         const TransportScope& scope,
                                                         const image::Digest& primaryDigest,
                                                         const CandidateLocationsOptions& options) override;

private:
    using LocationKey = std::tuple<std::string, std::string, image::Digest>;

    struct CandidateWithAge {
        ReplacementCandidate candidate;
        // Generation of the last record of the location, 0 for unknown locations
        uint64_t lastSeen;
    };

    image::Digest uncompressedDigestLocked(const image::Digest& anyDigest) const;
    void appendReplacementCandidates(std::vector<CandidateWithAge>& candidates,
                                     const std::string& transport,
                                     const TransportScope& scope,
                                     const image::Digest& digest,
                                     const CandidateLocationsOptions& options) const;
    std::vector<ReplacementCandidate> prioritize(std::vector<CandidateWithAge> candidates,
                                                 const image::Digest& primaryDigest,
                                                 const image::Digest& uncompressedDigest) const;

private:
    mutable std::mutex mutex;
    uint64_t generation = 0;
    std::map<image::Digest, image::Digest> uncompressedDigests;
    std::map<image::Digest, image::Digest> uncompressedDigestsByTOC;
    std::map<image::Digest, std::set<image::Digest>> digestsByUncompressed;
    std::map<LocationKey, std::map<std::string, uint64_t>> knownLocations;
    std::map<image::Digest, DigestCompressorData> compressors;
};

}
}

#endif
