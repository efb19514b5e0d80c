/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_blobinfocache_NoCache_hpp
#define carrier_blobinfocache_NoCache_hpp

#include "blobinfocache/BlobInfoCache.hpp"


namespace carrier {
namespace blobinfocache {

// A cache which records nothing, for reads of blobs not worth remembering (e.g. configs)
class NoCache : public BlobInfoCache {
public:
    image::Digest uncompressedDigest(const image::Digest&) override {
        return image::Digest{};
    }
    void recordDigestUncompressedPair(const image::Digest&, const image::Digest&) override {}
    image::Digest uncompressedDigestForTOC(const image::Digest&) override {
        return image::Digest{};
    }
    void recordTOCUncompressedPair(const image::Digest&, const image::Digest&) override {}
    void recordKnownLocation(const std::string&, const TransportScope&,
                             const image::Digest&, const LocationReference&) override {}
    void recordDigestCompressorData(const image::Digest&, const DigestCompressorData&) override {}
    std::vector<ReplacementCandidate> candidateLocations(const std::string&, const TransportScope&,
                                                         const image::Digest&,
                                                         const CandidateLocationsOptions&) override {
        return {};
    }
};

}
}

#endif
