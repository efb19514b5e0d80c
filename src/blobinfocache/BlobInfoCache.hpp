/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_blobinfocache_BlobInfoCache_hpp
#define carrier_blobinfocache_BlobInfoCache_hpp

#include <string>
#include <vector>
#include <map>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/Manifest.hpp"
#include "compression/Algorithm.hpp"


namespace carrier {
namespace blobinfocache {

// Opaque identifier of a scope within a transport, e.g. a repository
struct TransportScope {
    std::string opaque;
};

// Opaque location of a blob within a transport scope
struct LocationReference {
    std::string opaque;
};

// Compressor names recorded for digests which don't denote a specific algorithm
extern const std::string UNCOMPRESSED;
extern const std::string UNKNOWN_COMPRESSION;

// What is known about how a blob was compressed
struct DigestCompressorData {
    // An algorithm name, UNCOMPRESSED or UNKNOWN_COMPRESSION
    std::string baseVariantCompressor;
    // A specific variant (e.g. zstd:chunked) if known, empty otherwise
    std::string specificVariantCompressor;
    // Annotations the specific variant requires, e.g. the TOC digest
    std::map<std::string, std::string> specificVariantAnnotations;
};

struct CandidateLocationsOptions {
    // Allow returning blobs with a different digest but the same uncompressed content
    bool canSubstitute = false;
    image::ReuseConditions reuseConditions;
};

// A blob which may be reused instead of the requested one
struct ReplacementCandidate {
    image::Digest digest;
    image::CompressionOperation compressionOperation = image::CompressionOperation::PreserveOriginal;
    boost::optional<compression::Algorithm> compressionAlgorithm;
    std::map<std::string, std::string> compressionAnnotations;
    // The blob is known to exist somewhere in the scope, without a precise location
    bool unknownLocation = false;
    LocationReference location;
};

/**
 * Records what is known about blobs across copies: uncompressed digests, table
 * of contents digests, locations and compression. All recordings are additive.
 * Implementations must be safe for concurrent use.
 */
class BlobInfoCache {
public:
    virtual ~BlobInfoCache() = default;

    // Empty Digest if not known
    virtual image::Digest uncompressedDigest(const image::Digest& anyDigest) = 0;
    virtual void recordDigestUncompressedPair(const image::Digest& anyDigest, const image::Digest& uncompressed) = 0;
    virtual image::Digest uncompressedDigestForTOC(const image::Digest& tocDigest) = 0;
    virtual void recordTOCUncompressedPair(const image::Digest& tocDigest, const image::Digest& uncompressed) = 0;
    virtual void recordKnownLocation(const std::string& transport, const TransportScope& scope,
                                     const image::Digest& digest, const LocationReference& location) = 0;
    virtual void recordDigestCompressorData(const image::Digest& anyDigest, const DigestCompressorData& data) = 0;
    // Candidates for reusing primaryDigest, best first
    virtual std::vector<ReplacementCandidate> candidateLocations(const std::string& transport,
                                                                 const TransportScope& scope,
                                                                 const image::Digest& primaryDigest,
                                                                 const CandidateLocationsOptions& options) = 0;
};

}
}

#endif
