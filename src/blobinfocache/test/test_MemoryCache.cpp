/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <vector>

#include "image/Digest.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "blobinfocache/MemoryCache.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace blobinfocache {
namespace test {

static image::Digest makeDigest(char c) {
    return image::Digest::parse("sha256:" + std::string(64, c));
}

static const auto transport = std::string{"oci"};
static const auto scope = TransportScope{"/var/lib/images"};

TEST_GROUP(MemoryCacheTestGroup) {
};

TEST(MemoryCacheTestGroup, uncompressedDigest) {
    MemoryCache cache;
    auto compressed = makeDigest('a');
    auto uncompressed = makeDigest('b');

    CHECK(cache.uncompressedDigest(compressed).empty());
    cache.recordDigestUncompressedPair(compressed, uncompressed);
    CHECK(cache.uncompressedDigest(compressed) == uncompressed);
    // an uncompressed digest maps to itself
    CHECK(cache.uncompressedDigest(uncompressed) == uncompressed);

    // conflicting records are overwritten
    auto other = makeDigest('c');
    cache.recordDigestUncompressedPair(compressed, other);
    CHECK(cache.uncompressedDigest(compressed) == other);
}

TEST(MemoryCacheTestGroup, uncompressedDigestForTOC) {
    MemoryCache cache;
    CHECK(cache.uncompressedDigestForTOC(makeDigest('1')).empty());
    cache.recordTOCUncompressedPair(makeDigest('1'), makeDigest('2'));
    CHECK(cache.uncompressedDigestForTOC(makeDigest('1')) == makeDigest('2'));
}

TEST(MemoryCacheTestGroup, candidatesRequireKnownCompression) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"here"});
    CHECK(cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{}).empty());

    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::GZIP_ALGORITHM_NAME, "", {}});
    auto candidates = cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{});
    CHECK_EQUAL(1, candidates.size());
    CHECK(candidates[0].digest == digest);
    CHECK_EQUAL(std::string{"here"}, candidates[0].location.opaque);
    CHECK(!candidates[0].unknownLocation);
    CHECK(candidates[0].compressionOperation == image::CompressionOperation::Compress);
    CHECK_EQUAL(compression::GZIP_ALGORITHM_NAME, candidates[0].compressionAlgorithm->getName());
}

TEST(MemoryCacheTestGroup, unknownCompressionForgetsData) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"here"});
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::GZIP_ALGORITHM_NAME, "", {}});
    cache.recordDigestCompressorData(digest, DigestCompressorData{UNKNOWN_COMPRESSION, "", {}});
    CHECK(cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{}).empty());
}

TEST(MemoryCacheTestGroup, specificVariantIsKept) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    auto annotations = std::map<std::string, std::string>{{compression::ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY, makeDigest('f').string()}};
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"here"});
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::ZSTD_ALGORITHM_NAME,
                                                                  compression::ZSTD_CHUNKED_ALGORITHM_NAME,
                                                                  annotations});
    // recording only the base variant keeps the specific one
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::ZSTD_ALGORITHM_NAME, "", {}});

    auto candidates = cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{});
    CHECK_EQUAL(1, candidates.size());
    CHECK_EQUAL(compression::ZSTD_CHUNKED_ALGORITHM_NAME, candidates[0].compressionAlgorithm->getName());
    CHECK(candidates[0].compressionAnnotations == annotations);

    // a required base variant still accepts the specific one
    auto options = CandidateLocationsOptions{};
    options.reuseConditions.requiredCompression = compression::Zstd;
    candidates = cache.candidateLocations(transport, scope, digest, options);
    CHECK_EQUAL(1, candidates.size());
}

TEST(MemoryCacheTestGroup, reuseConditions) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"here"});
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::ZSTD_ALGORITHM_NAME, "", {}});

    auto options = CandidateLocationsOptions{};
    options.reuseConditions.requiredCompression = compression::Gzip;
    CHECK(cache.candidateLocations(transport, scope, digest, options).empty());

    options = CandidateLocationsOptions{};
    options.reuseConditions.possibleManifestFormats = std::vector<std::string>{image::mediatype::dockerV2Schema1};
    CHECK(cache.candidateLocations(transport, scope, digest, options).empty());

    options.reuseConditions.possibleManifestFormats = std::vector<std::string>{image::mediatype::ociImageManifest};
    CHECK_EQUAL(1, cache.candidateLocations(transport, scope, digest, options).size());
}

TEST(MemoryCacheTestGroup, substitutesAreOrdered) {
    MemoryCache cache;
    auto primary = makeDigest('a');
    auto zstdVariant = makeDigest('c');
    auto uncompressed = makeDigest('b');

    cache.recordDigestUncompressedPair(primary, uncompressed);
    cache.recordDigestUncompressedPair(zstdVariant, uncompressed);
    cache.recordDigestCompressorData(primary, DigestCompressorData{compression::GZIP_ALGORITHM_NAME, "", {}});
    cache.recordDigestCompressorData(zstdVariant, DigestCompressorData{compression::ZSTD_ALGORITHM_NAME, "", {}});
    cache.recordDigestCompressorData(uncompressed, DigestCompressorData{UNCOMPRESSED, "", {}});
    cache.recordKnownLocation(transport, scope, uncompressed, LocationReference{"u"});
    cache.recordKnownLocation(transport, scope, zstdVariant, LocationReference{"z"});
    cache.recordKnownLocation(transport, scope, primary, LocationReference{"p"});

    // without substitution only exact matches are returned
    auto candidates = cache.candidateLocations(transport, scope, primary, CandidateLocationsOptions{});
    CHECK_EQUAL(1, candidates.size());
    CHECK(candidates[0].digest == primary);

    auto options = CandidateLocationsOptions{};
    options.canSubstitute = true;
    candidates = cache.candidateLocations(transport, scope, primary, options);
    CHECK_EQUAL(3, candidates.size());
    CHECK(candidates[0].digest == primary);
    CHECK(candidates[1].digest == zstdVariant);
    CHECK(candidates[2].digest == uncompressed);
    CHECK(candidates[2].compressionOperation == image::CompressionOperation::Decompress);
    CHECK(!candidates[2].compressionAlgorithm);
}

TEST(MemoryCacheTestGroup, mostRecentLocationFirst) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::GZIP_ALGORITHM_NAME, "", {}});
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"old"});
    cache.recordKnownLocation(transport, scope, digest, LocationReference{"new"});

    auto candidates = cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{});
    CHECK_EQUAL(2, candidates.size());
    CHECK_EQUAL(std::string{"new"}, candidates[0].location.opaque);
    CHECK_EQUAL(std::string{"old"}, candidates[1].location.opaque);
}

TEST(MemoryCacheTestGroup, unknownLocation) {
    MemoryCache cache;
    auto digest = makeDigest('a');
    cache.recordDigestCompressorData(digest, DigestCompressorData{compression::GZIP_ALGORITHM_NAME, "", {}});

    auto candidates = cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{});
    CHECK_EQUAL(1, candidates.size());
    CHECK(candidates[0].unknownLocation);

    // locations are per scope
    cache.recordKnownLocation(transport, TransportScope{"elsewhere"}, digest, LocationReference{"x"});
    candidates = cache.candidateLocations(transport, scope, digest, CandidateLocationsOptions{});
    CHECK(candidates[0].unknownLocation);
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
