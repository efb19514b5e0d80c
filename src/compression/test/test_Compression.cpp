/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <map>
#include <string>

#include "image/Digest.hpp"
#include "stream/StringReader.hpp"
#include "stream/PeekableReader.hpp"
#include "compression/Algorithms.hpp"
#include "compression/Detection.hpp"
#include "compression/Compressor.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace compression {
namespace test {

static std::string makeContent() {
    auto content = std::string{};
    for(int i=0; i<50000; ++i) {
        content += "layer content line " + std::to_string(i) + "\n";
    }
    return content;
}

static std::string compress(const Algorithm& algorithm, const std::string& content,
                            std::map<std::string, std::string>& annotations) {
    auto source = stream::StringReader{content};
    auto compressor = newCompressor(algorithm, source, boost::none, annotations);
    return stream::readAll(*compressor);
}

static std::string decompress(const Algorithm& algorithm, const std::string& compressed) {
    auto source = stream::StringReader{compressed};
    auto decompressor = newDecompressor(algorithm, source);
    return stream::readAll(*decompressor);
}

static boost::optional<Algorithm> detect(const std::string& data,
                                         const std::map<std::string, std::string>& annotations = {}) {
    auto source = stream::StringReader{data};
    auto reader = stream::PeekableReader{source};
    auto algorithm = detectCompressionFormat(reader, annotations);
    // detection doesn't consume the stream
    CHECK(stream::readAll(reader) == data);
    return algorithm;
}

TEST_GROUP(CompressionTestGroup) {
};

TEST(CompressionTestGroup, algorithmByName) {
    CHECK(algorithmByName("gzip") == Gzip);
    CHECK(algorithmByName("zstd:chunked") == ZstdChunked);
    CHECK_EQUAL(ZstdChunked.getBaseVariantName(), std::string{"zstd"});
    CHECK_EQUAL(Gzip.getBaseVariantName(), std::string{"gzip"});
    CHECK_THROWS(libcarrier::Error, algorithmByName("lz4"));
}

TEST(CompressionTestGroup, roundTrip) {
    auto content = makeContent();
    for(const auto& algorithm : {Gzip, Xz, Zstd, ZstdChunked}) {
        auto annotations = std::map<std::string, std::string>{};
        auto compressed = compress(algorithm, content, annotations);
        CHECK(compressed.size() < content.size());
        CHECK(decompress(algorithm, compressed) == content);
    }
}

TEST(CompressionTestGroup, level) {
    auto content = makeContent();
    auto annotations = std::map<std::string, std::string>{};
    auto source = stream::StringReader{content};
    auto compressor = newCompressor(Gzip, source, 1, annotations);
    auto compressed = stream::readAll(*compressor);
    CHECK(decompress(Gzip, compressed) == content);
}

TEST(CompressionTestGroup, bzip2IsDecompressOnly) {
    auto annotations = std::map<std::string, std::string>{};
    auto source = stream::StringReader{"data"};
    CHECK_THROWS(libcarrier::Error, newCompressor(Bzip2, source, boost::none, annotations));
}

TEST(CompressionTestGroup, zstdChunkedRecordsTOCDigest) {
    auto content = makeContent();
    auto annotations = std::map<std::string, std::string>{};
    auto compressed = compress(ZstdChunked, content, annotations);
    CHECK(annotations.count(ZSTD_CHUNKED_CONTENT_DIGEST_KEY) == 1);
    CHECK(image::Digest::parse(annotations[ZSTD_CHUNKED_CONTENT_DIGEST_KEY]) == image::Digest::fromBytes(content));
    // no table of contents is written, so the key read by other tools stays unset
    CHECK(annotations.count(ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY) == 0);

    // plain zstd records nothing
    auto plainAnnotations = std::map<std::string, std::string>{};
    compress(Zstd, content, plainAnnotations);
    CHECK(plainAnnotations.empty());
}

TEST(CompressionTestGroup, detectMagicBytes) {
    CHECK(*detect(std::string{"\x1F\x8B\x08\x00rest", 8}) == Gzip);
    CHECK(*detect("BZh91AY&SY") == Bzip2);
    CHECK(*detect(std::string{"\xFD\x37\x7A\x58\x5A\x00\x00", 7}) == Xz);
    CHECK(*detect(std::string{"\x28\xB5\x2F\xFD\x04", 5}) == Zstd);
    CHECK(!detect("plain tar content"));
    CHECK(!detect(""));
    // truncated magic
    CHECK(!detect(std::string{"\xFD\x37\x7A", 3}));
}

TEST(CompressionTestGroup, detectCompressedStreams) {
    auto content = makeContent();
    for(const auto& algorithm : {Gzip, Xz, Zstd}) {
        auto annotations = std::map<std::string, std::string>{};
        CHECK(*detect(compress(algorithm, content, annotations)) == algorithm);
    }
}

TEST(CompressionTestGroup, detectZstdChunked) {
    auto zstdData = std::string{"\x28\xB5\x2F\xFD\x04", 5};
    auto annotations = std::map<std::string, std::string>{
        {ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY, image::Digest::fromBytes("toc").string()}
    };
    CHECK(*detect(zstdData, annotations) == ZstdChunked);

    annotations[ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY] = "not a digest";
    CHECK(*detect(zstdData, annotations) == Zstd);

    // the annotation is meaningless for other formats
    annotations[ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY] = image::Digest::fromBytes("toc").string();
    CHECK(*detect(std::string{"\x1F\x8B\x08\x00", 4}, annotations) == Gzip);
}

TEST(CompressionTestGroup, detectOwnZstdChunkedOutput) {
    auto content = makeContent();
    auto annotations = std::map<std::string, std::string>{};
    auto compressed = compress(ZstdChunked, content, annotations);
    CHECK(*detect(compressed, annotations) == ZstdChunked);
    CHECK(getTOCDigest(annotations) == image::Digest::fromBytes(content));

    annotations[ZSTD_CHUNKED_CONTENT_DIGEST_KEY] = "not a digest";
    CHECK(*detect(compressed, annotations) == Zstd);
}

TEST(CompressionTestGroup, invalidInput) {
    CHECK_THROWS(libcarrier::Error, decompress(Gzip, "this is not a gzip stream"));
    CHECK_THROWS(libcarrier::Error, decompress(Xz, "this is not an xz stream"));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
