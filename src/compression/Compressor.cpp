/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Compressor.hpp"

#include <cstdint>
#include <string>

#include <boost/format.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/lzma.hpp>
#include <boost/iostreams/filter/zstd.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/Digester.hpp"
#include "compression/Algorithms.hpp"
#include "stream/FilteredReader.hpp"


namespace carrier {
namespace compression {

namespace io = boost::iostreams;

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Compression", level);
}

namespace {

/**
 * Compresses the source with a Boost.Iostreams filter. For zstd:chunked, the
 * uncompressed content is hashed on the way in and its digest is recorded as
 * table of contents digest at end of stream.
 */
class CompressingReader : public stream::Reader {
public:
    CompressingReader(stream::Reader& source, std::map<std::string, std::string>& annotations, bool recordTOC)
        : tap(source, recordTOC)
        , filtered{tap}
        , annotations(annotations)
    {}

    template<class Filter>
    void push(const Filter& filter) {
        filtered.push(filter);
    }

    size_t read(char* buffer, size_t size) override {
        auto bytes = filtered.read(buffer, size);
        if(bytes == 0 && size > 0 && tap.recordTOC && !annotationsWritten) {
            annotations[ZSTD_CHUNKED_CONTENT_DIGEST_KEY] = tap.digester.digest().string();
            annotationsWritten = true;
        }
        return bytes;
    }

private:
    class HashingTap : public stream::Reader {
    public:
        HashingTap(stream::Reader& source, bool recordTOC) : source(source), recordTOC{recordTOC} {}
        size_t read(char* buffer, size_t size) override {
            auto bytes = source.read(buffer, size);
            if(recordTOC) {
                digester.update(buffer, bytes);
            }
            return bytes;
        }
        stream::Reader& source;
        bool recordTOC;
        image::Digester digester;
    };

    HashingTap tap;
    stream::FilteredReader filtered;
    std::map<std::string, std::string>& annotations;
    bool annotationsWritten = false;
};

}

std::unique_ptr<stream::Reader> newCompressor(const Algorithm& algorithm,
                                              stream::Reader& source,
                                              const boost::optional<int>& level,
                                              std::map<std::string, std::string>& annotations) {
    printLog(boost::format("Compressing with %s (level %s)") % algorithm.getName() % (level ? std::to_string(*level) : "default"),
             libcarrier::LogLevel::DEBUG);

    const auto& name = algorithm.getName();
    auto reader = std::unique_ptr<CompressingReader>{
        new CompressingReader{source, annotations, name == ZSTD_CHUNKED_ALGORITHM_NAME}
    };
    if(name == GZIP_ALGORITHM_NAME) {
        reader->push(io::gzip_compressor{io::gzip_params{level ? *level : io::gzip::default_compression}});
    }
    else if(name == XZ_ALGORITHM_NAME) {
        reader->push(io::lzma_compressor{io::lzma_params{level ? static_cast<uint32_t>(*level) : io::lzma::default_compression}});
    }
    else if(name == ZSTD_ALGORITHM_NAME || name == ZSTD_CHUNKED_ALGORITHM_NAME) {
        reader->push(io::zstd_compressor{io::zstd_params{level ? static_cast<uint32_t>(*level) : io::zstd::default_compression}});
    }
    else if(name == BZIP2_ALGORITHM_NAME) {
        CARRIER_THROW_ERROR("bzip2 compression not supported");
    }
    else {
        auto message = boost::format("cannot find compressor for \"%s\"") % name;
        CARRIER_THROW_ERROR(message.str());
    }
    return std::move(reader);
}

std::unique_ptr<stream::Reader> newDecompressor(const Algorithm& algorithm, stream::Reader& source) {
    auto reader = std::unique_ptr<stream::FilteredReader>{new stream::FilteredReader{source}};
    const auto& name = algorithm.getBaseVariantName();
    if(name == GZIP_ALGORITHM_NAME) {
        reader->push(io::gzip_decompressor{});
    }
    else if(name == BZIP2_ALGORITHM_NAME) {
        reader->push(io::bzip2_decompressor{});
    }
    else if(name == XZ_ALGORITHM_NAME) {
        reader->push(io::lzma_decompressor{});
    }
    else if(name == ZSTD_ALGORITHM_NAME) {
        reader->push(io::zstd_decompressor{});
    }
    else {
        auto message = boost::format("cannot find decompressor for \"%s\"") % algorithm.getName();
        CARRIER_THROW_ERROR(message.str());
    }
    return std::move(reader);
}

}
}
