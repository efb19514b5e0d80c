/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_compression_Detection_hpp
#define carrier_compression_Detection_hpp

#include <map>
#include <string>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "compression/Algorithm.hpp"
#include "stream/PeekableReader.hpp"


namespace carrier {
namespace compression {

/**
 * Detects the compression of a stream from its leading bytes. Returns none for
 * uncompressed (or unrecognized) data. The peeked bytes are not consumed.
 */
boost::optional<Algorithm> detectCompression(stream::PeekableReader& reader);

/**
 * As detectCompression, but also recognizes zstd:chunked blobs, which are
 * valid zstd streams identified by the annotations of their layer descriptor.
 */
boost::optional<Algorithm> detectCompressionFormat(stream::PeekableReader& reader,
                                                   const std::map<std::string, std::string>& annotations);

// The table of contents digest of a zstd:chunked layer, empty if the annotations don't carry one.
// Throws if the annotation is malformed.
image::Digest getTOCDigest(const std::map<std::string, std::string>& annotations);

}
}

#endif
