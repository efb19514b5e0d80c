/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_compression_Algorithms_hpp
#define carrier_compression_Algorithms_hpp

#include <string>
#include <vector>

#include "compression/Algorithm.hpp"


namespace carrier {
namespace compression {

extern const Algorithm Gzip;
extern const Algorithm Bzip2;
extern const Algorithm Xz;
extern const Algorithm Zstd;
extern const Algorithm ZstdChunked;

// Annotation of zstd:chunked layers carrying the digest of their table of contents
extern const std::string ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY;
// Annotation written by our zstd:chunked compressor. Its value is the digest of the
// uncompressed stream, as the compressor builds no table of contents.
extern const std::string ZSTD_CHUNKED_CONTENT_DIGEST_KEY;

const std::vector<Algorithm>& getAlgorithms();
Algorithm algorithmByName(const std::string& name);

}
}

#endif
