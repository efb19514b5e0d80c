/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_compression_Compressor_hpp
#define carrier_compression_Compressor_hpp

#include <map>
#include <string>
#include <memory>

#include <boost/optional.hpp>

#include "compression/Algorithm.hpp"
#include "stream/Reader.hpp"


namespace carrier {
namespace compression {

/**
 * Returns a Reader producing the compressed form of the source. Annotations
 * describing the compressed blob (zstd:chunked only) are written into
 * annotations when the returned Reader reaches end of stream, so annotations
 * must outlive it.
 */
std::unique_ptr<stream::Reader> newCompressor(const Algorithm& algorithm,
                                              stream::Reader& source,
                                              const boost::optional<int>& level,
                                              std::map<std::string, std::string>& annotations);

std::unique_ptr<stream::Reader> newDecompressor(const Algorithm& algorithm, stream::Reader& source);

}
}

#endif
