/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_BlobInfo_hpp
#define carrier_image_BlobInfo_hpp

#include <string>
#include <vector>
#include <map>
#include <cstdint>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "compression/Algorithm.hpp"


namespace carrier {
namespace image {

enum class CompressionOperation {
    PreserveOriginal,
    Compress,
    Decompress
};

enum class CryptoOperation {
    PreserveOriginal,
    Encrypt,
    Decrypt
};

/**
 * Describes a content-addressable blob (layer or config).
 *
 * The compression and crypto fields are only meaningful when the BlobInfo is used
 * as a layer edit: they record which transformation produced the blob relative to
 * the blob originally referenced by the manifest.
 */
struct BlobInfo {
    Digest digest;
    int64_t size = -1;
    std::vector<std::string> urls;
    std::map<std::string, std::string> annotations;
    std::string mediaType;

    CompressionOperation compressionOperation = CompressionOperation::PreserveOriginal;
    // Not set means "unknown" for PreserveOriginal and "uncompressed" for Decompress
    boost::optional<compression::Algorithm> compressionAlgorithm;
    CryptoOperation cryptoOperation = CryptoOperation::PreserveOriginal;
};

// A layer as listed by a manifest
struct LayerInfo : public BlobInfo {
    // A throwaway layer of a schema1 image, not relevant for the image contents
    bool emptyLayer = false;
};

std::vector<BlobInfo> toBlobInfos(const std::vector<LayerInfo>&);

}
}

#endif
