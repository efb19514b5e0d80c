/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "compressionVariants.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/mediaTypes.hpp"


namespace carrier {
namespace image {

const std::vector<CompressionMIMETypeSet>& getSchema1CompressionMIMETypeSets() {
    // schema1 has no layer MIME types, the schema2 gzip type acts as a placeholder
    static const auto sets = std::vector<CompressionMIMETypeSet>{
        {
            {UNCOMPRESSED_VARIANT, mediatype::dockerV2Schema2Layer},
            {compression::GZIP_ALGORITHM_NAME, mediatype::dockerV2Schema2Layer},
            {compression::ZSTD_ALGORITHM_NAME, UNSUPPORTED_MIME_TYPE}
        }
    };
    return sets;
}

const std::vector<CompressionMIMETypeSet>& getSchema2CompressionMIMETypeSets() {
    static const auto sets = std::vector<CompressionMIMETypeSet>{
        {
            {UNCOMPRESSED_VARIANT, mediatype::dockerV2Schema2ForeignLayer},
            {compression::GZIP_ALGORITHM_NAME, mediatype::dockerV2Schema2ForeignLayerGzip},
            {compression::ZSTD_ALGORITHM_NAME, UNSUPPORTED_MIME_TYPE}
        },
        {
            {UNCOMPRESSED_VARIANT, mediatype::dockerV2SchemaLayerUncompressed},
            {compression::GZIP_ALGORITHM_NAME, mediatype::dockerV2Schema2Layer},
            {compression::ZSTD_ALGORITHM_NAME, UNSUPPORTED_MIME_TYPE}
        }
    };
    return sets;
}

const std::vector<CompressionMIMETypeSet>& getOCI1CompressionMIMETypeSets() {
    static const auto sets = std::vector<CompressionMIMETypeSet>{
        {
            {UNCOMPRESSED_VARIANT, mediatype::ociImageLayerNonDistributable},
            {compression::GZIP_ALGORITHM_NAME, mediatype::ociImageLayerNonDistributableGzip},
            {compression::ZSTD_ALGORITHM_NAME, mediatype::ociImageLayerNonDistributableZstd}
        },
        {
            {UNCOMPRESSED_VARIANT, mediatype::ociImageLayer},
            {compression::GZIP_ALGORITHM_NAME, mediatype::ociImageLayerGzip},
            {compression::ZSTD_ALGORITHM_NAME, mediatype::ociImageLayerZstd}
        }
    };
    return sets;
}

static const CompressionMIMETypeSet* findCompressionMIMETypeSet(const std::vector<CompressionMIMETypeSet>& variantTable,
                                                                const std::string& mimeType) {
    for(const auto& variants : variantTable) {
        for(const auto& variant : variants) {
            if(variant.second == mimeType) {
                return &variants;
            }
        }
    }
    return nullptr;
}

std::string compressionVariantMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                                       const std::string& mimeType,
                                       const boost::optional<compression::Algorithm>& algorithm) {
    // Prevent matching against the UNSUPPORTED_MIME_TYPE entries
    if(mimeType == UNSUPPORTED_MIME_TYPE) {
        CARRIER_THROW_ERROR("cannot update unknown MIME type");
    }

    const auto* variants = findCompressionMIMETypeSet(variantTable, mimeType);
    if(variants) {
        auto name = algorithm ? algorithm->getBaseVariantName() : UNCOMPRESSED_VARIANT;
        auto it = variants->find(name);
        if(it != variants->cend() && it->second != UNSUPPORTED_MIME_TYPE) {
            return it->second;
        }
        if(it != variants->cend() && name != UNCOMPRESSED_VARIANT) {
            auto message = boost::format("%s compression is not supported for type \"%s\"") % name % mimeType;
            CARRIER_THROW_TYPED_ERROR(libcarrier::CompressionIncompatibleError, message.str());
        }
        if(it == variants->cend() && name != UNCOMPRESSED_VARIANT) {
            auto message = boost::format("unknown compressed with algorithm %s variant for type \"%s\"") % name % mimeType;
            CARRIER_THROW_TYPED_ERROR(libcarrier::CompressionIncompatibleError, message.str());
        }
        auto message = boost::format("uncompressed variant is not supported for type \"%s\"") % mimeType;
        CARRIER_THROW_TYPED_ERROR(libcarrier::CompressionIncompatibleError, message.str());
    }

    if(algorithm) {
        auto message = boost::format("unsupported MIME type for compression: \"%s\"") % mimeType;
        CARRIER_THROW_ERROR(message.str());
    }
    auto message = boost::format("unsupported MIME type for decompression: \"%s\"") % mimeType;
    CARRIER_THROW_ERROR(message.str());
}

std::string updatedMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                            const std::string& mimeType,
                            const BlobInfo& updated) {
    switch(updated.compressionOperation) {
    case CompressionOperation::PreserveOriginal:
        // A blob reused under a different compression also changes its MIME type
        if(updated.compressionAlgorithm) {
            return compressionVariantMIMEType(variantTable, mimeType, updated.compressionAlgorithm);
        }
        return mimeType;
    case CompressionOperation::Decompress:
        return compressionVariantMIMEType(variantTable, mimeType, boost::none);
    case CompressionOperation::Compress:
        if(!updated.compressionAlgorithm) {
            auto message = boost::format("Error preparing updated manifest: blob %s was compressed but does not specify"
                                         " by which algorithm: falling back to use the original blob") % updated.digest;
            libcarrier::Logger::getInstance().log(message, "Manifest", libcarrier::LogLevel::DEBUG);
            return mimeType;
        }
        return compressionVariantMIMEType(variantTable, mimeType, updated.compressionAlgorithm);
    }
    CARRIER_THROW_ERROR("unknown compression operation");
}

bool compressionVariantsRecognizeMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                                          const std::string& mimeType) {
    if(mimeType == UNSUPPORTED_MIME_TYPE) {
        return false;
    }
    return findCompressionMIMETypeSet(variantTable, mimeType) != nullptr;
}

}
}
