/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_compressionVariants_hpp
#define carrier_image_compressionVariants_hpp

#include <string>
#include <vector>
#include <map>

#include <boost/optional.hpp>

#include "image/BlobInfo.hpp"
#include "compression/Algorithm.hpp"


namespace carrier {
namespace image {

/**
 * The MIME types of one kind of layer, keyed by compression algorithm name.
 * The key UNCOMPRESSED identifies the uncompressed variant, the value UNSUPPORTED
 * a variant which is known but cannot be represented.
 */
using CompressionMIMETypeSet = std::map<std::string, std::string>;

const std::string UNCOMPRESSED_VARIANT{""};
const std::string UNSUPPORTED_MIME_TYPE{""};

const std::vector<CompressionMIMETypeSet>& getSchema1CompressionMIMETypeSets();
const std::vector<CompressionMIMETypeSet>& getSchema2CompressionMIMETypeSets();
const std::vector<CompressionMIMETypeSet>& getOCI1CompressionMIMETypeSets();

std::string compressionVariantMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                                       const std::string& mimeType,
                                       const boost::optional<compression::Algorithm>& algorithm);

// MIME type of a layer of type mimeType after applying the compression edit of "updated"
std::string updatedMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                            const std::string& mimeType,
                            const BlobInfo& updated);

bool compressionVariantsRecognizeMIMEType(const std::vector<CompressionMIMETypeSet>& variantTable,
                                          const std::string& mimeType);

}
}

#endif
