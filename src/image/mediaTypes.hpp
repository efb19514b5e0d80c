/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_mediaTypes_hpp
#define carrier_image_mediaTypes_hpp

#include <string>


namespace carrier {
namespace image {
namespace mediatype {

// Docker distribution
extern const std::string dockerV2Schema1;
extern const std::string dockerV2Schema1Signed;
extern const std::string dockerV2Schema2;
extern const std::string dockerV2Schema2Config;
extern const std::string dockerV2Schema2Layer;
extern const std::string dockerV2SchemaLayerUncompressed;
extern const std::string dockerV2SchemaLayerZstd;
extern const std::string dockerV2List;
extern const std::string dockerV2Schema2ForeignLayer;
extern const std::string dockerV2Schema2ForeignLayerGzip;

// OCI image specification
extern const std::string ociDescriptor;
extern const std::string ociLayoutHeader;
extern const std::string ociImageManifest;
extern const std::string ociImageIndex;
extern const std::string ociImageConfig;
extern const std::string ociImageLayer;
extern const std::string ociImageLayerGzip;
extern const std::string ociImageLayerZstd;
extern const std::string ociImageLayerNonDistributable;
extern const std::string ociImageLayerNonDistributableGzip;
extern const std::string ociImageLayerNonDistributableZstd;

extern const std::string encryptedSuffix;

}
}
}

#endif
