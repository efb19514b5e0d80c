/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Descriptor_hpp
#define carrier_image_Descriptor_hpp

#include <string>
#include <vector>
#include <map>
#include <cstdint>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/Platform.hpp"


namespace carrier {
namespace image {

// Reference to a blob or manifest as embedded in a manifest or in an image index
struct Descriptor {
    std::string mediaType;
    Digest digest;
    int64_t size = 0;
    std::vector<std::string> urls;
    std::map<std::string, std::string> annotations;
    boost::optional<Platform> platform;
    std::string artifactType;
};

// The two JSON renditions of descriptors differ in member order and in optional members
enum class DescriptorStyle {
    Schema2,
    OCI
};

Descriptor descriptorFromJSON(const rapidjson::Value&);
rapidjson::Value descriptorToJSON(const Descriptor&, DescriptorStyle, rapidjson::Document::AllocatorType&);
Platform platformFromJSON(const rapidjson::Value&);
rapidjson::Value platformToJSON(const Platform&, DescriptorStyle, rapidjson::Document::AllocatorType&);

BlobInfo blobInfoFromDescriptor(const Descriptor&, DescriptorStyle);

std::vector<std::string> getStringArray(const rapidjson::Value& object, const char* key);

}
}

#endif
