/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_test_utility_images_hpp
#define carrier_test_utility_images_hpp

#include <string>
#include <vector>
#include <map>

#include "image/Digest.hpp"
#include "test_utility/memoryTransport.hpp"


namespace test_utility {
namespace images {

// A single image with all of its blobs
struct TestImage {
    std::string manifest;
    std::string mimeType;
    carrier::image::Digest digest;
    std::string config;
    carrier::image::Digest configDigest;
    std::vector<carrier::image::Digest> layerDigests;
    std::map<std::string, std::string> blobs;
};

std::string gzipped(const std::string& data);

TestImage makeOCIImage(const std::vector<std::string>& layerContents,
                       const std::string& architecture = "amd64",
                       bool compressLayers = true);
TestImage makeSchema2Image(const std::vector<std::string>& layerContents,
                           const std::string& architecture = "amd64");
// Unsigned schema1 image storing the layer blobs as they are, base layer first. It has no config.
TestImage makeSchema1Image(const std::vector<std::string>& layerBlobs,
                           const std::string& architecture = "amd64");

// Stores the image as the top-level manifest of the store
void storeImage(memory::MemoryStore& store, const TestImage& image);
// Stores the images as instances of a list of type listMIMEType, returns the list
std::string storeList(memory::MemoryStore& store, const std::vector<TestImage>& images, const std::string& listMIMEType);

}
}

#endif
