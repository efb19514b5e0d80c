/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BlobInfo.hpp"


namespace carrier {
namespace image {

std::vector<BlobInfo> toBlobInfos(const std::vector<LayerInfo>& layers) {
    auto blobs = std::vector<BlobInfo>{};
    blobs.reserve(layers.size());
    for(const auto& layer : layers) {
        blobs.push_back(layer);
    }
    return blobs;
}

}
}
