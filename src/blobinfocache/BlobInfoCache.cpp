/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BlobInfoCache.hpp"


namespace carrier {
namespace blobinfocache {

const std::string UNCOMPRESSED{"uncompressed"};
const std::string UNKNOWN_COMPRESSION{"unknown"};

}
}
