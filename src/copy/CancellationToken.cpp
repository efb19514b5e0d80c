/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CancellationToken.hpp"

#include "libcarrier/Error.hpp"


namespace carrier {
namespace copy {

void CancellationToken::throwIfCancelled() const {
    if(cancelled) {
        CARRIER_THROW_ERROR("operation cancelled");
    }
}

size_t CancellableReader::read(char* buffer, size_t size) {
    token.throwIfCancelled();
    return source.read(buffer, size);
}

}
}
