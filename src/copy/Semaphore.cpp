/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Semaphore.hpp"

#include <chrono>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace copy {

// how often a waiting acquire checks for cancellation
static const auto cancellationPollInterval = std::chrono::milliseconds{50};

Semaphore::Semaphore(size_t permits)
    : available{permits}
{
    if(permits == 0) {
        CARRIER_THROW_ERROR("Semaphore must have at least one permit");
    }
}

void Semaphore::acquire(const CancellationToken* token) {
    std::unique_lock<std::mutex> lock{mutex};
    while(available == 0) {
        if(token) {
            token->throwIfCancelled();
            released.wait_for(lock, cancellationPollInterval);
        }
        else {
            released.wait(lock);
        }
    }
    if(token) {
        token->throwIfCancelled();
    }
    --available;
}

void Semaphore::release() {
    {
        std::lock_guard<std::mutex> lock{mutex};
        ++available;
    }
    released.notify_one();
}

size_t Semaphore::getAvailablePermits() const {
    std::lock_guard<std::mutex> lock{mutex};
    return available;
}

}
}
