/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_Semaphore_hpp
#define carrier_copy_Semaphore_hpp

#include <cstddef>
#include <mutex>
#include <condition_variable>

#include "copy/CancellationToken.hpp"


namespace carrier {
namespace copy {

/**
 * Counting semaphore bounding the number of concurrent blob copies.
 * A waiting acquire observes the cancellation token, if any.
 */
class Semaphore {
public:
    explicit Semaphore(size_t permits);

    void acquire(const CancellationToken* token = nullptr);
    void release();
    size_t getAvailablePermits() const;

private:
    mutable std::mutex mutex;
    std::condition_variable released;
    size_t available;
};

// Holds one permit for the lifetime of the object
class SemaphorePermit {
public:
    SemaphorePermit(Semaphore& semaphore, const CancellationToken* token = nullptr)
        : semaphore(semaphore)
    {
        semaphore.acquire(token);
    }
    ~SemaphorePermit() {
        semaphore.release();
    }
    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

private:
    Semaphore& semaphore;
};

}
}

#endif
