/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_CancellationToken_hpp
#define carrier_copy_CancellationToken_hpp

#include <atomic>

#include "stream/Reader.hpp"


namespace carrier {
namespace copy {

/**
 * Shared by all the operations of a copy. Once cancelled, blocking operations
 * which observe the token fail with "operation cancelled".
 */
class CancellationToken {
public:
    void cancel() { cancelled = true; }
    bool isCancelled() const { return cancelled; }
    void throwIfCancelled() const;

private:
    std::atomic<bool> cancelled{false};
};

// Fails the next read once the token is cancelled
class CancellableReader : public stream::Reader {
public:
    CancellableReader(stream::Reader& source, const CancellationToken& token)
        : source(source)
        , token(token)
    {}
    size_t read(char* buffer, size_t size) override;

private:
    stream::Reader& source;
    const CancellationToken& token;
};

}
}

#endif
