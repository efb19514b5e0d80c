/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_ProgressChannel_hpp
#define carrier_copy_ProgressChannel_hpp

#include <cstdint>
#include <chrono>
#include <deque>
#include <mutex>
#include <condition_variable>

#include <boost/optional.hpp>

#include "image/BlobInfo.hpp"
#include "stream/Reader.hpp"
#include "stream/CountingReader.hpp"


namespace carrier {
namespace copy {

enum class ProgressEventType {
    NewArtifact,
    Read,
    Skipped,
    Done
};

struct ProgressEvent {
    ProgressEventType event = ProgressEventType::NewArtifact;
    image::BlobInfo artifact;
    // Bytes of the artifact read so far
    uint64_t offset = 0;
    // Bytes read since the previous event
    uint64_t offsetUpdate = 0;
};

/**
 * Bounded queue of progress events. Producers never block: events offered
 * while the queue is full or closed are dropped.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 256);

    bool offer(const ProgressEvent& event);
    // Blocks until an event is available, returns none once closed and drained
    boost::optional<ProgressEvent> take();
    void close();

private:
    size_t capacity;
    std::deque<ProgressEvent> events;
    std::mutex mutex;
    std::condition_variable available;
    bool closed = false;
};

// Reports the bytes flowing through it, at most once per interval
class ProgressReader : public stream::Reader {
public:
    ProgressReader(stream::Reader& source,
                   ProgressChannel& channel,
                   std::chrono::milliseconds interval,
                   const image::BlobInfo& artifact);

    size_t read(char* buffer, size_t size) override;
    void reportDone();

private:
    stream::CountingReader counter;
    ProgressChannel& channel;
    std::chrono::milliseconds interval;
    image::BlobInfo artifact;
    std::chrono::steady_clock::time_point lastUpdate;
    uint64_t offsetAtLastUpdate = 0;
    bool done = false;
};

}
}

#endif
