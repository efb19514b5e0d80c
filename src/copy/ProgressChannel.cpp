/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ProgressChannel.hpp"


namespace carrier {
namespace copy {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity{capacity}
{}

bool ProgressChannel::offer(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock{mutex};
        if(closed || events.size() >= capacity) {
            return false;
        }
        events.push_back(event);
    }
    available.notify_one();
    return true;
}

boost::optional<ProgressEvent> ProgressChannel::take() {
    std::unique_lock<std::mutex> lock{mutex};
    available.wait(lock, [this]() { return !events.empty() || closed; });
    if(events.empty()) {
        return boost::none;
    }
    auto event = events.front();
    events.pop_front();
    return event;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock{mutex};
        closed = true;
    }
    available.notify_all();
}

ProgressReader::ProgressReader(stream::Reader& source,
                               ProgressChannel& channel,
                               std::chrono::milliseconds interval,
                               const image::BlobInfo& artifact)
    : counter{source}
    , channel(channel)
    , interval{interval}
    , artifact{artifact}
    , lastUpdate{std::chrono::steady_clock::now()}
{
    auto event = ProgressEvent{};
    event.event = ProgressEventType::NewArtifact;
    event.artifact = artifact;
    channel.offer(event);
}

size_t ProgressReader::read(char* buffer, size_t size) {
    auto bytes = counter.read(buffer, size);
    auto offset = static_cast<uint64_t>(counter.getCount());

    auto now = std::chrono::steady_clock::now();
    if(bytes > 0 && now - lastUpdate >= interval) {
        auto event = ProgressEvent{};
        event.event = ProgressEventType::Read;
        event.artifact = artifact;
        event.offset = offset;
        event.offsetUpdate = offset - offsetAtLastUpdate;
        channel.offer(event);
        offsetAtLastUpdate = offset;
        lastUpdate = now;
    }
    return bytes;
}

void ProgressReader::reportDone() {
    if(done) {
        return;
    }
    done = true;
    auto offset = static_cast<uint64_t>(counter.getCount());
    auto event = ProgressEvent{};
    event.event = ProgressEventType::Done;
    event.artifact = artifact;
    event.offset = offset;
    event.offsetUpdate = offset - offsetAtLastUpdate;
    channel.offer(event);
}

}
}
