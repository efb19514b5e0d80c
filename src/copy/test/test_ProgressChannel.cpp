/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <thread>
#include <vector>
#include <chrono>

#include "image/BlobInfo.hpp"
#include "stream/StringReader.hpp"
#include "copy/ProgressChannel.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace copy {
namespace test {

static std::vector<ProgressEvent> drain(ProgressChannel& channel) {
    channel.close();
    auto events = std::vector<ProgressEvent>{};
    while(auto event = channel.take()) {
        events.push_back(*event);
    }
    return events;
}

TEST_GROUP(ProgressChannelTestGroup) {
};

TEST(ProgressChannelTestGroup, offerNeverBlocks) {
    ProgressChannel channel{2};
    CHECK(channel.offer(ProgressEvent{}));
    CHECK(channel.offer(ProgressEvent{}));
    // full
    CHECK_FALSE(channel.offer(ProgressEvent{}));

    CHECK_EQUAL(drain(channel).size(), 2);
    // closed
    CHECK_FALSE(channel.offer(ProgressEvent{}));
}

TEST(ProgressChannelTestGroup, takeWaitsForProducer) {
    ProgressChannel channel{};
    auto producer = std::thread([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        auto event = ProgressEvent{};
        event.event = ProgressEventType::Skipped;
        channel.offer(event);
    });
    auto event = channel.take();
    producer.join();

    CHECK(static_cast<bool>(event));
    CHECK(event->event == ProgressEventType::Skipped);
}

TEST(ProgressChannelTestGroup, readerReportsArtifactLifecycle) {
    ProgressChannel channel{};
    auto artifact = image::BlobInfo{};
    artifact.digest = image::Digest::fromBytes("layer");
    auto data = std::string(100000, 'x');
    auto source = stream::StringReader{data};

    auto reader = ProgressReader{source, channel, std::chrono::milliseconds{1}, artifact};
    auto read = stream::readAll(reader);
    reader.reportDone();
    reader.reportDone();
    CHECK_EQUAL(read.size(), data.size());

    auto events = drain(channel);
    CHECK(events.size() >= 2);
    CHECK(events.front().event == ProgressEventType::NewArtifact);
    CHECK(events.front().artifact.digest == artifact.digest);
    CHECK(events.back().event == ProgressEventType::Done);
    CHECK_EQUAL(events.back().offset, data.size());

    // offsets only grow, and the updates add up to the total
    auto total = uint64_t{0};
    auto previous = uint64_t{0};
    for(const auto& event : events) {
        CHECK(event.offset >= previous);
        previous = event.offset;
        total += event.offsetUpdate;
    }
    CHECK_EQUAL(total, data.size());
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
