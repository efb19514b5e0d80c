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
#include <future>
#include <algorithm>

#include "image/Digest.hpp"
#include "image/Digester.hpp"
#include "stream/StringReader.hpp"
#include "stream/Pipe.hpp"
#include "stream/TeeReader.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace stream {
namespace test {

// Reader failing after a number of bytes
class FailingReader : public Reader {
public:
    explicit FailingReader(size_t failAfter) : remaining{failAfter} {}
    size_t read(char* buffer, size_t size) override {
        if(remaining == 0) {
            CARRIER_THROW_ERROR("connection reset");
        }
        auto count = std::min(size, remaining);
        std::fill(buffer, buffer + count, 'z');
        remaining -= count;
        return count;
    }
private:
    size_t remaining;
};

TEST_GROUP(PipeTestGroup) {
};

TEST(PipeTestGroup, teeToBackgroundDigester) {
    auto content = std::string(3 * 1024 * 1024 + 17, 'a');
    Pipe pipe{64 * 1024};
    auto digestFuture = std::async(std::launch::async, [&pipe]() {
        return image::Digest::fromBytes(readAll(pipe));
    });

    auto source = StringReader{content};
    auto tee = TeeReader{source, pipe};
    auto output = readAll(tee);

    CHECK(output == content);
    CHECK(digestFuture.get() == image::Digest::fromBytes(content));
}

TEST(PipeTestGroup, writerErrorReachesReader) {
    Pipe pipe{1024};
    auto consumer = std::async(std::launch::async, [&pipe]() {
        return readAll(pipe);
    });

    auto source = FailingReader{10000};
    auto tee = TeeReader{source, pipe};
    CHECK_THROWS(libcarrier::Error, readAll(tee));
    CHECK_THROWS(libcarrier::Error, consumer.get());
}

TEST(PipeTestGroup, readerErrorReachesWriter) {
    Pipe pipe{16};
    pipe.closeRead("consumer failed");
    auto data = std::string(32, 'x');
    CHECK_THROWS(libcarrier::Error, pipe.write(data.data(), data.size()));
}

TEST(PipeTestGroup, closedEmptyPipeReadsEndOfStream) {
    Pipe pipe{};
    pipe.closeWrite();
    char buffer[8];
    CHECK_EQUAL(pipe.read(buffer, sizeof(buffer)), 0);
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
