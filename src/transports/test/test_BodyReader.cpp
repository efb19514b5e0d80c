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
#include <vector>
#include <deque>
#include <memory>
#include <chrono>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "stream/StringReader.hpp"
#include "transports/BodyReader.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace transports {
namespace test {

// Returns data up to a cutoff, then fails like a dropped connection
class InterruptedReader : public stream::Reader {
public:
    InterruptedReader(const std::string& data, size_t cutoff)
        : data{data.substr(0, cutoff)}
        , interrupted{cutoff < data.size()}
    {}

    size_t read(char* buffer, size_t size) override {
        auto bytes = data.read(buffer, size);
        if(bytes == 0 && interrupted) {
            CARRIER_THROW_TYPED_ERROR(libcarrier::ConnectionInterruptedError, "connection reset by peer");
        }
        return bytes;
    }

private:
    stream::StringReader data;
    bool interrupted;
};

struct Response {
    int statusCode;
    // absolute offset at which the response body is interrupted
    size_t cutoff;
    std::string contentRange;
};

class ScriptedFetcher : public RangedFetcher {
public:
    explicit ScriptedFetcher(const std::string& content) : content(content) {}

    RangedResponse fetch(const std::string& range) override {
        ranges.push_back(range);
        if(responses.empty()) {
            CARRIER_THROW_ERROR("no more responses");
        }
        auto scripted = responses.front();
        responses.pop_front();

        auto start = std::stoul(range.substr(std::string{"bytes="}.size()));
        auto response = RangedResponse{};
        response.statusCode = scripted.statusCode;
        response.contentRange = scripted.contentRange.empty()
            ? (boost::format("bytes %d-%d/%d") % start % (content.size() - 1) % content.size()).str()
            : scripted.contentRange;
        response.body.reset(new InterruptedReader{content.substr(start), scripted.cutoff - start});
        return response;
    }

    const std::string& content;
    std::deque<Response> responses;
    std::vector<std::string> ranges;
};

static std::string makeContent(size_t size) {
    auto content = std::string{};
    for(size_t i = 0; i < size; ++i) {
        content.push_back(static_cast<char>('a' + i % 26));
    }
    return content;
}

TEST_GROUP(BodyReaderTestGroup) {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + std::chrono::hours{1};

    BodyReader::Clock makeClock() {
        return [this]() { return now; };
    }
};

TEST(BodyReaderTestGroup, uninterruptedBody) {
    auto content = makeContent(1000);
    ScriptedFetcher fetcher{content};
    auto body = std::unique_ptr<stream::Reader>{new stream::StringReader{content}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_EQUAL(stream::readAll(reader), content);
    CHECK(fetcher.ranges.empty());
}

TEST(BodyReaderTestGroup, interruptedBodyIsResumed) {
    auto content = makeContent(5000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 1200}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_EQUAL(stream::readAll(reader), content);
    CHECK_EQUAL(fetcher.ranges.size(), 1);
    CHECK_EQUAL(fetcher.ranges[0], "bytes=1200-");
    CHECK_EQUAL(reader.getOffset(), 5000);
}

TEST(BodyReaderTestGroup, prematureEndOfKnownSizeIsResumed) {
    auto content = makeContent(3000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new stream::StringReader{content.substr(0, 700)}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_EQUAL(stream::readAll(reader), content);
    CHECK_EQUAL(fetcher.ranges[0], "bytes=700-");
}

TEST(BodyReaderTestGroup, repeatedInterruptionWithoutProgressFails) {
    auto content = makeContent(5000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, 1300, ""});
    fetcher.responses.push_back(Response{206, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 1200}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_THROWS(libcarrier::ConnectionInterruptedError, stream::readAll(reader));
    CHECK_EQUAL(fetcher.ranges.size(), 1);
}

TEST(BodyReaderTestGroup, interruptionAfterEnoughTimeIsResumed) {
    auto content = makeContent(5000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, 1300, ""});
    fetcher.responses.push_back(Response{206, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 1200}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    auto result = std::string{};
    char buffer[100];
    while(reader.getOffset() < 1300) {
        result.append(buffer, reader.read(buffer, sizeof(buffer)));
    }
    now += BodyReader::MINIMUM_TIME_SINCE_LAST_RETRY;
    result += stream::readAll(reader);

    CHECK_EQUAL(result, content);
    CHECK_EQUAL(fetcher.ranges.size(), 2);
    CHECK_EQUAL(fetcher.ranges[1], "bytes=1300-");
}

TEST(BodyReaderTestGroup, interruptionAfterEnoughProgressIsResumed) {
    auto content = makeContent(3 * BodyReader::MINIMUM_PROGRESS);
    ScriptedFetcher fetcher{content};
    auto secondCutoff = static_cast<size_t>(100 + BodyReader::MINIMUM_PROGRESS);
    fetcher.responses.push_back(Response{206, secondCutoff, ""});
    fetcher.responses.push_back(Response{206, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 100}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK(stream::readAll(reader) == content);
    CHECK_EQUAL(fetcher.ranges.size(), 2);
}

TEST(BodyReaderTestGroup, serverIgnoringRangeFails) {
    auto content = makeContent(2000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{200, content.size(), ""});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 500}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_THROWS(libcarrier::Error, stream::readAll(reader));
}

TEST(BodyReaderTestGroup, mismatchingContentRangeFails) {
    auto content = makeContent(2000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, content.size(), "bytes 0-1999/2000"});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 500}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_THROWS(libcarrier::Error, stream::readAll(reader));
}

TEST(BodyReaderTestGroup, mismatchingCompleteLengthFails) {
    auto content = makeContent(2000);
    ScriptedFetcher fetcher{content};
    fetcher.responses.push_back(Response{206, content.size(), "bytes 500-1999/4000"});
    auto body = std::unique_ptr<stream::Reader>{new InterruptedReader{content, 500}};
    BodyReader reader{fetcher, std::move(body), static_cast<int64_t>(content.size()), makeClock()};

    CHECK_THROWS(libcarrier::Error, stream::readAll(reader));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
