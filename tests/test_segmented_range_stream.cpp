#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "../src/SegmentedRangeStream.hpp"
#include "../src/StreamErrors.hpp"
#include "ScriptedRangeFetcher.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

using Fault = ScriptedRangeFetcher::Fault;

static std::string readAll(SegmentedRangeStream& stream, size_t chunk) {
    std::string out;
    std::vector<char> buf(chunk);
    while (true) {
        size_t n = stream.read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(buf.data(), n);
    }
    return out;
}

int main() {
    try {
        // 1) length 1000, segment 256, reads of 100: four segments, exact content
        {
            std::string content = makeContent(1000);
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(content);
            SegmentedRangeStream stream(fetcher, "http://example.test/media", 1000, 256, 3);
            ASSERT_TRUE(stream.position() == 0);
            ASSERT_TRUE(stream.length() == 1000);

            std::string got;
            char buf[100];
            size_t calls = 0;
            while (true) {
                size_t n = stream.read(buf, sizeof(buf));
                ++calls;
                ASSERT_TRUE(n <= sizeof(buf));
                if (n == 0) break;
                got.append(buf, n);
                ASSERT_TRUE(stream.position() == got.size());
            }
            ASSERT_TRUE(got == content);
            ASSERT_TRUE(stream.position() == 1000);
            // reads stop short at each segment end: 100,100,56 per segment,
            // 100,100,32 for the last, so the zero return is call 13
            ASSERT_TRUE(calls == 13);
            ASSERT_TRUE(fetcher->openCount() == 4);
            ASSERT_TRUE(fetcher->requests()[0].start == 0 && fetcher->requests()[0].end == 255);
            ASSERT_TRUE(fetcher->requests()[1].start == 256 && fetcher->requests()[1].end == 511);
            ASSERT_TRUE(fetcher->requests()[2].start == 512);
            ASSERT_TRUE(fetcher->requests()[3].start == 768 && fetcher->requests()[3].end == 1023);

            // further reads at the end stay at 0 without touching the fetcher
            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 0);
            ASSERT_TRUE(fetcher->openCount() == 4);
        }

        // 2) content fidelity for assorted chunk sizes, including ones that
        //    straddle segment boundaries
        {
            std::string content = makeContent(777);
            for (size_t chunk : {1, 7, 64, 100, 255, 256, 257, 1000}) {
                auto fetcher = std::make_shared<ScriptedRangeFetcher>(content);
                SegmentedRangeStream stream(fetcher, "u", content.size(), 64, 3);
                ASSERT_TRUE(readAll(stream, chunk) == content);
                ASSERT_TRUE(fetcher->openCount() == (777 + 63) / 64);
            }
        }

        // 3) read at position == length issues no fetch
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(makeContent(10));
            SegmentedRangeStream stream(fetcher, "u", 10, 4);
            ASSERT_TRUE(stream.seek(0, SeekOrigin::End) == 10);
            char c;
            ASSERT_TRUE(stream.read(&c, 1) == 0);
            ASSERT_TRUE(fetcher->openCount() == 0);

            // beyond the end is allowed and reads nothing
            ASSERT_TRUE(stream.seek(5, SeekOrigin::End) == 15);
            ASSERT_TRUE(stream.read(&c, 1) == 0);
            ASSERT_TRUE(fetcher->openCount() == 0);
        }

        // 4) empty resource
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(std::string());
            SegmentedRangeStream stream(fetcher, "u", 0, 16);
            char c;
            ASSERT_TRUE(stream.read(&c, 1) == 0);
            ASSERT_TRUE(fetcher->openCount() == 0);
        }

        // 5) seek arithmetic for all origins
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(makeContent(100));
            SegmentedRangeStream stream(fetcher, "u", 100, 16);
            ASSERT_TRUE(stream.seek(40, SeekOrigin::Begin) == 40);
            ASSERT_TRUE(stream.seek(-10, SeekOrigin::Current) == 30);
            ASSERT_TRUE(stream.seek(5, SeekOrigin::Current) == 35);
            ASSERT_TRUE(stream.seek(-1, SeekOrigin::End) == 99);
            ASSERT_TRUE(stream.seek(-100, SeekOrigin::End) == 0);
            stream.setPosition(12);
            ASSERT_TRUE(stream.position() == 12);
        }

        // 6) seek then read equals a fresh stream read from that offset
        {
            std::string content = makeContent(500);
            for (uint64_t offset : {0, 1, 63, 64, 65, 250, 499}) {
                auto fetcher = std::make_shared<ScriptedRangeFetcher>(content);
                SegmentedRangeStream stream(fetcher, "u", content.size(), 64, 3);
                char warm[10];
                ASSERT_TRUE(stream.read(warm, sizeof(warm)) == 10);
                stream.seek(static_cast<int64_t>(offset), SeekOrigin::Begin);
                ASSERT_TRUE(readAll(stream, 33) == content.substr(offset));
                if (offset != 10) {
                    ASSERT_TRUE(fetcher->requests()[1].start == offset);
                }
            }
        }

        // 7) seeking to the current position keeps the open segment
        {
            std::string content = makeContent(300);
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(content);
            SegmentedRangeStream stream(fetcher, "u", 300, 128);
            char buf[50];
            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 50);
            ASSERT_TRUE(fetcher->openCount() == 1);
            ASSERT_TRUE(stream.seek(50, SeekOrigin::Begin) == 50);
            ASSERT_TRUE(stream.seek(0, SeekOrigin::Current) == 50);
            ASSERT_TRUE(stream.seek(-250, SeekOrigin::End) == 50);
            ASSERT_TRUE(fetcher->liveSources() == 1);
            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 50);
            ASSERT_TRUE(fetcher->openCount() == 1);
            ASSERT_TRUE(std::string(buf, 50) == content.substr(50, 50));

            // a real move drops the segment immediately and reopens lazily
            stream.seek(200, SeekOrigin::Begin);
            ASSERT_TRUE(fetcher->liveSources() == 0);
            ASSERT_TRUE(fetcher->openCount() == 1);
            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 50);
            ASSERT_TRUE(fetcher->openCount() == 2);
            ASSERT_TRUE(fetcher->requests()[1].start == 200 && fetcher->requests()[1].end == 327);
        }

        // 8) negative seek fails and leaves position and segment alone
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(makeContent(100));
            SegmentedRangeStream stream(fetcher, "u", 100, 32);
            char buf[8];
            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 8);
            bool threw = false;
            try {
                stream.seek(-1, SeekOrigin::Begin);
            } catch (const InvalidPosition&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(stream.position() == 8);
            ASSERT_TRUE(fetcher->liveSources() == 1);

            threw = false;
            try {
                stream.seek(-9, SeekOrigin::Current);
            } catch (const InvalidPosition&) {
                threw = true;
            }
            ASSERT_TRUE(threw);

            threw = false;
            try {
                stream.seek(-101, SeekOrigin::End);
            } catch (const InvalidPosition&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(stream.position() == 8);

            ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 8);
            ASSERT_TRUE(fetcher->openCount() == 1);
        }

        // 9) close releases the segment, is idempotent, and the destructor
        //    releases whatever is still open
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(makeContent(100));
            {
                SegmentedRangeStream stream(fetcher, "u", 100, 32);
                char buf[4];
                ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 4);
                ASSERT_TRUE(fetcher->liveSources() == 1);
                stream.close();
                stream.close();
                ASSERT_TRUE(fetcher->liveSources() == 0);
                ASSERT_TRUE(stream.read(buf, sizeof(buf)) == 4);
                ASSERT_TRUE(stream.position() == 8);
                ASSERT_TRUE(fetcher->requests()[1].start == 4);
            }
            ASSERT_TRUE(fetcher->liveSources() == 0);
        }

        // 10) server clipping: segments shorter than requested still stitch
        //     together without gaps
        {
            std::string content = makeContent(200);
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(content);
            fetcher->setDefault(Fault::ClipTo, 30);
            SegmentedRangeStream stream(fetcher, "u", 200, 64, 0);
            ASSERT_TRUE(readAll(stream, 50) == content);
            ASSERT_TRUE(fetcher->openCount() == 7);
            ASSERT_TRUE(fetcher->requests()[1].start == 30);
        }

        // 11) read-only surface and argument validation
        {
            auto fetcher = std::make_shared<ScriptedRangeFetcher>(makeContent(10));
            SegmentedRangeStream stream(fetcher, "u", 10, 4);
            ASSERT_TRUE(stream.canRead());
            ASSERT_TRUE(stream.canSeek());
            ASSERT_TRUE(!stream.canWrite());
            ASSERT_TRUE(stream.retryLimit() == SegmentedRangeStream::kDefaultRetryLimit);
            bool threw = false;
            try {
                stream.write("x", 1);
            } catch (const NotSupported&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
            threw = false;
            try {
                stream.setLength(5);
            } catch (const NotSupported&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
            threw = false;
            try {
                SegmentedRangeStream bad(fetcher, "u", 10, 0);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
            char c;
            ASSERT_TRUE(stream.read(&c, 0) == 0);
            ASSERT_TRUE(fetcher->openCount() == 0);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All segmented range stream tests passed" << std::endl;
    return 0;
}
