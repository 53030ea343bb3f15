#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "HttpRangeFetcher.hpp"
#include "MappedFileRangeFetcher.hpp"
#include "RangecatOptions.hpp"
#include "SegmentedRangeStream.hpp"
#include "StreamConfig.hpp"
#include "StreamCopy.hpp"
#include "StreamErrors.hpp"

namespace {

CancellationToken cancelToken;

void onSignal(int) {
    cancelToken.cancel();
}

} // namespace

int main(int argc, char* argv[]) {
    // Keep stdout clean for payload bytes.
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { fwrite(msg, 1, len, stderr); },
        []() { fflush(stderr); });

    RangecatOptions opts;
    StreamConfig config;
    try {
        opts = parseArgs(argc, argv);
        if (!opts.configPath.empty()) {
            config.loadFromFile(opts.configPath);
        }
        if (opts.segmentSize) {
            if (*opts.segmentSize == 0) {
                throw std::runtime_error("--segment-size must be positive");
            }
            config.segmentSize = *opts.segmentSize;
        }
        if (opts.retryLimit) {
            config.retryLimit = *opts.retryLimit;
        }
    } catch (const std::exception& e) {
        std::cerr << "rangecat: " << e.what() << "\n\n";
        printUsage();
        return 1;
    }

    trantor::Logger::setLogLevel(opts.verbose ? trantor::Logger::kDebug : trantor::Logger::kWarn);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        std::shared_ptr<RangeFetcher> fetcher;
        uint64_t length = 0;
        if (isHttpUrl(opts.url)) {
            if (!opts.length) {
                std::cerr << "rangecat: LENGTH is required for " << opts.url << "\n";
                return 1;
            }
            HttpFetcherOptions httpOptions;
            httpOptions.timeoutSeconds = config.timeoutSeconds;
            httpOptions.userAgent = config.userAgent;
            fetcher = std::make_shared<HttpRangeFetcher>(httpOptions);
            length = *opts.length;
        } else {
            auto files = std::make_shared<MappedFileRangeFetcher>();
            length = opts.length ? *opts.length : files->fileSize(opts.url);
            fetcher = files;
        }

        LOG_INFO << "Streaming " << opts.url << " (" << length << " bytes, segment " << config.segmentSize
                 << ", retry limit " << config.retryLimit << ")";

        SegmentedRangeStream stream(fetcher, opts.url, length, config.segmentSize, config.retryLimit);
        stream.setPosition(opts.offset);

        std::ofstream file;
        if (!opts.outputPath.empty()) {
            file.open(opts.outputPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                std::cerr << "rangecat: cannot open " << opts.outputPath << "\n";
                return 1;
            }
        }
        std::ostream& out = opts.outputPath.empty() ? std::cout : file;

        int lastPercent = -1;
        auto progress = [&lastPercent](double fraction) {
            int percent = static_cast<int>(fraction * 100);
            if (percent != lastPercent) {
                lastPercent = percent;
                LOG_DEBUG << "Progress " << percent << "%";
            }
        };

        uint64_t copied = copyStream(stream, out, config.bufferSize, progress, &cancelToken, opts.count);
        out.flush();
        stream.close();

        if (opts.json) {
            Json::Value summary;
            summary["url"] = opts.url;
            summary["offset"] = (Json::UInt64)opts.offset;
            summary["bytes"] = (Json::UInt64)copied;
            summary["length"] = (Json::UInt64)length;
            summary["config"] = config.toJson();
            Json::StreamWriterBuilder writer;
            writer["indentation"] = "";
            // Payload owns stdout unless it went to a file.
            (opts.outputPath.empty() ? std::cerr : std::cout) << Json::writeString(writer, summary) << std::endl;
        }
    } catch (const OperationCancelled&) {
        std::cerr << "rangecat: cancelled" << std::endl;
        return 130;
    } catch (const SegmentFetchExhausted& e) {
        std::cerr << "rangecat: " << e.what() << std::endl;
        return 2;
    } catch (const FetchError& e) {
        std::cerr << "rangecat: " << e.what() << std::endl;
        return 2;
    } catch (const TransientFetchError& e) {
        std::cerr << "rangecat: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "rangecat: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
