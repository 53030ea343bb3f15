#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include "RangeFetcher.hpp"

struct HttpFetcherOptions {
    double timeoutSeconds = 30.0;
    std::string userAgent = "rangestream/1.0";
    bool validateCert = true;
};

struct UrlParts {
    std::string host;    // scheme://authority, as drogon::HttpClient expects
    std::string target;  // path plus query, never empty
};

// Splits an http(s) URL. Throws FetchError for other schemes or a missing host.
UrlParts splitUrl(const std::string& url);

std::string formatRangeHeader(uint64_t start, uint64_t end);

enum class RangeResponse {
    Partial,      // 206, body is the requested range
    FullBody,     // 200, server ignored Range; body starts at offset 0
    Unsatisfiable,// 416, start is past the end of the resource
    Transient,    // worth retrying
    Permanent
};

RangeResponse classifyStatus(int status);

// Turns a completed response into the source for [start, end]. A 200 body is
// the whole resource and gets sliced; 416 gives an empty source. Throws
// TransientFetchError or FetchError for the failing statuses.
std::unique_ptr<ByteSource> sourceFromResponse(int status, std::string body, uint64_t start, uint64_t end);

// Range fetcher on top of drogon's HttpClient. Each host gets its own client;
// all clients run on a private event loop thread. open() waits for the
// response on the calling thread and gives up early if the token fires.
class HttpRangeFetcher : public RangeFetcher {
public:
    explicit HttpRangeFetcher(HttpFetcherOptions options = HttpFetcherOptions());
    ~HttpRangeFetcher() override;

    std::unique_ptr<ByteSource> open(const std::string& url, uint64_t start, uint64_t end,
                                     const CancellationToken* token) override;

private:
    drogon::HttpClientPtr clientFor(const std::string& host);

    HttpFetcherOptions options;
    trantor::EventLoopThread loopThread;
    std::unordered_map<std::string, drogon::HttpClientPtr> clients;
    std::mutex clientsMutex;
};
