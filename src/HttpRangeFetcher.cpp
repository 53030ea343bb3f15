#include "HttpRangeFetcher.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <utility>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/utils/Logger.h>
#include "StreamErrors.hpp"

namespace {
constexpr int kCancelPollMs = 50;
} // namespace

UrlParts splitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw FetchError("Not an absolute URL: " + url);
    }
    std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        throw FetchError("Unsupported URL scheme: " + scheme);
    }

    size_t authorityStart = schemeEnd + 3;
    size_t targetStart = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, targetStart == std::string::npos
                                                           ? std::string::npos
                                                           : targetStart - authorityStart);
    if (authority.empty()) {
        throw FetchError("URL has no host: " + url);
    }

    UrlParts parts;
    parts.host = scheme + "://" + authority;
    if (targetStart != std::string::npos) {
        parts.target = url.substr(targetStart);
        auto fragment = parts.target.find('#');
        if (fragment != std::string::npos) {
            parts.target.erase(fragment);
        }
    }
    if (parts.target.empty() || parts.target[0] != '/') {
        parts.target.insert(0, "/");
    }
    return parts;
}

std::string formatRangeHeader(uint64_t start, uint64_t end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

RangeResponse classifyStatus(int status) {
    if (status == 206) return RangeResponse::Partial;
    if (status == 200) return RangeResponse::FullBody;
    if (status == 416) return RangeResponse::Unsatisfiable;
    if (status == 408 || status == 429 || status >= 500) return RangeResponse::Transient;
    return RangeResponse::Permanent;
}

HttpRangeFetcher::HttpRangeFetcher(HttpFetcherOptions options)
    : options(std::move(options)), loopThread("RangeFetcherLoop") {
    loopThread.run();
}

HttpRangeFetcher::~HttpRangeFetcher() {
    {
        std::lock_guard lock(clientsMutex);
        clients.clear();
    }
    // loopThread's destructor quits the loop and joins.
}

drogon::HttpClientPtr HttpRangeFetcher::clientFor(const std::string& host) {
    std::lock_guard lock(clientsMutex);
    auto it = clients.find(host);
    if (it != clients.end()) {
        return it->second;
    }
    auto client = drogon::HttpClient::newHttpClient(host, loopThread.getLoop(), false, options.validateCert);
    client->setUserAgent(options.userAgent);
    clients.emplace(host, client);
    return client;
}

std::unique_ptr<ByteSource> HttpRangeFetcher::open(const std::string& url, uint64_t start, uint64_t end,
                                                   const CancellationToken* token) {
    throwIfCancelled(token);
    if (end < start) {
        throw std::invalid_argument("Range end precedes start");
    }

    UrlParts parts = splitUrl(url);
    auto client = clientFor(parts.host);

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPathEncode(false);
    req->setPath(parts.target);
    req->addHeader("Range", formatRangeHeader(start, end));

    LOG_DEBUG << "GET " << parts.host << parts.target << " Range: " << formatRangeHeader(start, end);

    // The promise is shared with the callback so a response arriving after a
    // cancel still has somewhere to land.
    using Reply = std::pair<drogon::ReqResult, drogon::HttpResponsePtr>;
    auto reply = std::make_shared<std::promise<Reply>>();
    auto future = reply->get_future();
    client->sendRequest(
        req,
        [reply](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
            reply->set_value(Reply(result, resp));
        },
        options.timeoutSeconds);

    while (future.wait_for(std::chrono::milliseconds(kCancelPollMs)) != std::future_status::ready) {
        throwIfCancelled(token);
    }
    auto [result, resp] = future.get();
    throwIfCancelled(token);

    if (result != drogon::ReqResult::Ok || !resp) {
        LOG_WARN << "Range request to " << parts.host << " failed, ReqResult " << static_cast<int>(result);
        throw TransientFetchError("Request for bytes " + std::to_string(start) + "-" + std::to_string(end) +
                                  " failed (ReqResult " + std::to_string(static_cast<int>(result)) + ")");
    }

    int status = static_cast<int>(resp->getStatusCode());
    if (classifyStatus(status) == RangeResponse::Permanent) {
        LOG_ERROR << "HTTP " << status << " for " << url;
    } else if (classifyStatus(status) == RangeResponse::Transient) {
        LOG_WARN << "HTTP " << status << " for " << url << ", will retry";
    }
    return sourceFromResponse(status, std::string(resp->body()), start, end);
}

std::unique_ptr<ByteSource> sourceFromResponse(int status, std::string body, uint64_t start, uint64_t end) {
    switch (classifyStatus(status)) {
        case RangeResponse::Partial:
            return std::make_unique<MemoryByteSource>(std::move(body));
        case RangeResponse::FullBody: {
            LOG_DEBUG << "Server ignored Range header, slicing full body at " << start;
            if (start >= body.size()) {
                return std::make_unique<MemoryByteSource>(std::string());
            }
            uint64_t available = body.size() - start;
            uint64_t span = std::min<uint64_t>(end - start, available - 1) + 1;
            return std::make_unique<MemoryByteSource>(
                body.substr(static_cast<size_t>(start), static_cast<size_t>(span)));
        }
        case RangeResponse::Unsatisfiable:
            return std::make_unique<MemoryByteSource>(std::string());
        case RangeResponse::Transient:
            throw TransientFetchError("HTTP status " + std::to_string(status));
        case RangeResponse::Permanent:
        default:
            throw FetchError("HTTP status " + std::to_string(status));
    }
}
