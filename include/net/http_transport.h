#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace ardl {

// Network-level failure: bad URL, connect/read error, non-2xx status, or
// a receiver that asked to stop.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpResponseHead {
    int status{0};
    std::optional<uint64_t> content_length;
};

// Return false to abort the transfer.
using ResponseHandler = std::function<bool(const HttpResponseHead& head)>;
using ContentReceiver = std::function<bool(const char* data, size_t length)>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Issue one streaming GET. Body bytes are handed to on_chunk as they
    // arrive. Throws TransportError on any failure.
    virtual void streamGet(const std::string& url,
                           const ResponseHandler& on_head,
                           const ContentReceiver& on_chunk) = 0;
};

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

// Split an absolute URL. Empty scheme/host when the URL is not absolute.
HttpUrl parseUrl(const std::string& url);

// cpp-httplib backed transport. One attempt per call, redirects followed.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::chrono::milliseconds timeout = std::chrono::minutes(10),
                              std::string hf_token = {});

    void streamGet(const std::string& url,
                   const ResponseHandler& on_head,
                   const ContentReceiver& on_chunk) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::string hf_token_;
};

}  // namespace ardl
