#include "net/http_transport.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace ardl {

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isHfHost(const std::string& host) {
    const auto lower = toLowerAscii(host);
    const std::string suffix = ".huggingface.co";
    return lower == "huggingface.co" ||
           (lower.size() > suffix.size() &&
            lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0);
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        throw TransportError("HTTPS is not supported in this build");
    }
#endif

    // Build scheme://host:port format for Client's universal interface
    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!client->is_valid()) {
        throw TransportError("failed to create HTTP client for " + scheme_host_port);
    }
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(true);
    return client;
}

}  // namespace

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = toLowerAscii(match[1].str());
        parsed.host = match[2].str();
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

HttplibTransport::HttplibTransport(std::chrono::milliseconds timeout, std::string hf_token)
    : timeout_(timeout), hf_token_(std::move(hf_token)) {}

void HttplibTransport::streamGet(const std::string& url,
                                 const ResponseHandler& on_head,
                                 const ContentReceiver& on_chunk) {
    HttpUrl parsed = parseUrl(url);
    if (parsed.scheme.empty() || parsed.host.empty()) {
        throw TransportError("invalid URL: " + url);
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw TransportError("unsupported URL scheme: " + parsed.scheme);
    }

    auto client = makeClient(parsed, timeout_);

    httplib::Headers headers;
    if (!hf_token_.empty() && isHfHost(parsed.host)) {
        headers.emplace("Authorization", "Bearer " + hf_token_);
    }

    int status = 0;
    auto result = client->Get(
        parsed.path,
        headers,
        [&](const httplib::Response& res) {
            status = res.status;
            if (res.status < 200 || res.status >= 300) {
                return false;
            }
            HttpResponseHead head;
            head.status = res.status;
            if (res.has_header("Content-Length")) {
                try {
                    head.content_length = std::stoull(res.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    head.content_length.reset();
                }
            }
            return on_head ? on_head(head) : true;
        },
        [&](const char* data, size_t data_length) {
            return on_chunk(data, data_length);
        });

    if (status != 0 && (status < 200 || status >= 300)) {
        throw TransportError("HTTP " + std::to_string(status) + " from " + parsed.host);
    }
    if (!result) {
        throw TransportError("GET " + url + " failed: " + httplib::to_string(result.error()));
    }
    if (result->status < 200 || result->status >= 300) {
        throw TransportError("HTTP " + std::to_string(result->status) + " from " + parsed.host);
    }
    spdlog::debug("HttplibTransport: GET {} -> {}", url, result->status);
}

}  // namespace ardl
