#include "utils/http_client.h"

#include <httplib.h>
#include <ctime>
#include <regex>

#include "utils/version.h"

namespace ontoreg {

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (!std::regex_match(url, match, re)) {
        return parsed;
    }

    int port = match[1].str() == "https" ? 443 : 80;
    if (match[3].matched) {
        const auto digits = match[3].str();
        if (digits.size() > 5) return parsed;
        const unsigned long value = std::stoul(digits);
        if (value == 0 || value > 65535) return parsed;
        port = static_cast<int>(value);
    }

    parsed.scheme = match[1].str();
    parsed.host = match[2].str();
    parsed.port = port;
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

std::string originOf(const HttpUrl& url) {
    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }
    return scheme_host_port;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (url.scheme.empty() || url.host.empty()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(originOf(url));
    if (client && client->is_valid()) {
        const auto sec = static_cast<time_t>(timeout.count() / 1000);
        const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }

    return nullptr;
}

std::string userAgent() {
    return std::string("ontoreg/") + ONTOREG_VERSION;
}

}  // namespace ontoreg
