#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace httplib {
class Client;
}

namespace ontoreg {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

// Split "scheme://host[:port][/path]". Fields stay empty when the URL does
// not match or the port is outside 1..65535; the path defaults to "/".
HttpUrl parseUrl(const std::string& url);

// scheme://host:port
std::string originOf(const HttpUrl& url);

// Client with connection/read/write timeouts and redirect following.
// Returns nullptr for malformed URLs and for https in builds without
// OpenSSL support.
std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout);

// "ontoreg/<version>"
std::string userAgent();

}  // namespace ontoreg
