#pragma once

#include <string>

namespace scriptbox::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;
    bool valid = false;

    // "http://host:port", the form httplib::Client accepts.
    std::string SchemeHostPort() const;
};

// Understands http:// and https:// URLs; anything without a scheme is
// treated as https. `valid` is false when the host or port is unusable.
ParsedUrl ParseUrl(const std::string& url);

}  // namespace scriptbox::utils
