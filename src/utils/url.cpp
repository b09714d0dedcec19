#include "utils/url.hpp"

#include <cctype>

namespace scriptbox::utils {

std::string ParsedUrl::SchemeHostPort() const {
    std::string scheme_host_port = https ? "https://" : "http://";
    scheme_host_port += host + ":" + std::to_string(port);
    return scheme_host_port;
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    } else {
        parsed.path = "/";
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        const auto port_text = host_port.substr(colon_pos + 1);
        if (port_text.empty() || port_text.size() > 5) {
            return parsed;
        }
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return parsed;
            }
        }
        parsed.port = std::stoi(port_text);
    } else {
        parsed.host = host_port;
    }

    parsed.valid = !parsed.host.empty() && parsed.port > 0 && parsed.port <= 65535;
    return parsed;
}

}  // namespace scriptbox::utils
