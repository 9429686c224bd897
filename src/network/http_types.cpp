#include "tusup/network/http_types.hpp"

#include <sstream>

namespace tusup {
namespace network {

std::vector<uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;

    // Request line
    oss << HttpMethodUtils::to_string(method) << " " << url.target << " HTTP/1.1\r\n";

    oss << "Host: " << url.authority() << "\r\n";
    for (const auto& [name, value] : headers) {
        if (name.empty()) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!headers.contains("Content-Length") &&
        (!body.empty() || method == HttpMethod::POST || method == HttpMethod::PUT ||
         method == HttpMethod::PATCH)) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    if (!headers.contains("Connection")) {
        oss << "Connection: close\r\n";
    }

    // Empty line separates headers from body
    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace network
} // namespace tusup
