#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace Sonar {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Status, Other };

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

// Blocking fetch client; failures are reported in Response, never thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_timeout(std::chrono::seconds /*timeout*/){};
    virtual Response get(const std::string& url) = 0;

    // One response per url, in order. Implementations may fetch concurrently.
    virtual std::vector<Response> get_all(const std::vector<std::string>& urls) {
        std::vector<Response> responses;
        responses.reserve(urls.size());
        for (const auto& url : urls)
            responses.push_back(get(url));
        return responses;
    }
};

}  // namespace Http
}  // namespace Network
}  // namespace Sonar
