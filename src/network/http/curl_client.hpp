#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>
#include "http_client.hpp"

namespace Sonar {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_timeout(std::chrono::seconds timeout) override;
    Response get(const std::string& url) override;

    // Runs every transfer on one multi handle so slow sources overlap.
    std::vector<Response> get_all(const std::vector<std::string>& urls) override;

private:
    struct Request {
        std::string              url;
        long                     timeout_seconds = 10;
        bool                     follow_location = true;
        std::vector<std::string> extra_headers;
        std::string              user_agent;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct MultiDeleter {
        void operator()(CURLM* multi) const noexcept {
            if (multi)
                curl_multi_cleanup(multi);
        }
    };

    struct SlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::chrono::seconds               timeout_;

    Response   perform(const Request& req);
    Response   collect(CURL* curl, CURLcode res, const Request& req, std::string body) const;
    Response   create_error_response(const std::string& url, const std::string& msg) const;
    HeaderList setup_curl_options(CURL* curl, const Request& req, std::string& body) const;
    Request    create_request(const std::string& url) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Sonar
