#include "curl_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"

namespace Sonar {
namespace Network {
namespace Http {

namespace {

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR: return ErrorType::Network;
        default: return ErrorType::Other;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    if (!body)
        return 0;

    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

Response CurlClient::create_error_response(const std::string& url, const std::string& msg) const {
    Response r;
    r.effective_url = url;
    r.success       = false;
    r.error         = msg;
    r.error_type    = ErrorType::Network;
    return r;
}

CurlClient::HeaderList
CurlClient::setup_curl_options(CURL* curl, const Request& req, std::string& body) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());

    curl_slist* raw = nullptr;
    for (const auto& h : req.extra_headers)
        raw = curl_slist_append(raw, h.c_str());
    HeaderList header_list(raw);
    if (raw)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);

    // The list must outlive curl_easy_perform().
    return header_list;
}

CurlClient::Request CurlClient::create_request(const std::string& url) const {
    Request req;
    req.url             = url;
    req.timeout_seconds = static_cast<long>(timeout_.count());
    req.user_agent      = Sonar::Core::Constants::USER_AGENT;
    req.extra_headers   = {"Cache-Control: no-cache", "Pragma: no-cache"};
    return req;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      timeout_(Sonar::Core::Constants::FETCH_TIMEOUT_SECONDS) {
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

Response CurlClient::perform(const Request& req) {
    if (!curl_)
        return create_error_response(req.url, "Failed to initialize CURL handle");

    std::string body;
    auto        headers = setup_curl_options(curl_.get(), req, body);
    CURLcode    res     = curl_easy_perform(curl_.get());
    return collect(curl_.get(), res, req, std::move(body));
}

Response
CurlClient::collect(CURL* curl, CURLcode res, const Request& req, std::string body) const {
    Response response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    response.effective_url = eff_url_ptr ? std::string(eff_url_ptr) : req.url;

    if (res != CURLE_OK) {
        response.success    = false;
        response.error      = curl_easy_strerror(res);
        response.error_type = map_curl_code_to_error_type(res);
        return response;
    }

    response.success = response.status_code >= 200 && response.status_code < 300;
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Status;
        return response;
    }

    response.body = std::move(body);
    return response;
}

Response CurlClient::get(const std::string& url) {
    return perform(create_request(url));
}

std::vector<Response> CurlClient::get_all(const std::vector<std::string>& urls) {
    if (urls.size() < 2)
        return HttpClient::get_all(urls);

    std::unique_ptr<CURLM, MultiDeleter> multi(curl_multi_init());
    if (!multi)
        return HttpClient::get_all(urls);

    struct Transfer {
        Request                            req;
        std::unique_ptr<CURL, CurlDeleter> handle;
        HeaderList                         headers;
        std::string                        body;
        CURLcode                           result = CURLE_FAILED_INIT;
        bool                               added  = false;
    };

    // Sized once: each handle writes into its own Transfer::body.
    std::vector<Transfer> transfers(urls.size());
    for (size_t i = 0; i < urls.size(); ++i) {
        auto& t  = transfers[i];
        t.req    = create_request(urls[i]);
        t.handle.reset(curl_easy_init());
        if (!t.handle)
            continue;
        t.headers = setup_curl_options(t.handle.get(), t.req, t.body);
        t.added   = curl_multi_add_handle(multi.get(), t.handle.get()) == CURLM_OK;
    }

    int running = 0;
    do {
        CURLMcode mc = curl_multi_perform(multi.get(), &running);
        if (mc == CURLM_OK && running > 0)
            mc = curl_multi_poll(multi.get(), nullptr, 0, 1000, nullptr);
        if (mc != CURLM_OK) {
            Sonar::Core::Logger::warn(std::string("CurlClient: multi transfer failed: ")
                                      + curl_multi_strerror(mc));
            break;
        }
    } while (running > 0);

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi.get(), &queued)) {
        if (msg->msg != CURLMSG_DONE)
            continue;
        for (auto& t : transfers) {
            if (t.handle.get() == msg->easy_handle)
                t.result = msg->data.result;
        }
    }

    std::vector<Response> responses;
    responses.reserve(transfers.size());
    for (auto& t : transfers) {
        if (!t.added) {
            responses.push_back(create_error_response(t.req.url, "Failed to initialize CURL handle"));
            continue;
        }
        curl_multi_remove_handle(multi.get(), t.handle.get());
        responses.push_back(collect(t.handle.get(), t.result, t.req, std::move(t.body)));
    }
    return responses;
}

}  // namespace Http
}  // namespace Network
}  // namespace Sonar
