#include "scanner.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include "../../core/logger/logger.hpp"
#include "../../subscription/parser.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "../scheduler/scheduler.hpp"

namespace Sonar {
namespace Engine {

using namespace Sonar::Core;
using json = nlohmann::json;

namespace {

// Missing, zero or non-numeric values read as 0 so the clamp picks the default.
int numeric_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_number())
        return 0;
    double value = it->get<double>();
    if (!std::isfinite(value))
        return 0;
    value = std::clamp(value, -1e9, 1e9);
    return static_cast<int>(std::lround(value));
}

std::string join_lines(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty())
            out += '\n';
        out += part;
    }
    return out;
}

}  // namespace

ScanRequest ScanRequest::from_json(const json& body) {
    if (!body.is_object())
        throw RequestError(400, "Request body must be a JSON object");

    ScanRequest request;
    auto        sources = body.find("sources");
    if (sources != body.end() && sources->is_array()) {
        for (const auto& entry : *sources) {
            if (entry.is_string())
                request.sources.push_back(entry.get<std::string>());
        }
    }

    auto raw_text = body.find("rawText");
    if (raw_text != body.end() && raw_text->is_string())
        request.raw_text = raw_text->get<std::string>();

    request.timeout_ms  = clamp_timeout_ms(numeric_field(body, "timeoutMs"));
    request.concurrency = clamp_concurrency(numeric_field(body, "concurrency"));
    return request;
}

json to_json(const ScanResult& result) {
    const auto& d = result.descriptor;
    json        j = {{"scheme", to_string(d.scheme)},
                     {"host", d.host},
                     {"port", d.port},
                     {"name", d.name},
                     {"isTls", d.use_tls},
                     {"security", d.security},
                     {"network", d.network},
                     {"transport", to_string(d.transport)},
                     {"wsPath", d.transport_path},
                     {"wsHost", d.transport_host},
                     {"sni", d.sni},
                     {"alpn", d.alpn},
                     {"raw", d.raw},
                     {"ok", result.outcome.ok},
                     {"ms", result.outcome.elapsed_ms}};
    if (result.outcome.error)
        j["error"] = *result.outcome.error;
    return j;
}

json ScanReport::to_json() const {
    json list = json::array();
    for (const auto& result : results)
        list.push_back(Engine::to_json(result));

    return {{"total", total}, {"ok", reachable}, {"timeoutMs", timeout_ms}, {"results", list}};
}

std::vector<ScanResult> rank(std::vector<ScanResult> results, size_t limit) {
    std::vector<ScanResult> reachable;
    for (auto& result : results) {
        if (result.outcome.ok)
            reachable.push_back(std::move(result));
    }

    std::stable_sort(reachable.begin(), reachable.end(), [](const auto& a, const auto& b) {
        return a.outcome.elapsed_ms < b.outcome.elapsed_ms;
    });
    if (reachable.size() > limit)
        reachable.resize(limit);
    return reachable;
}

Scanner::Scanner(std::unique_ptr<Network::Http::HttpClient> client,
                 std::unique_ptr<Probe::ProbeSelector>      selector,
                 ScannerConfig                              config)
    : client_(std::move(client)),
      selector_(std::move(selector)),
      config_(config) {
    if (client_)
        client_->set_timeout(std::chrono::seconds(config_.fetch_timeout));
}

std::string Scanner::gather_text(const ScanRequest& request) {
    std::vector<std::string> urls;
    std::vector<std::string> inline_sources;

    for (const auto& source : request.sources) {
        std::string trimmed = Utils::Text::trim(source);
        if (trimmed.empty())
            continue;

        if (Utils::Url::is_http_url(trimmed))
            urls.push_back(std::move(trimmed));
        else
            inline_sources.push_back(std::move(trimmed));
    }

    std::vector<std::string> parts;
    if (!urls.empty() && !client_)
        Logger::warn("Scanner: no HTTP client, skipping " + std::to_string(urls.size())
                     + " URL source(s)");

    if (!urls.empty() && client_) {
        auto responses = client_->get_all(urls);
        for (size_t i = 0; i < urls.size() && i < responses.size(); ++i) {
            auto& response = responses[i];
            if (!response.success) {
                Logger::warn("Scanner: failed to fetch " + urls[i] + ": " + response.error);
                continue;
            }
            Logger::info("Scanner: fetched " + urls[i] + " ("
                         + std::to_string(response.body.size()) + " bytes)");
            parts.push_back(std::move(response.body));
        }
    }
    size_t fetched = parts.size();

    if (!inline_sources.empty())
        parts.push_back(join_lines(inline_sources));
    if (!Utils::Text::trim(request.raw_text).empty())
        parts.push_back(request.raw_text);

    if (!urls.empty() && fetched == 0 && parts.empty())
        throw RequestError(422, "None of the subscription URLs could be fetched");

    return join_lines(parts);
}

ScanReport Scanner::run(const ScanRequest& request) {
    ScanReport report;
    report.timeout_ms = request.timeout_ms;

    auto descriptors = Subscription::Parser::parse(gather_text(request));
    report.total     = descriptors.size();
    if (descriptors.empty()) {
        Logger::info("Scanner: no descriptors found");
        return report;
    }

    Logger::info("Scanner: probing " + std::to_string(descriptors.size()) + " server(s), timeout "
                 + std::to_string(request.timeout_ms) + "ms, concurrency "
                 + std::to_string(request.concurrency));

    ScanScheduler scheduler(*selector_, config_.io_threads);
    auto          results = scheduler.scan(
        descriptors, std::chrono::milliseconds(request.timeout_ms), request.concurrency);

    report.reachable = static_cast<size_t>(std::count_if(
        results.begin(), results.end(), [](const auto& r) { return r.outcome.ok; }));
    report.results   = rank(std::move(results), config_.max_results);

    Logger::success("Scanner: " + std::to_string(report.reachable) + "/"
                    + std::to_string(report.total) + " reachable");
    return report;
}

}  // namespace Engine
}  // namespace Sonar
