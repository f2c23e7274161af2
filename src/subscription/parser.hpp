#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sonar/descriptor.hpp"

namespace Sonar {
namespace Subscription {

// Subscription text to deduplicated descriptors. Unparsable lines are skipped; never throws.
class Parser {
public:
    static std::vector<ServerDescriptor> parse(std::string_view text);

    // Single-line parsers. Each returns nullopt when the line is unusable.
    static std::optional<ServerDescriptor> parse_line(const std::string& line);
    static std::optional<ServerDescriptor> parse_vmess(const std::string& line);
    static std::optional<ServerDescriptor> parse_url_like(const std::string& line);
    static std::optional<ServerDescriptor> parse_shadowsocks(const std::string& line);

    // Returns the decoded text when `text` is a base64 block of descriptors,
    // otherwise the text unchanged.
    static std::string unwrap(std::string_view text);

    static std::vector<ServerDescriptor> deduplicate(std::vector<ServerDescriptor> descriptors);

private:
    static void parse_block(std::string_view text, int depth, std::vector<ServerDescriptor>& out);
};

std::optional<int> parse_port(std::string_view text);

}  // namespace Subscription
}  // namespace Sonar
