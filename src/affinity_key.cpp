#include "gwlb/affinity_key.hpp"
#include <xxhash.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace gwlb {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<std::string_view> header(const HeaderMap& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::string session_cookie(std::string_view cookies) {
    constexpr std::array<std::string_view, 4> names = {"session_id", "sessionid", "JSESSIONID", "SESSION"};

    while (!cookies.empty()) {
        const size_t end = cookies.find(';');
        std::string_view pair = trim(cookies.substr(0, end));
        cookies = end == std::string_view::npos ? std::string_view{} : cookies.substr(end + 1);

        const size_t eq = pair.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        std::string_view name = trim(pair.substr(0, eq));
        std::string_view value = trim(pair.substr(eq + 1));
        if (value.empty()) {
            continue;
        }
        for (auto candidate : names) {
            if (iequals(name, candidate)) {
                return fmt::format("cookie-{}", value);
            }
        }
    }
    return {};
}

} // namespace

std::string extract_session_id(const HeaderMap& headers) {
    for (std::string_view name : {"X-Session-ID", "Session-ID"}) {
        if (auto value = header(headers, name); value && !trim(*value).empty()) {
            return std::string(trim(*value));
        }
    }

    if (auto auth = header(headers, "Authorization")) {
        std::string_view value = trim(*auth);
        constexpr std::string_view bearer = "Bearer ";
        if (value.size() > bearer.size() && iequals(value.substr(0, bearer.size()), bearer)) {
            std::string_view token = trim(value.substr(bearer.size()));
            if (!token.empty()) {
                return fmt::format("jwt-{:016x}", XXH64(token.data(), token.size(), 0));
            }
        }
    }

    if (auto cookies = header(headers, "Cookie")) {
        return session_cookie(*cookies);
    }

    return {};
}

std::string affinity_key(const HeaderMap& headers, std::string_view client_ip,
                         std::string_view user_agent) {
    std::string session = extract_session_id(headers);
    if (!session.empty()) {
        return session;
    }
    return fmt::format("{}-{}", client_ip, user_agent);
}

} // namespace gwlb
