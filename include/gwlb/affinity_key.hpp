#pragma once

#include <map>
#include <string>
#include <string_view>

namespace gwlb {

using HeaderMap = std::map<std::string, std::string>;

// Session identifier carried by the request, or "" if none. Checked in order:
// X-Session-ID, Session-ID, bearer token, session cookie.
std::string extract_session_id(const HeaderMap& headers);

// Sticky key for a request: its session identifier, else "<client_ip>-<user_agent>".
std::string affinity_key(const HeaderMap& headers, std::string_view client_ip,
                         std::string_view user_agent);

// Upstream responses below 400 count as successes for health accounting.
inline bool is_success_status(int status) {
    return status > 0 && status < 400;
}

} // namespace gwlb
