// ============================================================
// session_context.cpp
// ============================================================

#include "session_context.hpp"
#include "../common/utils.hpp"

std::string SessionContext::instance_url(bool use_ssl) const {
    std::string h = host;
    // Tolerate a host stored with its scheme
    if (utils::starts_with(h, "https://")) h = h.substr(8);
    else if (utils::starts_with(h, "http://")) h = h.substr(7);
    while (!h.empty() && h.back() == '/') h.pop_back();

    std::string url = use_ssl ? "https://" : "http://";
    url += h;
    u16 p = use_ssl ? ssl_port : port;
    u16 default_port = use_ssl ? 443 : 80;
    if (p != 0 && p != default_port) {
        url += ":" + std::to_string(p);
    }
    return url;
}
