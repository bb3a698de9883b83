#pragma once

// ============================================================
// curl_transport.hpp -- Transport backed by libcurl easy handles
//
// One easy handle per request, so perform() may run on any
// number of worker threads at once.
// ============================================================

#include "transport.hpp"
#include <string>

struct CurlTransportOptions {
    u32         connect_timeout_ms{30000};
    bool        verify_tls{true};
    std::string ca_bundle;          // empty: libcurl default
    bool        follow_redirects{true};
    bool        verbose{false};     // libcurl's own trace on stderr
};

class CurlTransport : public Transport {
public:
    explicit CurlTransport(CurlTransportOptions opts = CurlTransportOptions{});

    TransportResult perform(const TransportRequest& request,
                            const TransportProgress& progress,
                            const AbortCheck& should_abort) override;

private:
    CurlTransportOptions opts_;
};
