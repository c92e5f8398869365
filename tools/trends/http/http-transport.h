#pragma once

#include <map>
#include <string>

// Response of a single HTTP exchange
struct http_response {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Outbound HTTP seam used by the search and generation clients.
 *
 * Contract:
 * - A transport-level failure (DNS, connect, timeout) raises pipeline_error
 *   with kind UPSTREAM_UNAVAILABLE.
 * - Any HTTP status, including non-2xx, is returned to the caller, who decides
 *   whether it is a failure.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    // POST a JSON body. timeout_ms <= 0 disables the timeout.
    virtual http_response post_json(const std::string& url,
                                    const std::map<std::string, std::string>& headers,
                                    const std::string& body,
                                    int timeout_ms) = 0;
};

// libcurl-backed transport. curl_global_init() must be called once by the process.
class curl_transport : public http_transport {
public:
    http_response post_json(const std::string& url,
                            const std::map<std::string, std::string>& headers,
                            const std::string& body,
                            int timeout_ms) override;
};
