#pragma once

#include <string>
#include <map>
#include <memory>
#include <stdexcept>
#include <chrono>

namespace capscale {
namespace client {

/**
 * HTTP request description
 */
struct HttpRequest {
    std::string method;                          // GET, POST, PUT
    std::string path;                            // Relative to the transport base URL, query included
    std::string body;                            // Empty for body-less requests
    std::map<std::string, std::string> headers;
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration{0};

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Transport-level failure (connection refused, DNS, TLS, timeout).
 * HTTP error statuses are not transport failures and are returned as responses.
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Abstract request/response transport.
 *
 * The management-API components only see this interface; tests substitute a
 * scripted transport for the libcurl one.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Send one request and return the response, whatever its status.
     * @throws HttpClientError on transport failure
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * libcurl-backed HTTP client
 *
 * Features:
 * - Single attempt per request: callers decide what a failure means
 * - Configurable per-request timeout (default 30s)
 * - Connection reuse via one libcurl easy handle
 * - Request/response logging in debug mode (Authorization redacted)
 *
 * Not thread-safe: one client per invocation.
 */
class HttpClient : public HttpTransport {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "https://management.azure.com")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse send(const HttpRequest& request) override;

    /**
     * GET request
     * @param path Path relative to base_url
     * @param headers Additional headers (e.g., {"Authorization": "Bearer TOKEN"})
     * @throws HttpClientError on transport failure
     */
    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    /**
     * POST request (empty body allowed)
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /**
     * PUT request (full-representation replace)
     */
    HttpResponse put(const std::string& path,
                     const std::string& body,
                     const std::map<std::string, std::string>& headers = {});

    const std::string& base_url() const { return base_url_; }
    int timeout_ms() const { return timeout_ms_; }

    /**
     * Set debug mode (logs requests/responses to stderr, redacts tokens)
     */
    void set_debug(bool debug) { debug_ = debug; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    bool debug_;
};

} // namespace client
} // namespace capscale
