#include "api/http_client.hpp"
#include <curl/curl.h>
#include <iostream>
#include <sstream>

namespace capscale {
namespace client {

namespace {

// Response body and headers collected by the libcurl callbacks
struct ResponseCapture {
    std::string body;
    std::map<std::string, std::string> headers;
};

size_t on_body(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t chunk = size * nmemb;
    static_cast<ResponseCapture*>(userp)->body.append(static_cast<char*>(contents), chunk);
    return chunk;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t chunk = size * nitems;
    std::string line(buffer, chunk);

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return chunk;   // status line or blank separator
    }

    const char* whitespace = " \t\r\n";
    std::string value = line.substr(colon + 1);
    size_t first = value.find_first_not_of(whitespace);
    size_t last = value.find_last_not_of(whitespace);
    value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);

    static_cast<ResponseCapture*>(userdata)->headers[line.substr(0, colon)] = value;
    return chunk;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList build_header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
    list = curl_slist_append(list, "Accept: application/json");
    for (const auto& [name, value] : headers) {
        if (name == "Content-Type" || name == "Accept") {
            continue;
        }
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    return HeaderList(list);
}

} // namespace

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            curl_global_cleanup();
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        curl_easy_cleanup(curl);
        curl_global_cleanup();
    }

    // Method-specific options; PUT and POST carry the body verbatim
    void set_method(const std::string& method, const std::string& body) {
        if (method == "GET") {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            return;
        }
        if (method == "PUT") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
        } else {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
        }
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , debug_(false)
{
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::send(const HttpRequest& request) {
    if (request.method != "GET" && request.method != "POST" && request.method != "PUT") {
        throw HttpClientError("Unsupported HTTP method: " + request.method);
    }

    const std::string url = base_url_ + request.path;
    CURL* curl = impl_->curl;

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    impl_->set_method(request.method, request.body);

    HeaderList header_list = build_header_list(request.headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    ResponseCapture capture;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &capture);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &capture);

    if (debug_) {
        std::cerr << "[HttpClient] --> " << request.method << " " << url << std::endl;
        for (const auto& [name, value] : request.headers) {
            std::cerr << "[HttpClient]     " << name << ": "
                      << (name == "Authorization" ? std::string("[REDACTED]") : value) << std::endl;
        }
        if (!request.body.empty()) {
            std::cerr << "[HttpClient]     " << request.body << std::endl;
        }
    }

    auto started = std::chrono::steady_clock::now();
    CURLcode code = curl_easy_perform(curl);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "CURL error on " << request.method << " " << url << ": " << curl_easy_strerror(code);
        throw HttpClientError(oss.str());
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

    if (debug_) {
        std::cerr << "[HttpClient] <-- " << status_code << " " << request.method << " " << url
                  << " (" << duration.count() << "ms, " << capture.body.size() << " bytes)" << std::endl;
    }

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(capture.body);
    response.headers = std::move(capture.headers);
    response.duration = duration;
    return response;
}

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    return send(HttpRequest{"GET", path, "", headers});
}

HttpResponse HttpClient::post(const std::string& path,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers) {
    return send(HttpRequest{"POST", path, body, headers});
}

HttpResponse HttpClient::put(const std::string& path,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers) {
    return send(HttpRequest{"PUT", path, body, headers});
}

} // namespace client
} // namespace capscale
