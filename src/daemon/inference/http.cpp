#include "http.hpp"

#include <curl/curl.h>

namespace http {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Owns the easy handle plus whatever request body state it points at.
struct Request {
    CURL* curl = nullptr;
    curl_mime* mime = nullptr;
    curl_slist* headers = nullptr;

    Request() : curl(curl_easy_init()) {}
    ~Request() {
        if (mime) curl_mime_free(mime);
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;
};

std::expected<Response, std::string> perform(Request& req, const std::string& url,
                                             const Options& opts) {
    Response resp;

    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, opts.timeout_s);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_s);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace

GlobalInit::GlobalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GlobalInit::~GlobalInit() {
    curl_global_cleanup();
}

std::expected<Response, std::string> get(const std::string& url, const Options& opts) {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");

    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    return perform(req, url, opts);
}

std::expected<Response, std::string> post_form(const std::string& url,
                                               const std::vector<FormPart>& parts,
                                               const Options& opts) {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");

    req.mime = curl_mime_init(req.curl);
    for (const auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(req.mime);
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.data.data(), p.data.size());
        if (!p.filename.empty()) curl_mime_filename(part, p.filename.c_str());
        if (!p.content_type.empty()) curl_mime_type(part, p.content_type.c_str());
    }

    curl_easy_setopt(req.curl, CURLOPT_MIMEPOST, req.mime);
    return perform(req, url, opts);
}

std::expected<Response, std::string> post_body(const std::string& url,
                                               std::span<const uint8_t> body,
                                               const std::string& content_type,
                                               const Options& opts) {
    Request req;
    if (!req.curl) return std::unexpected("curl_easy_init failed");

    auto header = "Content-Type: " + content_type;
    req.headers = curl_slist_append(req.headers, header.c_str());

    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body.data()));
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
    return perform(req, url, opts);
}

} // namespace http
