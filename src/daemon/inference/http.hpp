#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Thin blocking libcurl wrapper shared by the LAN inference adapters.
namespace http {

struct Response {
    long status = 0;
    std::string body;
};

struct FormPart {
    std::string name;
    std::string data;
    std::string filename;     // set for file parts
    std::string content_type; // set for file parts
};

struct Options {
    long timeout_s = 0;         // whole request, 0 = no limit
    long connect_timeout_s = 10;
};

// curl_global_init/cleanup for the lifetime of the object. Create one in main().
class GlobalInit {
public:
    GlobalInit();
    ~GlobalInit();
    GlobalInit(const GlobalInit&) = delete;
    GlobalInit& operator=(const GlobalInit&) = delete;
};

std::expected<Response, std::string> get(const std::string& url, const Options& opts = {});

std::expected<Response, std::string> post_form(const std::string& url,
                                               const std::vector<FormPart>& parts,
                                               const Options& opts = {});

std::expected<Response, std::string> post_body(const std::string& url,
                                               std::span<const uint8_t> body,
                                               const std::string& content_type,
                                               const Options& opts = {});

} // namespace http
