#include "lan_health_check.hpp"

#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

LanHealthCheck::LanHealthCheck(std::string url) : url_(std::move(url)) {}

bool LanHealthCheck::is_ready() {
    auto resp = http::get(url_ + "/health", {.timeout_s = 5, .connect_timeout_s = 2});
    if (!resp) {
        std::println(stderr, "http: health check {} failed: {}", url_, resp.error());
        return false;
    }
    return is_healthy_response(*resp);
}

bool is_healthy_response(const http::Response& resp) {
    if (resp.status != 200) return false;

    auto j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto it = j.find("status");
    if (it == j.end() || !it->is_string()) return false;
    auto status = it->get<std::string>();
    return status == "ok" || status == "ready";
}
