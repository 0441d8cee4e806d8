#pragma once

#include "backend.hpp"
#include "http.hpp"

#include <string>

// Ready when GET <url>/health answers 200 with {"status": "ok"|"ready"}.
class LanHealthCheck : public ModelReadiness {
public:
    explicit LanHealthCheck(std::string url);

    bool is_ready() override;

private:
    std::string url_;
};

bool is_healthy_response(const http::Response& resp);
