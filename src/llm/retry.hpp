#pragma once
#include "../https_client.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <chrono>
#include <string>

namespace termineer {

struct RetryConfig {
    int max_attempts = 5;
    int initial_backoff_ms = 1000;
    int max_backoff_ms = 30000;
    int request_timeout_secs = 180;

    nlohmann::json to_json() const;
    static RetryConfig from_json(const nlohmann::json& j);
};

// Longest retry-after honoured; larger header values are clamped.
constexpr long MAX_RETRY_AFTER_SECS = 3600;

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// initial * 2^(attempt-1), capped, with +/-10% jitter. attempt starts at 1.
int backoff_ms(const RetryConfig& cfg, int attempt);

// Runs request until it returns 2xx. 429 waits retry-after seconds when the
// header is present, else backoff; 5xx and transport failures back off.
// Other statuses throw LlmError(api_error) immediately. Exhausted 429s throw
// LlmError(rate_limit).
HttpsResponse send_with_retry(const RetryConfig& cfg,
                              const std::function<HttpsResponse()>& request,
                              const std::string& backend_name,
                              const SleepFn& sleep = nullptr);

} // namespace termineer
