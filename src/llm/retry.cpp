#include "retry.hpp"
#include "backend.hpp"
#include "../buffer.hpp"
#include <algorithm>
#include <random>
#include <thread>
#include <cstdlib>

namespace termineer {

nlohmann::json RetryConfig::to_json() const {
    return {
        {"max_attempts", max_attempts},
        {"initial_backoff_ms", initial_backoff_ms},
        {"max_backoff_ms", max_backoff_ms},
        {"request_timeout_secs", request_timeout_secs}
    };
}

RetryConfig RetryConfig::from_json(const nlohmann::json& j) {
    RetryConfig c;
    if (!j.is_object()) return c;
    c.max_attempts = std::max(1, j.value("max_attempts", c.max_attempts));
    c.initial_backoff_ms = j.value("initial_backoff_ms", c.initial_backoff_ms);
    c.max_backoff_ms = j.value("max_backoff_ms", c.max_backoff_ms);
    c.request_timeout_secs = j.value("request_timeout_secs", c.request_timeout_secs);
    return c;
}

int backoff_ms(const RetryConfig& cfg, int attempt) {
    double base = cfg.initial_backoff_ms;
    for (int i = 1; i < attempt && base < cfg.max_backoff_ms; i++) base *= 2;
    base = std::min(base, static_cast<double>(cfg.max_backoff_ms));

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> jitter(-0.1, 0.1);
    double ms = base * (1.0 + jitter(rng));
    return static_cast<int>(std::min(ms, static_cast<double>(cfg.max_backoff_ms)));
}

static std::string excerpt(const std::string& body) {
    return body.size() > 500 ? body.substr(0, 500) + "..." : body;
}

HttpsResponse send_with_retry(const RetryConfig& cfg,
                              const std::function<HttpsResponse()>& request,
                              const std::string& backend_name,
                              const SleepFn& sleep) {
    auto do_sleep = [&](int ms) {
        if (sleep) sleep(std::chrono::milliseconds(ms));
        else std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    };

    int attempts = std::max(1, cfg.max_attempts);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        HttpsResponse resp = request();
        if (resp.ok()) return resp;

        bool last = attempt == attempts;
        if (resp.status == 429) {
            std::optional<int> retry_after;
            std::string ra = resp.header("retry-after");
            if (!ra.empty()) {
                char* end = nullptr;
                long v = std::strtol(ra.c_str(), &end, 10);
                if (end != ra.c_str() && v >= 0) {
                    retry_after = static_cast<int>(std::min(v, MAX_RETRY_AFTER_SECS));
                }
            }
            if (last) {
                throw LlmError(LlmErrorKind::rate_limit,
                               backend_name + " rate limit exceeded after " + std::to_string(attempts) + " attempts",
                               retry_after);
            }
            int wait = retry_after ? *retry_after * 1000 : backoff_ms(cfg, attempt);
            out::system(backend_name + ": rate limited, retrying in " + std::to_string(wait) + "ms (attempt " +
                        std::to_string(attempt) + "/" + std::to_string(attempts) + ")");
            do_sleep(wait);
            continue;
        }

        if (resp.status == 0 || resp.status >= 500) {
            std::string what = resp.status == 0 ? resp.error : "status " + std::to_string(resp.status);
            if (last) {
                throw LlmError(LlmErrorKind::api_error,
                               backend_name + " request failed after " + std::to_string(attempts) +
                               " attempts: " + what);
            }
            int wait = backoff_ms(cfg, attempt);
            out::system(backend_name + ": " + what + ", retrying in " + std::to_string(wait) + "ms");
            do_sleep(wait);
            continue;
        }

        throw LlmError(LlmErrorKind::api_error,
                       backend_name + " returned status " + std::to_string(resp.status) + ": " + excerpt(resp.body));
    }
    throw LlmError(LlmErrorKind::other, backend_name + ": retry loop exited unexpectedly");
}

} // namespace termineer
