#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <thread>

namespace http_pipeline {
namespace util {

inline std::string toupper(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'a' && c <= 'z')
            c -= 32;
    return s;
}

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x += 32;
        if (y >= 'A' && y <= 'Z') y += 32;
        if (x != y)
            return false;
    }
    return true;
}

// Seconds since epoch
inline double current_time() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * Generate jitter value for backoff delays.
 * Returns a value in range [-max, max] with log-normal distribution.
 */
inline float jitter_generator(float max) {
    max = std::max(0.0f, max);
    if (max == 0.0f) return 0.0f;

    thread_local std::mt19937_64 rg{
        [] {
            std::random_device rd;
            std::seed_seq seq{
                rd(), rd(), rd(), rd(),
                static_cast<unsigned>(
                    std::hash<std::thread::id>{}(std::this_thread::get_id()))
            };
            return std::mt19937_64(seq);
        }()
    };

    // ---- sigma scaling with max ----
    const float ref       = 1e-3f;  // 1ms
    const float sigma_min = 0.3f;
    const float sigma_max = 1.5f;

    float sigma = std::clamp(
        0.4f + 0.3f * std::log1p(max / ref),
        sigma_min,
        sigma_max
    );

    // median ≈ 5% of max
    float mu = std::log(0.05f * max + 1e-12f);

    std::lognormal_distribution<float> mag_dist(mu, sigma);
    std::bernoulli_distribution sign_dist(0.5);

    float mag = mag_dist(rg);
    if (mag > max) mag = max;

    return sign_dist(rg) ? mag : -mag;
}

} // namespace util
} // namespace http_pipeline
