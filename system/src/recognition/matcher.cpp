#include "recognition/matcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace facegate {

Matcher::Matcher(Storage& storage, float threshold)
    : storage(storage), threshold(threshold) {}

float Matcher::euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return -1.0f;

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += diff * diff;
    }
    return static_cast<float>(std::sqrt(sum));
}

double Matcher::confidence_from_distance(float distance) {
    double conf = std::round((1.0 - static_cast<double>(distance)) * 100.0 * 100.0) / 100.0;
    return std::min(100.0, std::max(0.0, conf));
}

MatchResult Matcher::match(const std::vector<float>& probe,
                           const std::vector<Identity>& candidates,
                           float threshold) {
    MatchResult result;
    float best = std::numeric_limits<float>::infinity();
    const Identity* winner = nullptr;

    for (const auto& identity : candidates) {
        float d = euclidean_distance(probe, identity.embedding);
        if (d < 0.0f) {
            spdlog::warn("⚠️  Embedding de '{}' con dimension {} (esperado {}), se omite",
                         identity.name, identity.embedding.size(), probe.size());
            continue;
        }
        if (d < threshold && d < best) {
            best = d;
            winner = &identity;
        }
    }

    if (winner) {
        result.matched = true;
        result.identity = *winner;
        result.distance = best;
        result.confidence = confidence_from_distance(best);
    }
    return result;
}

MatchResult Matcher::match(const std::vector<float>& probe) {
    auto candidates = storage.list_identities();
    MatchResult result = match(probe, candidates, threshold);

    if (result.matched) {
        spdlog::debug("Match: {} (dist={:.4f}, conf={:.2f}%) entre {} identidades",
                      result.identity.name, result.distance, result.confidence, candidates.size());
    } else {
        spdlog::debug("Sin match entre {} identidades", candidates.size());
    }
    return result;
}

}  // namespace facegate
