// ============= include/recognition/matcher.hpp =============
/*
 * Matcher - busqueda 1:N por distancia euclidiana
 *
 * - Solo se aceptan candidatos con distancia < threshold (0.6 por defecto)
 * - Gana el de menor distancia; en empate se queda el primero (orden de registro)
 * - confidence = round((1 - d) * 100, 2), acotada a [0, 100]
 */

#pragma once
#include "storage/storage.hpp"
#include <optional>
#include <vector>

namespace facegate {

struct MatchResult {
    bool matched = false;
    Identity identity;
    float distance = 0.0f;
    double confidence = 0.0;
};

class Matcher {
public:
    Matcher(Storage& storage, float threshold = 0.6f);

    MatchResult match(const std::vector<float>& probe);

    static MatchResult match(const std::vector<float>& probe,
                             const std::vector<Identity>& candidates,
                             float threshold);

    // -1 si las dimensiones no coinciden
    static float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

    static double confidence_from_distance(float distance);

    float get_threshold() const { return threshold; }

private:
    Storage& storage;
    float threshold;
};

}  // namespace facegate
