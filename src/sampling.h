#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include <Eigen/Dense>

#include <space.h>

namespace pathshade {

// Random source for a single path.
// Sampler is not thread-safe; give each worker its own via split().
class Sampler {
public:
    Sampler();
    explicit Sampler(uint32_t seed);

    // Split this Sampler into independent but deterministic Samplers.
    // All children and this will be independent too.
    std::vector<Sampler> split(int n);

    // Uniform in [0, 1).
    float next01();

    // Directions around normal, expressed in the frame
    // (tangent, binormal, normal) from createOrthoNormalBasis.
    // pdf: 1 / (2 pi)
    Eigen::Vector3f uniformHemisphere(
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& tangent,
        const Eigen::Vector3f& binormal);
    // pdf: cos(theta) / pi
    Eigen::Vector3f cosineWeightedHemisphere(
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& tangent,
        const Eigen::Vector3f& binormal);
public:
    std::mt19937 gen;
};

}  // namespace
