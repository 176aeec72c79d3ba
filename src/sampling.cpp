#include "sampling.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>

#include <boost/range/irange.hpp>


namespace pathshade {

Sampler::Sampler() {
}

Sampler::Sampler(uint32_t seed) : gen(seed) {
}

float Sampler::next01() {
    // uniform_real_distribution<float> can round up to the upper bound.
    const float u = std::uniform_real_distribution<float>(0, 1)(gen);
    return (u < 1) ? u : std::nextafter(1.0f, 0.0f);
}

Eigen::Vector3f Sampler::uniformHemisphere(
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& tangent,
        const Eigen::Vector3f& binormal) {
    const float z = next01();
    const float phi = 2 * pi * next01();
    const float r = std::sqrt(std::max(0.0f, 1 - z * z));
    return tangent * (r * std::cos(phi)) +
        binormal * (r * std::sin(phi)) +
        normal * z;
}

Eigen::Vector3f Sampler::cosineWeightedHemisphere(
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& tangent,
        const Eigen::Vector3f& binormal) {
    const float phi = 2 * pi * next01();
    const float r2 = next01();
    const float r = std::sqrt(r2);
    const Eigen::Vector3f dir =
        tangent * (r * std::cos(phi)) +
        binormal * (r * std::sin(phi)) +
        normal * std::sqrt(1 - r2);
    return dir.normalized();
}

std::vector<Sampler> Sampler::split(int n) {
    assert(n >= 0);
    std::uniform_int_distribution<uint32_t> prob_seed(
        std::numeric_limits<uint32_t>::min(),
        std::numeric_limits<uint32_t>::max());
    std::vector<Sampler> samplers;
    for(int i : boost::irange(0, n)) {
        Sampler s = *this;
        s.gen.seed(prob_seed(gen));
        samplers.push_back(s);
    }
    return samplers;
}

}  // namespace
