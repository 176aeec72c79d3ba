// Defines light, color and radiometry quantities exchanged
// between materials and integrators.
//
// Materials (material.h) produce these per path vertex;
// integrators consume them. Nothing here knows about geometry.
#pragma once

#include <Eigen/Dense>

namespace pathshade {

// Currently RGB.
using Spectrum = Eigen::Vector3f;

Spectrum fromRgb(float r, float g, float b);


// Stand-in for a Dirac delta measure.
// Both pdf and BSDF of a specular sample contain delta, and they
// always cancel in a Monte Carlo estimator, so 1 suffices numerically.
// Keep writing DELTA to remember that the value is not a density.
const float DELTA = 1.0;


// Probability of a sampled direction.
// density: ordinary solid-angle density.
// delta: the direction came from a delta distribution, and
//   value() is DELTA times the probability of choosing that branch.
//   Only bsdf / pdf is meaningful for such samples.
class Pdf {
public:
    static Pdf density(float value);
    static Pdf delta(float weight);

    bool isDelta() const;
    // Raw value to divide by. Identical to what the estimator
    // would use if delta were an ordinary number.
    float value() const;
private:
    Pdf(bool is_delta, float value);

    bool is_delta;
    float v;
};


// A direction drawn by Material::sample together with its
// pdf and BSDF value.
struct BSDFSample {
    BSDFSample(const Eigen::Vector3f& dir, const Pdf& pdf, const Spectrum& bsdf);

    Eigen::Vector3f dir;
    Pdf pdf;
    Spectrum bsdf;
};

}  // namespace
