#include "light.h"

namespace pathshade {

Spectrum fromRgb(float r, float g, float b) {
    return Spectrum(r, g, b);
}


Pdf::Pdf(bool is_delta, float value) : is_delta(is_delta), v(value) {
}

Pdf Pdf::density(float value) {
    return Pdf(false, value);
}

Pdf Pdf::delta(float weight) {
    return Pdf(true, DELTA * weight);
}

bool Pdf::isDelta() const {
    return is_delta;
}

float Pdf::value() const {
    return v;
}


BSDFSample::BSDFSample(
        const Eigen::Vector3f& dir, const Pdf& pdf, const Spectrum& bsdf) :
        dir(dir), pdf(pdf), bsdf(bsdf) {
}

}  // namespace
