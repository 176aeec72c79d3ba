#include "material.h"

#include <algorithm>
#include <cmath>
#include <string>

#include <glog/logging.h>

namespace pathshade {

namespace {

void checkReflectance(const Spectrum& refl, const std::string& name) {
    if(!refl.allFinite() || refl.minCoeff() < 0 || refl.maxCoeff() > 1) {
        throw physics_error(
            "Don't create non energy conserving " + name + " (reflectance must be within 0 and 1).");
    }
}

}  // namespace


Material::Material(const Spectrum& emission, const Spectrum& reflectance) :
        e_radiance(emission), refl(reflectance) {
}

Material::~Material() {
}

Spectrum Material::emission() const {
    return e_radiance;
}

Spectrum Material::reflectance() const {
    return refl;
}

bool Material::isLightSource() const {
    return false;
}

bool Material::isSpecular() const {
    return false;
}


SimpleLambertMaterial::SimpleLambertMaterial(const Spectrum& refl) :
        Material(Spectrum::Zero(), refl) {
    checkReflectance(refl, "SimpleLambertMaterial");
}

// Lambert BRDF is refl / pi regardless of directions.
Spectrum SimpleLambertMaterial::eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const {
    return refl / pi;
}

BSDFSample SimpleLambertMaterial::sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const {
    const auto basis = createOrthoNormalBasis(normal);
    const Eigen::Vector3f dir =
        sampler.uniformHemisphere(normal, basis.first, basis.second);
    return BSDFSample(
        dir,
        Pdf::density(1 / (2 * pi)),
        eval(dir_in, normal, dir));
}


LambertMaterial::LambertMaterial(const Spectrum& refl) :
        Material(Spectrum::Zero(), refl) {
    checkReflectance(refl, "LambertMaterial");
}

Spectrum LambertMaterial::eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const {
    return refl / pi;
}

// pdf = cos / pi cancels the cosine term of the rendering equation.
BSDFSample LambertMaterial::sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const {
    const auto basis = createOrthoNormalBasis(normal);
    const Eigen::Vector3f dir =
        sampler.cosineWeightedHemisphere(normal, basis.first, basis.second);
    // Not clamped: non-positive value signals a below-horizon sample.
    return BSDFSample(
        dir,
        Pdf::density(normal.dot(dir) / pi),
        eval(dir_in, normal, dir));
}


PhongMaterial::PhongMaterial(const Spectrum& refl, float n) :
        Material(Spectrum::Zero(), refl), n(n) {
    checkReflectance(refl, "PhongMaterial");
    if(!std::isfinite(n) || n < 0) {
        throw physics_error("Phong exponent must be non-negative");
    }
}

float PhongMaterial::exponent() const {
    return n;
}

Spectrum PhongMaterial::eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const {
    // Next ray going under the surface.
    if(normal.dot(dir_out) < 0) {
        return Spectrum::Zero();
    }
    const Eigen::Vector3f dir_reflection = reflect(dir_in, normal);
    const float cos_alpha = std::max(0.0f, dir_reflection.dot(dir_out));
    return refl * ((n + 2) / (2 * pi) * std::pow(cos_alpha, n));
}

// Sample cos^n lobe around the mirror direction, not around normal.
BSDFSample PhongMaterial::sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const {
    const Eigen::Vector3f dir_reflection = reflect(dir_in, normal);
    const auto basis = createOrthoNormalBasis(dir_reflection);
    const Eigen::Vector3f& tangent = basis.first;
    const Eigen::Vector3f& binormal = basis.second;

    const float u1 = sampler.next01();
    const float u2 = sampler.next01();
    const float phi = u1 * 2 * pi;
    const float theta = std::acos(std::pow(u2, 1 / (n + 1)));

    const Eigen::Vector3f dir =
        tangent * (std::sin(theta) * std::cos(phi)) +
        dir_reflection * std::cos(theta) +
        binormal * (std::sin(theta) * std::sin(phi));

    const float cos_alpha = std::max(0.0f, dir_reflection.dot(dir));
    const float pdf = (n + 1) / (2 * pi) * std::pow(cos_alpha, n);

    // eval may return 0 when dir is below the surface even though pdf > 0.
    return BSDFSample(dir, Pdf::density(pdf), eval(dir_in, normal, dir));
}


GlassMaterial::GlassMaterial(const Spectrum& refl, float refractive_index) :
        Material(Spectrum::Zero(), refl),
        refractive_index(refractive_index) {
    checkReflectance(refl, "GlassMaterial");
    if(!std::isfinite(refractive_index) || refractive_index <= 0) {
        throw physics_error("Negative refractive index not allowed (yet)");
    }
}

float GlassMaterial::refractiveIndex() const {
    return refractive_index;
}

bool GlassMaterial::isSpecular() const {
    return true;
}

// BSDF of ideal glass is delta / cos. delta itself is not representable,
// but it also appears in pdf and cancels, so only refl / cos is kept.
// cos is taken against dir_out because that is where light comes from.
Spectrum GlassMaterial::eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const {
    return refl * (DELTA / normal.dot(dir_out));
}

BSDFSample GlassMaterial::sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const {
    // Normal facing the incoming ray.
    const Eigen::Vector3f normal_facing =
        (normal.dot(dir_in) < 0) ? normal : Eigen::Vector3f(-normal);
    // Entering or leaving the object.
    const bool into = normal.dot(normal_facing) > 0;

    const float ior_vacuum = 1;
    const float ior_ratio = into ?
        (ior_vacuum / refractive_index) :
        (refractive_index / ior_vacuum);

    // Snell's law.
    const float cos_in = dir_in.dot(normal_facing);
    const float cos2t = 1 - ior_ratio * ior_ratio * (1 - cos_in * cos_in);

    const Eigen::Vector3f dir_reflection = reflect(dir_in, normal_facing);

    // Total internal reflection.
    if(cos2t < 0) {
        return BSDFSample(
            dir_reflection,
            Pdf::delta(1),
            eval(dir_in, normal, dir_reflection));
    }

    const float cos_t = std::sqrt(cos2t);
    const Eigen::Vector3f dir_refraction =
        (dir_in * ior_ratio -
            normal_facing * (cos_in * ior_ratio + cos_t)).normalized();

    // Fresnel reflectance, averaged over both polarizations.
    const float cos_i = -cos_in;
    const float r_parallel =
        (ior_ratio * cos_i - cos_t) / (ior_ratio * cos_i + cos_t);
    const float r_perpendicular =
        (cos_i - ior_ratio * cos_t) / (cos_i + ior_ratio * cos_t);
    const float fr = 0.5f *
        (r_parallel * r_parallel + r_perpendicular * r_perpendicular);

    // Radiance changes by the squared ratio of refractive indices
    // when crossing the interface.
    const float factor = ior_ratio * ior_ratio;
    const float ft = (1 - fr) * factor;

    // Russian roulette between reflection and refraction, with probability fr.
    if(sampler.next01() < fr) {
        return BSDFSample(
            dir_reflection,
            Pdf::delta(fr),
            fr * eval(dir_in, normal, dir_reflection));
    } else {
        // cos of the reflection is used here too; it only exists to be
        // cancelled by the integrator, the same way as in the reflection case.
        return BSDFSample(
            dir_refraction,
            Pdf::delta(1 - fr),
            ft * eval(dir_in, normal, dir_reflection));
    }
}


EmissionMaterial::EmissionMaterial(const Spectrum& emission_radiance) :
        Material(emission_radiance, Spectrum::Zero()) {
    if(!emission_radiance.allFinite() || emission_radiance.minCoeff() < 0) {
        throw physics_error("Emission radiance must be non-negative");
    }
}

bool EmissionMaterial::isLightSource() const {
    return true;
}

Spectrum EmissionMaterial::eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const {
    LOG(FATAL) << "EmissionMaterial::eval called; light sources don't scatter";
    return Spectrum::Zero();
}

BSDFSample EmissionMaterial::sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const {
    LOG(FATAL) << "EmissionMaterial::sample called; light sources don't scatter";
    return BSDFSample(Eigen::Vector3f::Zero(), Pdf::density(0), Spectrum::Zero());
}

}  // namespace
