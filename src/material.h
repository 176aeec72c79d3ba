// Materials describe how light scatters at a single surface point.
// Each answers two questions for a path vertex:
// how much light goes from dir_in to dir_out (eval), and
// which dir_out to continue with (sample).
//
// Directions follow the path tracing convention:
// dir_in is the direction the camera-side ray was traveling
// when it hit the surface (so it points into the surface),
// dir_out is the direction of the next ray (pointing away).
// Light flows opposite to both.
//
// Materials are immutable once constructed and can be shared
// between threads. Sampler is the only mutable state and
// belongs to the caller.
#pragma once

#include <Eigen/Dense>

#include <light.h>
#include <sampling.h>
#include <space.h>

namespace pathshade {

class Material {
public:
    Material(const Spectrum& emission, const Spectrum& reflectance);
    virtual ~Material();

    // Emitted radiance. Zero unless this is a light source.
    Spectrum emission() const;
    // Albedo-like parameter in [0, 1]. Zero for light sources.
    Spectrum reflectance() const;

    // Integrators must check this before calling eval or sample.
    virtual bool isLightSource() const;
    // True when BSDF is a delta distribution; eval is only
    // meaningful for directions returned by sample().
    virtual bool isSpecular() const;

    // BSDF value for the pair of directions.
    virtual Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const = 0;

    // Importance sample dir_out, consuming randomness from sampler.
    virtual BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const = 0;
protected:
    const Spectrum e_radiance;
    const Spectrum refl;
};


// Perfectly diffuse reflector, sampled uniformly over the hemisphere.
class SimpleLambertMaterial : public Material {
public:
    // refl: [0, 1] value.
    SimpleLambertMaterial(const Spectrum& refl);

    Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const override;
    BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const override;
};


// Perfectly diffuse reflector with cosine weighted importance sampling.
// Same BSDF as SimpleLambertMaterial, lower variance.
class LambertMaterial : public Material {
public:
    // refl: [0, 1] value.
    LambertMaterial(const Spectrum& refl);

    Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const override;
    BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const override;
};


// Normalized Phong lobe around the mirror direction.
// (n + 2) / (2 pi) normalization keeps it energy conserving for any n.
class PhongMaterial : public Material {
public:
    // refl: [0, 1] value. n: exponent, >= 0.
    PhongMaterial(const Spectrum& refl, float n);

    float exponent() const;

    Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const override;
    BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const override;
private:
    const float n;
};


// Smooth dielectric interface between vacuum and the object.
// Reflection vs refraction is chosen by Russian roulette on
// Fresnel reflectance.
class GlassMaterial : public Material {
public:
    // refl: [0, 1] tint for both reflection and refraction.
    GlassMaterial(const Spectrum& refl, float refractive_index);

    float refractiveIndex() const;
    bool isSpecular() const override;

    // DELTA * refl / cos. Fresnel terms are not included;
    // sample() multiplies them in.
    Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const override;
    BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const override;
private:
    const float refractive_index;
};


// Pure emitter. Never scatters light; eval and sample
// abort the process.
class EmissionMaterial : public Material {
public:
    EmissionMaterial(const Spectrum& emission_radiance);

    bool isLightSource() const override;

    Spectrum eval(
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const Eigen::Vector3f& dir_out) const override;
    BSDFSample sample(
        Sampler& sampler,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal) const override;
};

}  // namespace
