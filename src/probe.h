// Tools to measure a single Material without a scene.
// Useful to catch energy conservation breaches and to eyeball lobes.
#pragma once

#include <Eigen/Dense>
#include <opencv2/opencv.hpp>

#include <light.h>
#include <material.h>
#include <sampling.h>

namespace pathshade {

// Estimate directional albedo
// E[bsdf * max(0, cos) / pdf] using material's own sample().
// For a physical non-specular material, each channel is <= reflectance.
//
// Samples are distributed over n_threads threads, each with its own
// child of sampler.
// Throws std::invalid_argument for light sources and specular materials.
Spectrum estimateAlbedo(
    const Material& material,
    const Eigen::Vector3f& dir_in,
    const Eigen::Vector3f& normal,
    Sampler& sampler,
    const int n_samples,
    const int n_threads);

// Render eval * max(0, cos) over the hemisphere around normal,
// using equal-area projection (center = normal, rim = horizon).
// return 32 bit float BGR image of size x size.
// Throws std::invalid_argument for light sources and specular materials.
cv::Mat renderLobeImage(
    const Material& material,
    const Eigen::Vector3f& dir_in,
    const Eigen::Vector3f& normal,
    const int size);

}  // namespace
