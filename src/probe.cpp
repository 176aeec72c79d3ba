#include "probe.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <boost/range/irange.hpp>
#include <glog/logging.h>

#include <space.h>

namespace pathshade {

namespace {

void checkScattering(const Material& material) {
    if(material.isLightSource()) {
        throw std::invalid_argument("Light sources don't scatter light");
    }
    if(material.isSpecular()) {
        throw std::invalid_argument(
            "Specular materials have no finite BSDF to measure");
    }
}

cv::Vec3f toCvRgb(const Spectrum& spec) {
    return cv::Vec3f(spec(2), spec(1), spec(0));
}

// Sum of n_samples estimator values, written to result.
void accumulateAlbedo(
        const Material& material,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        Sampler& sampler,
        const int n_samples,
        Spectrum& result) {
    Spectrum accum = Spectrum::Zero();
    for(const int i : boost::irange(0, n_samples)) {
        const BSDFSample s = material.sample(sampler, dir_in, normal);
        const float pdf = s.pdf.value();
        if(pdf <= 0) {
            // Zero probability direction never contributes.
            continue;
        }
        const float cos_out = std::max(0.0f, normal.dot(s.dir));
        accum += s.bsdf * (cos_out / pdf);
    }
    result = accum;
}

}  // namespace


Spectrum estimateAlbedo(
        const Material& material,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        Sampler& sampler,
        const int n_samples,
        const int n_threads) {
    checkScattering(material);
    if(n_samples <= 0) {
        throw std::invalid_argument("n_samples must be > 0");
    }
    CHECK_GT(n_threads, 0);

    std::vector<Spectrum> partial_sums(n_threads, Spectrum::Zero());
    if(n_threads == 1) {
        // Don't spawn threads for easy debugging.
        accumulateAlbedo(
            material, dir_in, normal, sampler, n_samples, partial_sums[0]);
    } else {
        auto child_samplers = sampler.split(n_threads);
        std::vector<std::thread> workers;
        for(const int i : boost::irange(0, n_threads)) {
            const int n_local =
                n_samples / n_threads + ((i < n_samples % n_threads) ? 1 : 0);
            workers.emplace_back(
                accumulateAlbedo,
                std::cref(material),
                std::cref(dir_in),
                std::cref(normal),
                std::ref(child_samplers[i]),
                n_local,
                std::ref(partial_sums[i]));
        }
        for(std::thread& worker : workers) {
            worker.join();
        }
    }

    Spectrum total = Spectrum::Zero();
    for(const auto& sum : partial_sums) {
        total += sum;
    }
    const Spectrum albedo = total / n_samples;
    LOG(INFO) << "Albedo estimate from " << n_samples << " samples: "
        << albedo.transpose();
    return albedo;
}


cv::Mat renderLobeImage(
        const Material& material,
        const Eigen::Vector3f& dir_in,
        const Eigen::Vector3f& normal,
        const int size) {
    checkScattering(material);
    if(size <= 0) {
        throw std::invalid_argument("Image size must be positive");
    }
    const auto basis = createOrthoNormalBasis(normal);
    const Eigen::Vector3f& tangent = basis.first;
    const Eigen::Vector3f& binormal = basis.second;

    cv::Mat image(size, size, CV_32FC3);
    image = 0.0f;
    for(const int y : boost::irange(0, size)) {
        for(const int x : boost::irange(0, size)) {
            // Unit disc coordinates, y pointing up.
            const float u = (x + 0.5f) / size * 2 - 1;
            const float v = 1 - (y + 0.5f) / size * 2;
            const float r2 = u * u + v * v;
            if(r2 > 1) {
                continue;
            }
            // Lambert equal-area projection onto the hemisphere.
            const float scale = std::sqrt(2 - r2);
            const Eigen::Vector3f dir_out = (
                tangent * (u * scale) +
                binormal * (v * scale) +
                normal * (1 - r2)).normalized();
            const float cos_out = std::max(0.0f, normal.dot(dir_out));
            image.at<cv::Vec3f>(y, x) =
                toCvRgb(material.eval(dir_in, normal, dir_out) * cos_out);
        }
    }
    return image;
}

}  // namespace
