#include "probe.h"

#include <cmath>
#include <stdexcept>

#include <boost/range/irange.hpp>
#include <gtest/gtest.h>

using pathshade::pi;


TEST(estimateAlbedo, CosineLambertIsExact) {
    // bsdf * cos / pdf == refl for every single sample.
    const pathshade::LambertMaterial material(
        pathshade::fromRgb(0.2, 0.5, 0.9));
    const Eigen::Vector3f normal(0, 0, 1);
    pathshade::Sampler sampler(1);
    const pathshade::Spectrum albedo = pathshade::estimateAlbedo(
        material, -normal, normal, sampler, 1000, 1);
    EXPECT_NEAR(0.2, albedo(0), 1e-4);
    EXPECT_NEAR(0.5, albedo(1), 1e-4);
    EXPECT_NEAR(0.9, albedo(2), 1e-4);
}

TEST(estimateAlbedo, SimpleLambertConverges) {
    const pathshade::SimpleLambertMaterial material(
        pathshade::fromRgb(0.5, 0.5, 0.5));
    const Eigen::Vector3f normal = Eigen::Vector3f(1, 1, 1).normalized();
    pathshade::Sampler sampler(2);
    const pathshade::Spectrum albedo = pathshade::estimateAlbedo(
        material, -normal, normal, sampler, 200000, 4);
    EXPECT_NEAR(0.5, albedo(0), 1e-2);
}

TEST(estimateAlbedo, PhongDoesNotGainEnergy) {
    const Eigen::Vector3f normal(0, 0, 1);
    for(const float n : {0.0f, 1.0f, 10.0f, 100.0f}) {
        const pathshade::PhongMaterial material(
            pathshade::fromRgb(0.8, 0.8, 0.8), n);
        for(const float angle : {0.0f, 0.5f, 1.0f, 1.4f}) {
            const Eigen::Vector3f dir_in(std::sin(angle), 0, -std::cos(angle));
            pathshade::Sampler sampler(3);
            const pathshade::Spectrum albedo = pathshade::estimateAlbedo(
                material, dir_in, normal, sampler, 100000, 2);
            EXPECT_GE(0.8 + 2e-2, albedo(0)) << "n=" << n << " angle=" << angle;
            EXPECT_LE(0, albedo(0));
        }
    }
}

TEST(estimateAlbedo, DeterministicForSameSeed) {
    const pathshade::PhongMaterial material(
        pathshade::fromRgb(0.7, 0.7, 0.7), 5);
    const Eigen::Vector3f normal(0, 1, 0);
    const Eigen::Vector3f dir_in = Eigen::Vector3f(1, -1, 0).normalized();
    pathshade::Sampler sampler_a(4);
    pathshade::Sampler sampler_b(4);
    const auto albedo_a = pathshade::estimateAlbedo(
        material, dir_in, normal, sampler_a, 10001, 3);
    const auto albedo_b = pathshade::estimateAlbedo(
        material, dir_in, normal, sampler_b, 10001, 3);
    EXPECT_EQ(albedo_a, albedo_b);
}

TEST(estimateAlbedo, RejectsNonScatteringMaterials) {
    const Eigen::Vector3f normal(0, 0, 1);
    pathshade::Sampler sampler;
    const pathshade::EmissionMaterial light(pathshade::fromRgb(1, 1, 1));
    EXPECT_THROW(
        pathshade::estimateAlbedo(light, -normal, normal, sampler, 10, 1),
        std::invalid_argument);
    const pathshade::GlassMaterial glass(pathshade::fromRgb(1, 1, 1), 1.5);
    EXPECT_THROW(
        pathshade::estimateAlbedo(glass, -normal, normal, sampler, 10, 1),
        std::invalid_argument);
    const pathshade::LambertMaterial lambert(pathshade::fromRgb(1, 1, 1));
    EXPECT_THROW(
        pathshade::estimateAlbedo(lambert, -normal, normal, sampler, 0, 1),
        std::invalid_argument);
}


TEST(renderLobeImage, LambertIsCosine) {
    const pathshade::LambertMaterial material(
        pathshade::fromRgb(0.25, 0.5, 1));
    const Eigen::Vector3f normal(0, 0, 1);
    const int size = 64;
    const cv::Mat lobe = pathshade::renderLobeImage(
        material, -normal, normal, size);
    EXPECT_EQ(size, lobe.rows);
    EXPECT_EQ(size, lobe.cols);
    EXPECT_EQ(CV_32FC3, lobe.type());

    // Corners are outside of the hemisphere.
    EXPECT_EQ(0, cv::norm(lobe.at<cv::Vec3f>(0, 0)));
    EXPECT_EQ(0, cv::norm(lobe.at<cv::Vec3f>(size - 1, size - 1)));

    // Center looks straight along normal. BGR order.
    const cv::Vec3f center = lobe.at<cv::Vec3f>(size / 2, size / 2);
    EXPECT_NEAR(1 / pi, center[0], 1e-3);
    EXPECT_NEAR(0.5 / pi, center[1], 1e-3);
    EXPECT_NEAR(0.25 / pi, center[2], 1e-3);
}

TEST(renderLobeImage, PhongPeaksAtMirror) {
    const pathshade::PhongMaterial material(
        pathshade::fromRgb(1, 1, 1), 50);
    const Eigen::Vector3f normal(0, 0, 1);
    const int size = 65;
    const cv::Mat lobe = pathshade::renderLobeImage(
        material, -normal, normal, size);
    cv::Point max_loc;
    double max_v = 0;
    cv::Mat channel;
    cv::extractChannel(lobe, channel, 0);
    cv::minMaxLoc(channel, nullptr, &max_v, nullptr, &max_loc);
    EXPECT_EQ(size / 2, max_loc.x);
    EXPECT_EQ(size / 2, max_loc.y);
    EXPECT_LT(0, max_v);
}

TEST(renderLobeImage, RejectsSpecular) {
    const pathshade::GlassMaterial glass(pathshade::fromRgb(1, 1, 1), 1.5);
    const Eigen::Vector3f normal(0, 0, 1);
    EXPECT_THROW(
        pathshade::renderLobeImage(glass, -normal, normal, 16),
        std::invalid_argument);
}
