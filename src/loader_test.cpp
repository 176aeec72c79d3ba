#include "loader.h"

#include <fstream>
#include <string>

#include <google/protobuf/text_format.h>
#include <gtest/gtest.h>


namespace {

pathshade::MaterialProto parseMaterial(const std::string& text) {
    pathshade::MaterialProto proto;
    EXPECT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &proto));
    return proto;
}

}  // namespace


TEST(loadSpectrum, RequiresAllChannels) {
    pathshade::SpectrumProto sp;
    sp.set_r(0.1);
    sp.set_g(0.2);
    EXPECT_THROW(pathshade::loadSpectrum(sp), pathshade::invalid_task);
    sp.set_b(0.3);
    EXPECT_EQ(pathshade::fromRgb(0.1, 0.2, 0.3), pathshade::loadSpectrum(sp));
}

TEST(loadDirection, RejectsNonUnit) {
    pathshade::Direction dir;
    dir.set_x(1);
    dir.set_y(1);
    dir.set_z(0);
    EXPECT_THROW(pathshade::loadDirection(dir), pathshade::invalid_task);
    dir.set_y(0);
    EXPECT_EQ(Eigen::Vector3f(1, 0, 0), pathshade::loadDirection(dir));
}

TEST(loadMaterial, Lambert) {
    const auto simple = pathshade::loadMaterial(parseMaterial(
        "type: LAMBERT_SIMPLE "
        "[pathshade.LambertMaterialProto.material] {"
        "  reflectance { r: 0.5 g: 0.25 b: 1 }"
        "}"));
    ASSERT_TRUE(simple);
    EXPECT_NE(nullptr, dynamic_cast<pathshade::SimpleLambertMaterial*>(simple.get()));
    EXPECT_EQ(pathshade::fromRgb(0.5, 0.25, 1), simple->reflectance());

    const auto cosine = pathshade::loadMaterial(parseMaterial(
        "type: LAMBERT "
        "[pathshade.LambertMaterialProto.material] {"
        "  reflectance { r: 0.5 g: 0.25 b: 1 }"
        "}"));
    EXPECT_NE(nullptr, dynamic_cast<pathshade::LambertMaterial*>(cosine.get()));
}

TEST(loadMaterial, Phong) {
    const auto material = pathshade::loadMaterial(parseMaterial(
        "type: PHONG "
        "[pathshade.PhongMaterialProto.material] {"
        "  reflectance { r: 1 g: 1 b: 1 }"
        "  exponent: 30"
        "}"));
    const auto* phong = dynamic_cast<pathshade::PhongMaterial*>(material.get());
    ASSERT_NE(nullptr, phong);
    EXPECT_FLOAT_EQ(30, phong->exponent());

    EXPECT_THROW(
        pathshade::loadMaterial(parseMaterial(
            "type: PHONG "
            "[pathshade.PhongMaterialProto.material] {"
            "  reflectance { r: 1 g: 1 b: 1 }"
            "}")),
        pathshade::invalid_task);
}

TEST(loadMaterial, GlassDefaults) {
    const auto material = pathshade::loadMaterial(parseMaterial(
        "type: GLASS"));
    const auto* glass = dynamic_cast<pathshade::GlassMaterial*>(material.get());
    ASSERT_NE(nullptr, glass);
    EXPECT_FLOAT_EQ(1.5, glass->refractiveIndex());
    EXPECT_EQ(pathshade::fromRgb(1, 1, 1), glass->reflectance());

    EXPECT_THROW(
        pathshade::loadMaterial(parseMaterial(
            "type: GLASS "
            "[pathshade.GlassMaterialProto.material] { refractive_index: -1 }")),
        pathshade::invalid_task);
}

TEST(loadMaterial, Emission) {
    const auto material = pathshade::loadMaterial(parseMaterial(
        "type: EMISSION "
        "[pathshade.EmissionMaterialProto.material] {"
        "  emission { r: 10 g: 10 b: 10 }"
        "}"));
    EXPECT_TRUE(material->isLightSource());
    EXPECT_EQ(pathshade::fromRgb(10, 10, 10), material->emission());
}

TEST(loadMaterial, RejectsInvalid) {
    EXPECT_THROW(
        pathshade::loadMaterial(pathshade::MaterialProto()),
        pathshade::invalid_task);
    // Missing extension.
    EXPECT_THROW(
        pathshade::loadMaterial(parseMaterial("type: LAMBERT")),
        pathshade::invalid_task);
    // Out of range reflectance is a config error, not physics_error.
    EXPECT_THROW(
        pathshade::loadMaterial(parseMaterial(
            "type: LAMBERT "
            "[pathshade.LambertMaterialProto.material] {"
            "  reflectance { r: 2 g: 0 b: 0 }"
            "}")),
        pathshade::invalid_task);
}

TEST(readProbeTaskFromFile, ReadsText) {
    const std::string path = ::testing::TempDir() + "probe_task.prototxt";
    {
        std::ofstream f(path);
        f << "material {"
             "  type: PHONG"
             "  [pathshade.PhongMaterialProto.material] {"
             "    reflectance { r: 0.5 g: 0.5 b: 0.5 }"
             "    exponent: 4"
             "  }"
             "}"
             "incident { x: 0 y: 0 z: -1 }"
             "samples: 1000";
    }
    const pathshade::Probe probe =
        pathshade::loadProbe(pathshade::readProbeTaskFromFile(path));
    ASSERT_TRUE(probe.material);
    EXPECT_EQ(Eigen::Vector3f(0, 0, -1), probe.incident);
    EXPECT_EQ(Eigen::Vector3f(0, 0, 1), probe.normal);
    EXPECT_EQ(1000, probe.samples);
    EXPECT_EQ(256, probe.lobe_size);
}

TEST(readProbeTaskFromFile, MissingFileThrows) {
    EXPECT_THROW(
        pathshade::readProbeTaskFromFile("/nonexistent/probe.prototxt"),
        std::runtime_error);
}

TEST(loadProbe, RequiresIncident) {
    pathshade::ProbeTask task;
    task.mutable_material()->set_type(pathshade::MaterialProto::GLASS);
    EXPECT_THROW(pathshade::loadProbe(task), pathshade::invalid_task);
}
