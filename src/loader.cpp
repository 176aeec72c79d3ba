#include "loader.h"

#include <cmath>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <streambuf>
#include <string>

#include <glog/logging.h>
#include <google/protobuf/text_format.h>

namespace pathshade {

invalid_task::invalid_task(const std::string& what) :
		std::runtime_error(what) {
}

// fast but ugly code to get file content onto memory.
// http://stackoverflow.com/a/2602060
std::string readFile(const std::string& path) {
    std::ifstream t(path);
    if(t.fail()) {
        throw std::runtime_error("Failed to open " + path);
    }
    std::string str;

    t.seekg(0, std::ios::end);
    str.reserve(t.tellg());
    t.seekg(0, std::ios::beg);

    str.assign(
        (std::istreambuf_iterator<char>(t)),
        std::istreambuf_iterator<char>());
    return str;
}

Spectrum loadSpectrum(const SpectrumProto& sp) {
    if(!sp.has_r() || !sp.has_g() || !sp.has_b()) {
        throw invalid_task("Spectrum requires r, g, b");
    }
    return fromRgb(sp.r(), sp.g(), sp.b());
}

Eigen::Vector3f loadDirection(const Direction& dir) {
    const Eigen::Vector3f d(dir.x(), dir.y(), dir.z());
    if(!d.allFinite() || std::abs(d.norm() - 1) >= 1e-5) {
        throw invalid_task("Length of direction must be 1.");
    }
    return d;
}

namespace {

// Range check happens here rather than in Material constructors
// so that config mistakes are reported as invalid_task.
Spectrum loadReflectance(const SpectrumProto& sp) {
    const Spectrum reflectance = loadSpectrum(sp);
    if(!reflectance.allFinite() ||
            reflectance.minCoeff() < 0 ||
            reflectance.maxCoeff() > 1) {
        throw invalid_task("Reflectance must be within 0 and 1.");
    }
    return reflectance;
}

}  // namespace

std::unique_ptr<Material> loadMaterial(const MaterialProto& mp) {
    if(!mp.has_type()) {
        throw invalid_task("Material requires type.");
    }
    if(mp.type() == MaterialProto::LAMBERT_SIMPLE ||
            mp.type() == MaterialProto::LAMBERT) {
        const LambertMaterialProto& lambert_proto =
            mp.GetExtension(LambertMaterialProto::material);
        if(!lambert_proto.has_reflectance()) {
            throw invalid_task("LambertMaterial requires reflectance.");
        }
        const Spectrum reflectance = loadReflectance(lambert_proto.reflectance());
        if(mp.type() == MaterialProto::LAMBERT_SIMPLE) {
            return std::make_unique<SimpleLambertMaterial>(reflectance);
        } else {
            return std::make_unique<LambertMaterial>(reflectance);
        }
    } else if(mp.type() == MaterialProto::PHONG) {
        const PhongMaterialProto& phong_proto =
            mp.GetExtension(PhongMaterialProto::material);
        if(!phong_proto.has_reflectance()) {
            throw invalid_task("PhongMaterial requires reflectance.");
        }
        if(!phong_proto.has_exponent()) {
            throw invalid_task("PhongMaterial requires exponent.");
        }
        if(!std::isfinite(phong_proto.exponent()) || phong_proto.exponent() < 0) {
            throw invalid_task("Phong exponent must be non-negative.");
        }
        return std::make_unique<PhongMaterial>(
            loadReflectance(phong_proto.reflectance()),
            phong_proto.exponent());
    } else if(mp.type() == MaterialProto::GLASS) {
        const GlassMaterialProto& glass_proto =
            mp.GetExtension(GlassMaterialProto::material);
        Spectrum reflectance = fromRgb(1, 1, 1);
        if(glass_proto.has_reflectance()) {
            reflectance = loadReflectance(glass_proto.reflectance());
        }
        float refractive_index = 1.5;
        if(glass_proto.has_refractive_index()) {
            refractive_index = glass_proto.refractive_index();
        } else {
            LOG(WARNING) << "refractive_index not found; defaults to " << refractive_index;
        }
        if(!std::isfinite(refractive_index) || refractive_index <= 0) {
            throw invalid_task("Refractive index must be positive.");
        }
        return std::make_unique<GlassMaterial>(reflectance, refractive_index);
    } else if(mp.type() == MaterialProto::EMISSION) {
        const EmissionMaterialProto& emission_proto =
            mp.GetExtension(EmissionMaterialProto::material);
        if(!emission_proto.has_emission()) {
            throw invalid_task("EmissionMaterial requires emission.");
        }
        const Spectrum emission = loadSpectrum(emission_proto.emission());
        if(!emission.allFinite() || emission.minCoeff() < 0) {
            throw invalid_task("Emission must be non-negative.");
        }
        return std::make_unique<EmissionMaterial>(emission);
    } else {
        throw invalid_task("Unknown material type");
    }
}

Probe loadProbe(const ProbeTask& task) {
    Probe probe;
    if(!task.has_material()) {
        throw invalid_task("ProbeTask requires material.");
    }
    probe.material = loadMaterial(task.material());

    if(!task.has_incident()) {
        throw invalid_task("ProbeTask requires incident direction.");
    }
    probe.incident = loadDirection(task.incident());

    if(task.has_normal()) {
        probe.normal = loadDirection(task.normal());
    } else {
        LOG(WARNING) << "normal not found; defaults to +Z";
        probe.normal = Eigen::Vector3f::UnitZ();
    }

    if(task.samples() <= 0) {
        throw invalid_task("samples must be > 0");
    }
    probe.samples = task.samples();
    if(task.lobe_size() <= 0) {
        throw invalid_task("lobe_size must be > 0");
    }
    probe.lobe_size = task.lobe_size();
    return probe;
}

ProbeTask readProbeTaskFromFile(const std::string& path) {
    // Load to on-memory string since google:: streams are hard to use.
    const std::string proto = readFile(path);
    ProbeTask task;
    // Text first: short text files can happen to be valid binary protos.
    if(!google::protobuf::TextFormat::ParseFromString(proto, &task)) {
        task.Clear();
        if(!task.ParseFromString(proto)) {
            throw std::runtime_error(
                "Couldn't parse ProbeTask as either prototxt or binary proto");
        }
    }
    return task;
}

}  // namespace
