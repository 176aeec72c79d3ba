// Load external config in prototxt to Materials and probe settings.
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include <light.h>
#include <material.h>

#include <proto/material.pb.h>

namespace pathshade {

// This error is thrown when external task setting
// is invalid. (lacking necessary fields, contradictory settings)
class invalid_task : public std::runtime_error {
public:
    invalid_task(const std::string& what);
};

Spectrum loadSpectrum(const SpectrumProto& sp);

Eigen::Vector3f loadDirection(const Direction& dir);

std::unique_ptr<Material> loadMaterial(const MaterialProto& mp);


// Fully validated ProbeTask.
struct Probe {
    std::unique_ptr<Material> material;
    Eigen::Vector3f incident;
    Eigen::Vector3f normal;
    int samples;
    int lobe_size;
};

Probe loadProbe(const ProbeTask& task);


// fast but ugly code to get file content onto memory.
// http://stackoverflow.com/a/2602060
std::string readFile(const std::string& path);

// load ProbeTask from given prototxt or binary proto file.
// Text proto is tried first, and then binary proto.
ProbeTask readProbeTaskFromFile(const std::string& path);

}  // namespace
