// Defines mathematical constructs for 3-d shading space,
// such as reflection and local frames around a normal.
// Don't put radiometry stuff here.
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

namespace pathshade {

const float pi = 3.14159265359;


// This error is thrown when someone tries to do physically
// impossible things.
class physics_error : public std::logic_error {
public:
    physics_error(const std::string& what);
};


// Mirror v about the plane perpendicular to n.
// n must be normalized. v is not required to be.
Eigen::Vector3f reflect(const Eigen::Vector3f& v, const Eigen::Vector3f& n);

// Returns (tangent, binormal) such that (tangent, binormal, normal)
// is an orthonormal frame with consistent handedness.
// normal must be normalized.
std::pair<Eigen::Vector3f, Eigen::Vector3f>
    createOrthoNormalBasis(const Eigen::Vector3f& normal);

}  // namespace
