#include "space.h"

#include <cmath>

namespace pathshade {

physics_error::physics_error(const std::string& what) :
        std::logic_error(what) {
}

Eigen::Vector3f reflect(const Eigen::Vector3f& v, const Eigen::Vector3f& n) {
    return v - 2 * n.dot(v) * n;
}

std::pair<Eigen::Vector3f, Eigen::Vector3f>
        createOrthoNormalBasis(const Eigen::Vector3f& normal) {
    // Pick an axis that is far enough from normal to get a stable cross product.
    Eigen::Vector3f tangent;
    if(std::abs(normal.x()) > 1e-6) {
        tangent = Eigen::Vector3f::UnitY().cross(normal).normalized();
    } else {
        tangent = Eigen::Vector3f::UnitX().cross(normal).normalized();
    }
    const Eigen::Vector3f binormal = normal.cross(tangent).normalized();
    return std::make_pair(tangent, binormal);
}

}  // namespace
