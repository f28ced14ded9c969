// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: intersection subroutines
//

#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace texpaint {
namespace intersect {
    // Ray-triangle intersection
    // Returns true on intersection and fills in `xp`, `t` and `bary`, such
    // that `origin + t * dir = xp` and
    // `xp = (1 - bary.x - bary.y) * v0 + bary.x * v1 + bary.y * v2`.
    // When `cull_backfaces` is set, triangles whose counter-clockwise front
    // face points away from the ray origin are ignored.
    // Returns false otherwise.
    bool ray_triangle(
        glm::vec3 &xp, float &t, glm::vec2 &bary,
        glm::vec3 const &origin, glm::vec3 const &dir,
        glm::vec3 const &v0, glm::vec3 const &v1, glm::vec3 const &v2,
        bool cull_backfaces
    );

    // Ray-AABB intersection
    // Returns whether the two entities intersect.
    // The ray direction vector MUST be inverted component-wise,
    // that is, if the direction is (x, y, z), dir_inv is (1/x, 1/y, 1/z).
    bool ray_aabb(
        glm::vec3 const &origin, glm::vec3 const &dir_inv,
        glm::vec3 const &min, glm::vec3 const &max
    );
}
}
