// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: pointer to surface projection
//

#pragma once

#include <memory>
#include <optional>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <texpaint/config.h>
#include <texpaint/scene.h>

namespace texpaint {

struct Hit {
    // World space position
    glm::vec3 point;
    // Texture coordinate; absent if the mesh has no UVs
    std::optional<glm::vec2> uv;
    // Index of the triangle that was hit
    size_t triangle = 0;
};

struct Ray {
    glm::vec3 origin;
    glm::vec3 direction;
};

class TEXPAINT_EXPORT IProjector {
public:
    virtual ~IProjector() = default;

    /**
     * Projects a pointer position onto the surface of the target.
     * \param pointer Pointer position
     * \param view Camera and viewport
     * \param target Object to project onto
     * \return The hit record or std::nullopt on a miss.
     */
    virtual std::optional<Hit> project(
        glm::vec2 const &pointer,
        View_State const &view,
        Scene_Object const &target) = 0;
};

/**
 * Converts a pointer position into normalized device coordinates.
 */
TEXPAINT_EXPORT glm::vec2
pointer_to_ndc(glm::vec2 const &pointer, Viewport const &viewport);

/**
 * Makes a world space ray from the camera through a point given in
 * normalized device coordinates.
 */
TEXPAINT_EXPORT Ray
make_pick_ray(glm::vec2 const &ndc, Camera const &camera);

/**
 * Creates a projector that casts rays against the target's triangles.
 */
TEXPAINT_EXPORT std::unique_ptr<IProjector>
make_surface_projector();

/**
 * Creates a projector that maps the pointer 1:1 onto a paint buffer of the
 * given size, with no 3D intersection.
 */
TEXPAINT_EXPORT std::unique_ptr<IProjector>
make_flat_canvas_projector(unsigned buffer_width, unsigned buffer_height);

/**
 * Creates the projector selected in the configuration.
 */
TEXPAINT_EXPORT std::unique_ptr<IProjector>
make_projector(Config const &config);

}
