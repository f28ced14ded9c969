// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: pointer to surface projection
//

#include "stdafx.h"
#include <texpaint/projector.h>
#include "intersect.h"

#include <glm/matrix.hpp>

namespace texpaint {

glm::vec2 pointer_to_ndc(glm::vec2 const &pointer, Viewport const &viewport) {
    return {
        (pointer.x - viewport.left) / viewport.width * 2 - 1,
        -((pointer.y - viewport.top) / viewport.height * 2 - 1),
    };
}

Ray make_pick_ray(glm::vec2 const &ndc, Camera const &camera) {
    auto inv = glm::inverse(camera.projection * camera.view);

    auto p_near = inv * glm::vec4(ndc, -1, 1);
    auto p_far = inv * glm::vec4(ndc, 1, 1);
    p_near /= p_near.w;
    p_far /= p_far.w;

    return { glm::vec3(p_near), glm::normalize(glm::vec3(p_far - p_near)) };
}

class Surface_Projector : public IProjector {
public:
    std::optional<Hit> project(
        glm::vec2 const &pointer,
        View_State const &view,
        Scene_Object const &target) override {
        ZoneScoped;
        auto const &viewport = view.viewport;
        if (!(viewport.width > 0 && viewport.height > 0)) {
            return std::nullopt;
        }

        if (target.mesh == nullptr) {
            return std::nullopt;
        }

        auto const &mesh = *target.mesh;
        auto ray = make_pick_ray(pointer_to_ndc(pointer, viewport), view.camera);

        // Intersect in object space, the mesh stays untouched
        auto inv_model = glm::inverse(target.transform);
        auto origin = glm::vec3(inv_model * glm::vec4(ray.origin, 1));
        auto dir = glm::vec3(inv_model * glm::vec4(ray.direction, 0));

        if (mesh.position.empty()) {
            return std::nullopt;
        }

        // Whole-mesh rejection; the host may edit vertices between calls
        glm::vec3 bounds_min(INFINITY), bounds_max(-INFINITY);
        for (auto const &p : mesh.position) {
            bounds_min = glm::min(bounds_min, p);
            bounds_max = glm::max(bounds_max, p);
        }

        if (!intersect::ray_aabb(origin, 1.0f / dir, bounds_min, bounds_max)) {
            return std::nullopt;
        }

        auto cull_backfaces = !(target.material != nullptr && target.material->double_sided);
        auto const vertex_count = mesh.position.size();
        auto const triangle_count = mesh.elements.size() / 3;

        std::optional<Hit> ret;
        float nearest = INFINITY;
        glm::vec2 nearest_bary;

        for (size_t i = 0; i < triangle_count; i++) {
            auto i0 = mesh.elements[i * 3 + 0];
            auto i1 = mesh.elements[i * 3 + 1];
            auto i2 = mesh.elements[i * 3 + 2];
            if (i0 >= vertex_count || i1 >= vertex_count || i2 >= vertex_count) {
                continue;
            }

            glm::vec3 xp;
            glm::vec2 bary;
            float t;
            if (!intersect::ray_triangle(xp, t, bary, origin, dir, mesh.position[i0], mesh.position[i1], mesh.position[i2], cull_backfaces)) {
                continue;
            }

            if (t < nearest) {
                nearest = t;
                nearest_bary = bary;

                Hit hit;
                hit.point = glm::vec3(target.transform * glm::vec4(xp, 1));
                hit.triangle = i;
                ret = hit;
            }
        }

        if (ret.has_value() && mesh.uv.size() == vertex_count) {
            auto tri = ret->triangle;
            auto const &uv0 = mesh.uv[mesh.elements[tri * 3 + 0]];
            auto const &uv1 = mesh.uv[mesh.elements[tri * 3 + 1]];
            auto const &uv2 = mesh.uv[mesh.elements[tri * 3 + 2]];
            ret->uv = (1 - nearest_bary.x - nearest_bary.y) * uv0 + nearest_bary.x * uv1 + nearest_bary.y * uv2;
        }

        return ret;
    }
};

class Flat_Canvas_Projector : public IProjector {
public:
    Flat_Canvas_Projector(unsigned width, unsigned height)
        : _width(float(width)), _height(float(height)) {
    }

    std::optional<Hit> project(
        glm::vec2 const &pointer,
        View_State const &view,
        Scene_Object const &target) override {
        auto px = pointer.x - view.viewport.left;
        auto py = pointer.y - view.viewport.top;

        if (!(0 <= px && px < _width && 0 <= py && py < _height)) {
            return std::nullopt;
        }

        Hit ret;
        ret.point = { px, py, 0 };
        ret.uv = glm::vec2(px / _width, 1 - py / _height);
        return ret;
    }

private:
    float _width, _height;
};

std::unique_ptr<IProjector> make_surface_projector() {
    return std::make_unique<Surface_Projector>();
}

std::unique_ptr<IProjector> make_flat_canvas_projector(unsigned buffer_width, unsigned buffer_height) {
    return std::make_unique<Flat_Canvas_Projector>(buffer_width, buffer_height);
}

std::unique_ptr<IProjector> make_projector(Config const &config) {
    switch (config.projection) {
    case Projection_Mode::Surface:
        return make_surface_projector();
    case Projection_Mode::Flat_Canvas:
        return make_flat_canvas_projector(config.buffer_width, config.buffer_height);
    }

    return make_surface_projector();
}

}
