// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: scene provider of the paint demo
//

#include "stdafx.h"
#include "demo_scene.h"

using namespace texpaint;

// A single quad facing the camera that fills the whole window
static std::shared_ptr<Mesh const> make_canvas_quad() {
    auto mesh = std::make_shared<Mesh>();
    mesh->position = {
        { -1, -1, 0 }, { 1, -1, 0 }, { 1, 1, 0 }, { -1, 1, 0 },
    };
    mesh->uv = {
        { 0, 0 }, { 1, 0 }, { 1, 1 }, { 0, 1 },
    };
    mesh->elements = { 0, 1, 2, 0, 2, 3 };
    return mesh;
}

Demo_Scene::Demo_Scene(unsigned width, unsigned height) {
    object.id = 1;
    object.mesh = make_canvas_quad();
    object.material = std::make_shared<Material>();

    view_state.camera.view = glm::lookAt(glm::vec3(0, 0, 2), glm::vec3(0, 0, 0), glm::vec3(0, 1, 0));
    view_state.camera.projection = glm::ortho(-1.0f, 1.0f, -1.0f, 1.0f, 0.1f, 10.0f);
    view_state.viewport = { 0, 0, float(width), float(height) };
}

void Demo_Scene::toggle_lock() {
    if (is_locked(object.id)) {
        locked.erase(object.id);
    } else {
        locked.insert(object.id);
    }
}
