// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: interface boundary towards the scene, selection and settings
//

#pragma once

#include <memory>
#include <type_traits>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <texpaint/brush.h>
#include <texpaint/paint_texture.h>
#include <texpaint/texture.h>

namespace texpaint {

using Object_ID = std::make_signed<size_t>::type;

struct Mesh {
    std::vector<glm::vec3> position;
    // Per-vertex texture coordinates; may be empty
    std::vector<glm::vec2> uv;
    // Three indices per triangle, counter-clockwise front faces
    std::vector<unsigned> elements;
};

struct Material {
    // Base color texture; may be null
    std::shared_ptr<Texture> map;
    Color color = { 1, 1, 1, 1 };
    bool double_sided = false;

    // Paint layer; created by Paint_Texture_Manager
    std::unique_ptr<Paint_Texture> paint;
};

struct Scene_Object {
    Object_ID id = 0;
    // Model-to-world transform
    glm::mat4 transform = glm::mat4(1.0f);

    // Either may be null, in which case the object isn't paintable
    std::shared_ptr<Mesh const> mesh;
    std::shared_ptr<Material> material;
};

struct Camera {
    glm::mat4 view = glm::mat4(1.0f);
    glm::mat4 projection = glm::mat4(1.0f);
};

// Rectangle of the 3D view in pointer coordinates
struct Viewport {
    float left = 0;
    float top = 0;
    float width = 0;
    float height = 0;
};

struct View_State {
    Camera camera;
    Viewport viewport;
};

/**
 * \brief Settings and state provider.
 *
 * Implemented by the host application.
 */
class TEXPAINT_EXPORT IScene_Provider {
public:
    virtual ~IScene_Provider() = default;

    // Whether painting is enabled at all
    virtual bool paint_mode() const = 0;

    // Current brush settings; read once per stroke
    virtual Brush_Settings brush_settings() const = 0;

    // Currently selected object or nullptr
    virtual Scene_Object *selected_object() = 0;

    virtual bool is_locked(Object_ID id) const = 0;

    virtual View_State view() const = 0;
};

}
