// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: scene fixtures shared by the tests
//

#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include <glm/gtc/matrix_transform.hpp>
#include <stb_image_write.h>

#include <texpaint/texpaint.h>

namespace texpaint {
namespace test {

// Unit quad in the XY plane, front face towards +Z.
// UV (0, 0) is the bottom-left, (1, 1) the top-right corner.
inline std::shared_ptr<Mesh> make_quad_mesh(bool with_uv = true) {
    auto ret = std::make_shared<Mesh>();
    ret->position = {
        { -1, -1, 0 },
        {  1, -1, 0 },
        {  1,  1, 0 },
        { -1,  1, 0 },
    };
    if (with_uv) {
        ret->uv = {
            { 0, 0 },
            { 1, 0 },
            { 1, 1 },
            { 0, 1 },
        };
    }
    ret->elements = { 0, 1, 2, 0, 2, 3 };
    return ret;
}

inline Scene_Object make_quad_object(Object_ID id, bool with_uv = true) {
    Scene_Object ret;
    ret.id = id;
    ret.mesh = make_quad_mesh(with_uv);
    ret.material = std::make_shared<Material>();
    return ret;
}

// Orthographic camera looking at the quad head-on; the quad fills the
// 1024x1024 viewport exactly, so on a 1024x1024 paint buffer pointer
// coordinates and pixel coordinates are the same.
inline View_State make_front_view() {
    View_State ret;
    ret.camera.view = glm::lookAt(glm::vec3(0, 0, 2), glm::vec3(0, 0, 0), glm::vec3(0, 1, 0));
    ret.camera.projection = glm::ortho(-1.0f, 1.0f, -1.0f, 1.0f, 0.1f, 10.0f);
    ret.viewport = { 0, 0, 1024, 1024 };
    return ret;
}

class Test_Scene : public IScene_Provider {
public:
    Test_Scene() : view_state(make_front_view()) {
    }

    bool paint_mode() const override {
        return painting;
    }

    Brush_Settings brush_settings() const override {
        return settings;
    }

    Scene_Object *selected_object() override {
        return selected;
    }

    bool is_locked(Object_ID id) const override {
        return locked.count(id) != 0;
    }

    View_State view() const override {
        return view_state;
    }

    bool painting = true;
    Brush_Settings settings;
    Scene_Object *selected = nullptr;
    std::set<Object_ID> locked;
    View_State view_state;
};

// Collects log messages
class Log_Capture {
public:
    Log_Capture(Severity min_severity = Severity::Debug)
        : logger(make_callback_logger(&Log_Capture::proc, this, min_severity)) {
    }

    bool contains(Severity severity) const {
        for (auto const &msg : messages) {
            if (msg.first == severity) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<Severity, std::string>> messages;
    std::unique_ptr<ILogger> logger;

private:
    static void proc(Severity severity, char const *message, void *user) {
        auto self = (Log_Capture *)user;
        self->messages.emplace_back(severity, message);
    }
};

inline Config make_test_config(unsigned width = 1024, unsigned height = 1024) {
    Config ret;
    ret.buffer_width = width;
    ret.buffer_height = height;
    ret.rng_seed = 1;
    return ret;
}

inline void append_bytes(void *context, void *data, int size) {
    auto buf = (std::vector<uint8_t> *)context;
    auto bytes = (uint8_t const *)data;
    buf->insert(buf->end(), bytes, bytes + size);
}

// PNG file of a single color, for encoded base textures
inline std::vector<uint8_t> encode_solid_png(int width, int height, Pixel const &color) {
    std::vector<Pixel> pixels(size_t(width) * size_t(height), color);
    std::vector<uint8_t> ret;
    stbi_write_png_to_func(&append_bytes, &ret, width, height, 4, pixels.data(), width * 4);
    return ret;
}

inline int alpha_at(Pixel_View const &view, int x, int y) {
    return boost::gil::get_color(view(x, y), boost::gil::alpha_t());
}

inline int red_at(Pixel_View const &view, int x, int y) {
    return boost::gil::get_color(view(x, y), boost::gil::red_t());
}

inline int green_at(Pixel_View const &view, int x, int y) {
    return boost::gil::get_color(view(x, y), boost::gil::green_t());
}

inline int blue_at(Pixel_View const &view, int x, int y) {
    return boost::gil::get_color(view(x, y), boost::gil::blue_t());
}

inline bool is_transparent(Pixel_View const &view) {
    for (int y = 0; y < view.height(); y++) {
        for (int x = 0; x < view.width(); x++) {
            if (alpha_at(view, x, y) != 0) {
                return false;
            }
        }
    }
    return true;
}

}
}
