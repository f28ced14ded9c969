// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: stroke session state machine
//

#pragma once

#include <optional>
#include <random>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <texpaint/brush.h>
#include <texpaint/config.h>
#include <texpaint/cursor.h>
#include <texpaint/logger.h>
#include <texpaint/paint_texture.h>
#include <texpaint/projector.h>
#include <texpaint/scene.h>

namespace texpaint {

enum class Pointer_Event_Type {
    Down,
    Move,
    Up,
    // Pointer left the canvas
    Leave,
};

enum class Pointer_Button {
    Primary,
    Secondary,
    Middle,
};

struct Pointer_Event {
    Pointer_Event_Type type = Pointer_Event_Type::Move;
    glm::vec2 position = { 0, 0 };
    Pointer_Button button = Pointer_Button::Primary;
};

enum class Session_State {
    Idle,
    Dragging,
};

struct Stroke_Sample {
    glm::vec3 point;
    glm::vec2 uv;
};

struct Stroke {
    Object_ID target = 0;
    // Snapshot taken when the stroke started
    Brush_Settings settings;
    // Append-only
    std::vector<Stroke_Sample> samples;
};

/**
 * \brief Turns pointer events into strokes on the selected object.
 *
 * Idle --down--> Dragging --up/leave--> Idle
 *
 * Painting is only possible while paint mode is on, an object is selected
 * and that object isn't locked. The session doesn't own any of its
 * collaborators.
 */
class TEXPAINT_EXPORT Stroke_Session {
public:
    Stroke_Session(
        Config const &config,
        IScene_Provider *scene,
        IProjector *projector,
        Paint_Texture_Manager *textures,
        ILogger *logger);

    void handle(Pointer_Event const &ev);

    /**
     * \return Whether a stroke has been started.
     */
    bool pointer_down(glm::vec2 const &pos, Pointer_Button button);

    /**
     * \return Whether a sample has been added to the current stroke.
     */
    bool pointer_move(glm::vec2 const &pos);

    // Only the primary button ends a stroke
    void pointer_up(glm::vec2 const &pos, Pointer_Button button = Pointer_Button::Primary);
    void pointer_leave();

    Session_State state() const noexcept {
        return _stroke.has_value() ? Session_State::Dragging : Session_State::Idle;
    }

    // Stroke in progress or nullptr
    Stroke const *stroke() const noexcept {
        return _stroke.has_value() ? &_stroke.value() : nullptr;
    }

    Cursor_Indicator const &cursor() const noexcept {
        return _cursor;
    }

    /**
     * Evaluates the target-validity gate.
     * \return The target if painting is permitted, nullptr otherwise.
     */
    Scene_Object *paintable_target();

private:
    void update_cursor(glm::vec2 const &pos, bool gate_open);
    std::optional<Stroke_Sample> sample(glm::vec2 const &pos, Scene_Object const &target);
    void rasterize_newest(Scene_Object *target);
    void finish(Scene_Object *target);
    void cancel();

    Config _config;
    IScene_Provider *_scene;
    IProjector *_projector;
    Paint_Texture_Manager *_textures;
    ILogger *_logger;

    std::optional<Stroke> _stroke;
    Cursor_Indicator _cursor;
    std::mt19937 _rng;
};

}
