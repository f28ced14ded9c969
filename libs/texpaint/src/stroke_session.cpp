// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: stroke session state machine
//

#include "stdafx.h"
#include <texpaint/stroke_session.h>
#include <texpaint/raster.h>

namespace texpaint {

static uint32_t make_seed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }

    std::random_device rd;
    return rd();
}

Stroke_Session::Stroke_Session(
    Config const &config,
    IScene_Provider *scene,
    IProjector *projector,
    Paint_Texture_Manager *textures,
    ILogger *logger)
    : _config(config),
    _scene(scene),
    _projector(projector),
    _textures(textures),
    _logger(logger),
    _rng(make_seed(config.rng_seed)) {
}

void Stroke_Session::handle(Pointer_Event const &ev) {
    switch (ev.type) {
    case Pointer_Event_Type::Down:
        pointer_down(ev.position, ev.button);
        break;
    case Pointer_Event_Type::Move:
        pointer_move(ev.position);
        break;
    case Pointer_Event_Type::Up:
        pointer_up(ev.position, ev.button);
        break;
    case Pointer_Event_Type::Leave:
        pointer_leave();
        break;
    }
}

Scene_Object *Stroke_Session::paintable_target() {
    if (!_scene->paint_mode()) {
        return nullptr;
    }

    auto target = _scene->selected_object();
    if (target == nullptr || _scene->is_locked(target->id)) {
        return nullptr;
    }

    return target;
}

bool Stroke_Session::pointer_down(glm::vec2 const &pos, Pointer_Button button) {
    ZoneScoped;
    auto target = paintable_target();
    update_cursor(pos, target != nullptr);

    if (button != Pointer_Button::Primary) {
        return false;
    }

    if (target == nullptr) {
        _logger->log(Severity::Debug, "stroke rejected: painting is disabled, nothing is selected or the selection is locked");
        return false;
    }

    if (_stroke.has_value()) {
        // Missed the release of the previous stroke
        if (_stroke->target == target->id) {
            finish(target);
        } else {
            cancel();
        }
    }

    auto first = sample(pos, *target);
    if (!first.has_value()) {
        return false;
    }

    auto settings = sanitize(_scene->brush_settings());

    if (_textures->ensure(target) == nullptr) {
        _logger->log(Severity::Debug, "stroke rejected: object %zd has no material or geometry", target->id);
        return false;
    }
    _textures->wait_for_base_layer(target);

    Stroke stroke;
    stroke.target = target->id;
    stroke.settings = settings;
    stroke.samples.push_back(*first);
    _stroke = std::move(stroke);

    _logger->log(
        Severity::Debug, "stroke started on object %zd: %s brush, %s blending",
        target->id, to_string(settings.type), to_string(settings.blend_mode));

    // A click without movement leaves a dab
    rasterize_newest(target);
    _textures->mark_dirty(target);

    return true;
}

bool Stroke_Session::pointer_move(glm::vec2 const &pos) {
    ZoneScoped;
    auto target = paintable_target();
    update_cursor(pos, target != nullptr);

    if (!_stroke.has_value()) {
        return false;
    }

    if (target == nullptr || target->id != _stroke->target) {
        cancel();
        return false;
    }

    auto next = sample(pos, *target);
    if (!next.has_value()) {
        return false;
    }

    _stroke->samples.push_back(*next);
    rasterize_newest(target);
    _textures->mark_dirty(target);

    return true;
}

void Stroke_Session::pointer_up(glm::vec2 const &pos, Pointer_Button button) {
    auto target = paintable_target();
    update_cursor(pos, target != nullptr);

    if (!_stroke.has_value() || button != Pointer_Button::Primary) {
        return;
    }

    if (target != nullptr && target->id == _stroke->target) {
        finish(target);
    } else {
        cancel();
    }
}

void Stroke_Session::pointer_leave() {
    auto target = paintable_target();
    update_cursor(_cursor.center, target != nullptr);

    if (!_stroke.has_value()) {
        return;
    }

    if (target != nullptr && target->id == _stroke->target) {
        finish(target);
    } else {
        cancel();
    }
}

void Stroke_Session::update_cursor(glm::vec2 const &pos, bool gate_open) {
    _cursor = compute_cursor(pos, _scene->brush_settings(), gate_open, _config.cursor_disabled_opacity);
}

std::optional<Stroke_Sample> Stroke_Session::sample(glm::vec2 const &pos, Scene_Object const &target) {
    auto hit = _projector->project(pos, _scene->view(), target);
    if (!hit.has_value() || !hit->uv.has_value()) {
        return std::nullopt;
    }

    return Stroke_Sample { hit->point, *hit->uv };
}

void Stroke_Session::rasterize_newest(Scene_Object *target) {
    ZoneScoped;
    auto paint = _textures->find(target);
    if (paint == nullptr) {
        // Cleared mid-stroke
        return;
    }

    auto const &settings = _stroke->settings;
    auto const &samples = _stroke->samples;
    auto const width = paint->width();
    auto const height = paint->height();

    auto anchor = uv_to_pixel(samples.front().uv, width, height);
    auto params = make_raster_params(settings, width, height, anchor, _config.stipple_density);

    // Connected brushes draw the newest segment, the rest draw the newest
    // sample only
    auto connected = settings.type == Brush_Type::Round || settings.type == Brush_Type::Gradient;
    glm::vec2 points[2];
    size_t count;
    auto n = samples.size();
    if (connected && n >= 2) {
        points[0] = uv_to_pixel(samples[n - 2].uv, width, height);
        points[1] = uv_to_pixel(samples[n - 1].uv, width, height);
        count = 2;
    } else {
        points[0] = uv_to_pixel(samples[n - 1].uv, width, height);
        count = 1;
    }

    rasterize(paint->buffer(), points, count, params, _rng);
}

void Stroke_Session::finish(Scene_Object *target) {
    if (!_stroke->samples.empty()) {
        _textures->mark_dirty(target);
    }

    _logger->log(Severity::Debug, "stroke finished with %zu samples", _stroke->samples.size());
    _stroke.reset();
}

void Stroke_Session::cancel() {
    _logger->log(Severity::Debug, "stroke interrupted: target is no longer paintable");
    _stroke.reset();
}

}
