// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: paint engine facade
//

#include "stdafx.h"
#include <texpaint/texpaint.h>

namespace texpaint {

class Paint_Engine : public IPaint_Engine {
public:
    Paint_Engine(Config const &config, IScene_Provider *scene, std::unique_ptr<ILogger> &&own_logger, ILogger *logger)
        : _scene(scene),
        _own_logger(std::move(own_logger)),
        _logger(logger != nullptr ? logger : _own_logger.get()),
        _projector(make_projector(config)),
        _textures(config, _logger),
        _session(config, scene, _projector.get(), &_textures, _logger) {
    }

    void handle(Pointer_Event const &ev) override {
        _session.handle(ev);
    }

    Session_State state() const override {
        return _session.state();
    }

    Cursor_Indicator const &cursor() const override {
        return _session.cursor();
    }

    void clear_paint(Scene_Object *target) override {
        _textures.clear(target);
    }

    Paint_Texture *paint_texture(Scene_Object const *target) override {
        return _textures.find(target);
    }

    bool poll() override {
        return _textures.poll(_scene->selected_object());
    }

    Status export_paint(Scene_Object const *target, char const *path) override {
        return _textures.export_png(target, path);
    }

private:
    IScene_Provider *_scene;
    std::unique_ptr<ILogger> _own_logger;
    ILogger *_logger;

    std::unique_ptr<IProjector> _projector;
    Paint_Texture_Manager _textures;
    Stroke_Session _session;
};

std::unique_ptr<IPaint_Engine> make_paint_engine(Config const &config, IScene_Provider *scene, ILogger *logger) {
    if (scene == nullptr) {
        throw Exception(Status::Invalid_Arguments);
    }

    auto rc = validate(config);
    if (rc != Status::OK) {
        throw Exception(rc);
    }

    std::unique_ptr<ILogger> own_logger;
    if (logger == nullptr) {
        own_logger = make_stderr_logger(config.log_level);
    }

    return std::make_unique<Paint_Engine>(config, scene, std::move(own_logger), logger);
}

}
