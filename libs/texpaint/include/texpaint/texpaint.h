// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: libtexpaint, texture-space painting on 3D objects
//

#pragma once

#include <memory>

#include <texpaint/brush.h>
#include <texpaint/config.h>
#include <texpaint/cursor.h>
#include <texpaint/logger.h>
#include <texpaint/paint_texture.h>
#include <texpaint/projector.h>
#include <texpaint/raster.h>
#include <texpaint/scene.h>
#include <texpaint/status.h>
#include <texpaint/stroke_session.h>
#include <texpaint/texture.h>

namespace texpaint {

class TEXPAINT_EXPORT IPaint_Engine {
public:
    virtual ~IPaint_Engine() = default;

    // Feeds a pointer event into the stroke session
    virtual void handle(Pointer_Event const &ev) = 0;

    virtual Session_State state() const = 0;

    virtual Cursor_Indicator const &cursor() const = 0;

    // Drops the paint layer of the target and restores its material
    virtual void clear_paint(Scene_Object *target) = 0;

    // Live paint layer of the target or nullptr
    virtual Paint_Texture *paint_texture(Scene_Object const *target) = 0;

    // Finishes pending base image decodes of the selected object
    virtual bool poll() = 0;

    virtual TEXPAINT_RETURN_CODE export_paint(Scene_Object const *target, char const *path) = 0;
};

/**
 * Creates a paint engine.
 * \param config Configuration
 * \param scene State provider; must outlive the engine
 * \param logger Message sink; if NULL, the engine logs to stderr
 * \throws texpaint::Exception(Status::Invalid_Configuration) if the
 * configuration is invalid
 */
TEXPAINT_EXPORT std::unique_ptr<IPaint_Engine>
make_paint_engine(Config const &config, IScene_Provider *scene, ILogger *logger = nullptr);

}
