// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: scene provider of the paint demo
//

#pragma once

#include <set>
#include <texpaint/scene.h>

class Demo_Scene : public texpaint::IScene_Provider {
public:
    Demo_Scene(unsigned width, unsigned height);

    bool paint_mode() const override {
        return painting;
    }

    texpaint::Brush_Settings brush_settings() const override {
        return settings;
    }

    texpaint::Scene_Object *selected_object() override {
        return &object;
    }

    bool is_locked(texpaint::Object_ID id) const override {
        return locked.count(id) != 0;
    }

    texpaint::View_State view() const override {
        return view_state;
    }

    void toggle_lock();

    bool painting = true;
    texpaint::Brush_Settings settings;
    texpaint::Scene_Object object;
    std::set<texpaint::Object_ID> locked;
    texpaint::View_State view_state;
};
