#pragma once

#include "../../editor/grid_editor.hpp"
#include "../../save_manager.hpp"
#include "config.hpp"
#include "window.hpp"

// per-session context passed to renderers and key handlers
struct Context {
    GridEditor &editor;
    Config &rcfg;
    const WindowConfig &wcfg;

    SaveManager &save;

    bool should_exit = false;

    Context(GridEditor &editor, Config &rcfg, const WindowConfig &wcfg,
            SaveManager &save)
        : editor(editor), rcfg(rcfg), wcfg(wcfg), save(save) {}
};
