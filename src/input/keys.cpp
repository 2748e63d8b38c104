#include "keys.hpp"

#include "utility/logger.hpp"

void setup_keys(KeyManager &key_manager, Context &ctx, MenuBarUI &menu_bar) {
    using KM = KeyManager;
    auto &editor = ctx.editor;
    auto &rcfg = ctx.rcfg;

    // Undo/Redo operations
    key_manager.bind(
        KEY_Z, KM::CTRL,
        [&editor]() {
            editor.undo();
        },
        KM::Mode::Repeat);
    key_manager.bind(
        KEY_Z, KM::CTRL | KM::SHIFT,
        [&editor]() {
            editor.redo();
        },
        KM::Mode::Repeat);
    key_manager.bind(
        KEY_Y, KM::CTRL,
        [&editor]() {
            editor.redo();
        },
        KM::Mode::Repeat);

    // Bulk edits
    key_manager.bind(KEY_F, KM::NONE, [&editor]() {
        if (!editor.fill_enclosed())
            LOG_DEBUG("Nothing enclosed to fill");
    });
    key_manager.bind(KEY_DELETE, KM::NONE, [&editor]() {
        if (!editor.clear_all())
            LOG_DEBUG("Grid already empty");
    });

    // File operations
    key_manager.bind(KEY_N, KM::CTRL, [&menu_bar, &ctx]() {
        menu_bar.trigger_new_project(ctx);
    });
    key_manager.bind(KEY_O, KM::CTRL, [&menu_bar, &ctx]() {
        menu_bar.trigger_open_project(ctx);
    });
    key_manager.bind(KEY_S, KM::CTRL, [&menu_bar, &ctx]() {
        menu_bar.trigger_save_project(ctx);
    });
    key_manager.bind(KEY_S, KM::CTRL | KM::SHIFT, [&menu_bar, &ctx]() {
        menu_bar.trigger_save_as_project(ctx);
    });

    // Windows
    key_manager.bind(KEY_TAB, KM::NONE, [&rcfg]() {
        rcfg.show_ui = !rcfg.show_ui;
    });
    key_manager.bind(KEY_ONE, KM::NONE, [&rcfg]() {
        rcfg.show_controls = !rcfg.show_controls;
    });
    key_manager.bind(KEY_TWO, KM::NONE, [&rcfg]() {
        rcfg.show_history_ui = !rcfg.show_history_ui;
    });
    key_manager.bind(KEY_THREE, KM::NONE, [&rcfg]() {
        rcfg.show_cells_list = !rcfg.show_cells_list;
    });
    key_manager.bind(KEY_G, KM::NONE, [&rcfg]() {
        rcfg.show_grid_lines = !rcfg.show_grid_lines;
    });

    key_manager.bind(KEY_ESCAPE, KM::NONE, [&ctx]() {
        ctx.should_exit = true;
    });
}
