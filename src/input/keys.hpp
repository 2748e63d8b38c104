#pragma once

#include "key_manager.hpp"

#include "render/types/context.hpp"
#include "render/ui/menu_bar_ui.hpp"

/**
 * @brief Sets up all keyboard shortcuts for the application.
 *
 * Registers handlers for undo/redo, fill and clear, file operations and
 * window toggles.
 *
 * @param key_manager The KeyManager instance to register handlers with
 * @param ctx Session context; must outlive the key manager
 * @param menu_bar The menu bar UI for file operations
 */
void setup_keys(KeyManager &key_manager, Context &ctx, MenuBarUI &menu_bar);
