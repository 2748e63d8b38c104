#include "key_manager.hpp"

void KeyManager::bind(int key, unsigned mods, std::function<void()> handler,
                      Mode mode) {
    m_bindings.push_back({key, mods, mode, std::move(handler)});
}

void KeyManager::process(bool imgui_captured) {
    if (imgui_captured) {
        return;
    }

    const unsigned mods = held_modifiers();
    for (const auto &binding : m_bindings) {
        if (binding.mods != mods) {
            continue;
        }

        const bool fired = binding.mode == Mode::Pressed
                               ? IsKeyPressed(binding.key)
                               : IsKeyPressed(binding.key) ||
                                     IsKeyPressedRepeat(binding.key);
        if (fired) {
            binding.callback();
        }
    }
}

unsigned KeyManager::held_modifiers() {
    unsigned mods = NONE;
    if (IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL) ||
        IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER)) {
        mods |= CTRL;
    }
    if (IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT)) {
        mods |= SHIFT;
    }
    if (IsKeyDown(KEY_LEFT_ALT) || IsKeyDown(KEY_RIGHT_ALT)) {
        mods |= ALT;
    }
    return mods;
}
