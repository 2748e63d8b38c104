#pragma once

#include <functional>
#include <vector>

#include <raylib.h>

/**
 * @brief Keyboard shortcut table.
 *
 * Handlers are bound to a key plus an exact modifier set and run from
 * process() once per frame, unless ImGui owns the keyboard.
 */
class KeyManager {
  public:
    /**
     * @brief Modifier bits; Ctrl also matches Cmd/Super.
     */
    enum Modifier : unsigned {
        NONE = 0,
        CTRL = 1u << 0,
        SHIFT = 1u << 1,
        ALT = 1u << 2,
    };

    /**
     * @brief Key input modes for different behaviors.
     */
    enum class Mode {
        Pressed, ///< Triggered once when key is pressed
        Repeat   ///< Triggered on press and on OS key repeat
    };

    /**
     * @brief Register a handler.
     * @param key The raylib key code
     * @param mods Exact modifier combination that must be held
     * @param handler Function to call
     * @param mode When the handler fires
     */
    void bind(int key, unsigned mods, std::function<void()> handler,
              Mode mode = Mode::Pressed);

    /**
     * @brief Run every handler whose shortcut fired this frame.
     * @param imgui_captured Whether ImGui has captured keyboard input
     */
    void process(bool imgui_captured);

    void clear() { m_bindings.clear(); }

    size_t size() const { return m_bindings.size(); }

  private:
    struct Binding {
        int key;
        unsigned mods;
        Mode mode;
        std::function<void()> callback;
    };

    /**
     * @brief Modifier bits currently held.
     */
    static unsigned held_modifiers();

    std::vector<Binding> m_bindings;
};
