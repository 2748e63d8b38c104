#pragma once

// Current framebuffer size, updated on window resize.
struct WindowConfig {
    int screen_width = 1080;
    int screen_height = 800;
};
