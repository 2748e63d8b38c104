#pragma once

#include <stdexcept>
#include <string>

namespace gridpaint {

/**
 * Base exception class for all gridpaint errors
 */
class GridpaintException : public std::runtime_error {
  public:
    explicit GridpaintException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for project and config file I/O (read/write, JSON parsing,
 * malformed project contents)
 */
class IOError : public GridpaintException {
  public:
    explicit IOError(const std::string &message)
        : GridpaintException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public GridpaintException {
  public:
    explicit ConfigError(const std::string &message)
        : GridpaintException("Configuration error: " + message) {}
};

/**
 * Exception for window and rendering setup failures
 */
class RenderError : public GridpaintException {
  public:
    explicit RenderError(const std::string &message)
        : GridpaintException("Render error: " + message) {}
};

} // namespace gridpaint
