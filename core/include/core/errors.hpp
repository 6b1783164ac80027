#pragma once
/**
 * @file errors.hpp
 * @brief Exception types raised by template loading and rendering
 */

#include <stdexcept>
#include <string>

namespace MemeEngine {

/// Base for every error the engine reports
class MemeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Malformed or incomplete template JSON
class TemplateFormatError : public MemeError {
public:
  using MemeError::MemeError;
};

/// Structurally valid template that breaks a model invariant
class ValidationError : public MemeError {
public:
  using MemeError::MemeError;
};

/// More caller strings than overlays
class TextCountError : public MemeError {
public:
  TextCountError(size_t supplied, size_t available)
      : MemeError("Got " + std::to_string(supplied) + " text strings but the " +
                  "template only has " + std::to_string(available) +
                  " text templates"),
        supplied_(supplied), available_(available) {}

  [[nodiscard]] size_t supplied() const noexcept { return supplied_; }
  [[nodiscard]] size_t available() const noexcept { return available_; }

private:
  size_t supplied_;
  size_t available_;
};

/// Missing, unreadable or unwritable file
class IOError : public MemeError {
public:
  IOError(const std::string &message, std::string path)
      : MemeError(message + ": " + path), path_(std::move(path)) {}

  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  std::string path_;
};

/// Render abandoned through a CancellationToken
class RenderCancelled : public MemeError {
public:
  RenderCancelled() : MemeError("Render cancelled") {}
};

} // namespace MemeEngine
