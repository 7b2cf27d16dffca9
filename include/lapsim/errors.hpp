#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lapsim::errors {

inline std::string append_context(std::string message, std::string_view context) {
  if (!context.empty()) {
    message = std::string(context) + ": " + message;
  }
  return message;
}

class LapsimError : public std::runtime_error {
public:
  explicit LapsimError(std::string message, std::string context = {})
    : std::runtime_error(append_context(std::move(message), context))
    , context_(std::move(context)) {}

  const std::string& context() const noexcept { return context_; }

private:
  std::string context_{};
};

// Degenerate track input or inconsistent per-sample arrays.
class GeometryError : public LapsimError {
public:
  using LapsimError::LapsimError;
};

// Velocity profile alternation did not settle within its iteration cap.
class ConvergenceError : public LapsimError {
public:
  using LapsimError::LapsimError;
};

// Invalid vehicle / powertrain parameters.
class ConfigError : public LapsimError {
public:
  using LapsimError::LapsimError;
};

} // namespace lapsim::errors

namespace lapsim {
using errors::GeometryError;
using errors::ConvergenceError;
using errors::ConfigError;
} // namespace lapsim
