#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace isidorcpp {

class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& message) : std::runtime_error(message) {}
  explicit EngineError(const char* message) : std::runtime_error(message) {}
};

// The embedding model cannot be loaded or reached. Fatal for a context build.
class EmbeddingUnavailable : public EngineError {
 public:
  using EngineError::EngineError;
};

// Two vectors of different length met in one computation. Programmer error.
class DimensionMismatch : public EngineError {
 public:
  DimensionMismatch(const std::string& where, std::size_t expected, std::size_t actual)
      : EngineError(where + " dimension mismatch: expected " + std::to_string(expected) + ", got " +
                    std::to_string(actual)) {}
  using EngineError::EngineError;
};

class StoreUnavailable : public EngineError {
 public:
  using EngineError::EngineError;
};

class CacheUnavailable : public EngineError {
 public:
  using EngineError::EngineError;
};

}  // namespace isidorcpp
