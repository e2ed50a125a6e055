#pragma once

#include "isidorcpp/types.hpp"

#include <memory>
#include <string>

namespace isidorcpp {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual Timestamp Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  Timestamp Now() const override;

  static std::shared_ptr<const Clock> Shared();
};

// UTC "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::string FormatUtcTimestamp(Timestamp timestamp);

}  // namespace isidorcpp
