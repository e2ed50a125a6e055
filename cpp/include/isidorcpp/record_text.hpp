#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace isidorcpp {

class FieldValue;

using FieldList = std::vector<FieldValue>;
using FieldObject = std::vector<std::pair<std::string, FieldValue>>;

// Free-form payload value: null, bool, integer, real, string, list or object.
class FieldValue {
 public:
  using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, FieldList, FieldObject>;

  FieldValue() = default;
  FieldValue(bool value) : storage_(value) {}
  FieldValue(int value) : storage_(static_cast<std::int64_t>(value)) {}
  FieldValue(std::int64_t value) : storage_(value) {}
  FieldValue(double value) : storage_(value) {}
  FieldValue(const char* value) : storage_(std::string(value)) {}
  FieldValue(std::string value) : storage_(std::move(value)) {}
  FieldValue(FieldList value) : storage_(std::move(value)) {}
  FieldValue(FieldObject value) : storage_(std::move(value)) {}

  [[nodiscard]] const Storage& storage() const { return storage_; }
  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(storage_); }
  [[nodiscard]] bool is_list() const { return std::holds_alternative<FieldList>(storage_); }
  [[nodiscard]] bool is_object() const { return std::holds_alternative<FieldObject>(storage_); }

 private:
  Storage storage_{};
};

struct SleepMetric {
  double duration_hours = 0.0;
  std::optional<double> deep_sleep_hours;
  std::optional<double> rem_sleep_hours;
  std::optional<int> quality;
};

struct ActivityMetric {
  std::int64_t steps = 0;
  std::optional<double> active_minutes;
  std::optional<double> distance_km;
};

struct HeartRateMetric {
  double bpm = 0.0;
  std::optional<double> resting_bpm;
  std::optional<double> hrv_ms;
};

struct BloodPressureMetric {
  int systolic = 0;
  int diastolic = 0;
  std::optional<int> pulse;
};

struct WeightMetric {
  double kilograms = 0.0;
  std::optional<double> body_fat_percent;
};

struct MoodMetric {
  int score = 0;
  std::optional<std::string> note;
};

struct CaloriesMetric {
  double consumed = 0.0;
  std::optional<double> burned;
};

struct EventMetric {
  std::string name;
  std::optional<std::string> note;
};

struct GenericMetric {
  FieldObject fields;
};

using MetricValue = std::variant<SleepMetric,
                                 ActivityMetric,
                                 HeartRateMetric,
                                 BloodPressureMetric,
                                 WeightMetric,
                                 MoodMetric,
                                 CaloriesMetric,
                                 EventMetric,
                                 GenericMetric>;

// Category tag for the known shapes; nullopt for GenericMetric.
[[nodiscard]] std::optional<std::string> MetricCategory(const MetricValue& value);

// Flattens any metric shape into the generic key/value form. Absent optionals are skipped.
[[nodiscard]] FieldObject ToFields(const MetricValue& value);

// Compact JSON with object keys sorted. Reals use the shortest round-trip form and keep a
// fractional part (72.0). Invalid UTF-8 is replaced with U+FFFD.
[[nodiscard]] std::string EncodeFieldValue(const FieldValue& value);

// Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
[[nodiscard]] std::string ClipUtf8(std::string_view text, std::size_t max_bytes);

// "{category}: source: {source}; key: value; ..." with keys in byte order. Top-level string
// values are emitted raw, nested lists and objects through EncodeFieldValue.
[[nodiscard]] std::string CanonicalRecordText(std::string_view category,
                                              const FieldObject& fields,
                                              std::string_view source);
[[nodiscard]] std::string CanonicalRecordText(std::string_view category,
                                              const MetricValue& value,
                                              std::string_view source);

}  // namespace isidorcpp
