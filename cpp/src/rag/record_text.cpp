#include "isidorcpp/record_text.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace isidorcpp {
namespace {

// nlohmann::json objects are key-ordered, so dump() is canonical for any insertion order.
nlohmann::json ToJson(const FieldValue& value) {
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, FieldList>) {
          auto list = nlohmann::json::array();
          for (const auto& element : v) {
            list.push_back(ToJson(element));
          }
          return list;
        } else if constexpr (std::is_same_v<T, FieldObject>) {
          auto object = nlohmann::json::object();
          for (const auto& [key, element] : v) {
            object[key] = ToJson(element);
          }
          return object;
        } else {
          return v;
        }
      },
      value.storage());
}

std::vector<const std::pair<std::string, FieldValue>*> SortedEntries(const FieldObject& object) {
  std::vector<const std::pair<std::string, FieldValue>*> entries{};
  entries.reserve(object.size());
  for (const auto& entry : object) {
    entries.push_back(&entry);
  }
  std::stable_sort(entries.begin(), entries.end(), [](const auto* lhs, const auto* rhs) {
    return lhs->first < rhs->first;
  });
  return entries;
}

std::string TopLevelText(const FieldValue& value) {
  if (const auto* text = std::get_if<std::string>(&value.storage())) {
    return *text;
  }
  return EncodeFieldValue(value);
}

template <typename T>
void PutOptional(FieldObject& fields, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    fields.emplace_back(key, FieldValue(*value));
  }
}

}  // namespace

std::optional<std::string> MetricCategory(const MetricValue& value) {
  return std::visit(
      [](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SleepMetric>) {
          return "sleep";
        } else if constexpr (std::is_same_v<T, ActivityMetric>) {
          return "activity";
        } else if constexpr (std::is_same_v<T, HeartRateMetric>) {
          return "heart_rate";
        } else if constexpr (std::is_same_v<T, BloodPressureMetric>) {
          return "blood_pressure";
        } else if constexpr (std::is_same_v<T, WeightMetric>) {
          return "weight";
        } else if constexpr (std::is_same_v<T, MoodMetric>) {
          return "mood";
        } else if constexpr (std::is_same_v<T, CaloriesMetric>) {
          return "calories";
        } else if constexpr (std::is_same_v<T, EventMetric>) {
          return "event";
        } else {
          return std::nullopt;
        }
      },
      value);
}

FieldObject ToFields(const MetricValue& value) {
  FieldObject fields{};
  std::visit(
      [&fields](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SleepMetric>) {
          fields.emplace_back("duration_hours", v.duration_hours);
          PutOptional(fields, "deep_sleep_hours", v.deep_sleep_hours);
          PutOptional(fields, "rem_sleep_hours", v.rem_sleep_hours);
          PutOptional(fields, "quality", v.quality);
        } else if constexpr (std::is_same_v<T, ActivityMetric>) {
          fields.emplace_back("steps", v.steps);
          PutOptional(fields, "active_minutes", v.active_minutes);
          PutOptional(fields, "distance_km", v.distance_km);
        } else if constexpr (std::is_same_v<T, HeartRateMetric>) {
          fields.emplace_back("bpm", v.bpm);
          PutOptional(fields, "resting_bpm", v.resting_bpm);
          PutOptional(fields, "hrv_ms", v.hrv_ms);
        } else if constexpr (std::is_same_v<T, BloodPressureMetric>) {
          fields.emplace_back("systolic", v.systolic);
          fields.emplace_back("diastolic", v.diastolic);
          PutOptional(fields, "pulse", v.pulse);
        } else if constexpr (std::is_same_v<T, WeightMetric>) {
          fields.emplace_back("kilograms", v.kilograms);
          PutOptional(fields, "body_fat_percent", v.body_fat_percent);
        } else if constexpr (std::is_same_v<T, MoodMetric>) {
          fields.emplace_back("score", v.score);
          PutOptional(fields, "note", v.note);
        } else if constexpr (std::is_same_v<T, CaloriesMetric>) {
          fields.emplace_back("consumed", v.consumed);
          PutOptional(fields, "burned", v.burned);
        } else if constexpr (std::is_same_v<T, EventMetric>) {
          fields.emplace_back("name", v.name);
          PutOptional(fields, "note", v.note);
        } else {
          fields = v.fields;
        }
      },
      value);
  return fields;
}

std::string EncodeFieldValue(const FieldValue& value) {
  return ToJson(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ClipUtf8(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return std::string(text.substr(0, cut));
}

std::string CanonicalRecordText(std::string_view category, const FieldObject& fields, std::string_view source) {
  std::string out{};
  out.reserve(64 + fields.size() * 24);
  out.append(category);
  out.append(": source: ");
  out.append(source);
  for (const auto* entry : SortedEntries(fields)) {
    out.append("; ");
    out.append(entry->first);
    out.append(": ");
    out.append(TopLevelText(entry->second));
  }
  return out;
}

std::string CanonicalRecordText(std::string_view category, const MetricValue& value, std::string_view source) {
  return CanonicalRecordText(category, ToFields(value), source);
}

}  // namespace isidorcpp
