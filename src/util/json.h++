#pragma once
#include <util/common.h++>
#include <limits>
#include <vector>
#include <simdjson.h>

// util.h clearly wasn't meant to be accessed like this, so this undef is
// necessary to build with musl because it no longer has the config
// information from cmake and doesn't know that musl doesn't define strtoull_l.
#undef FLATBUFFERS_LOCALE_INDEPENDENT
#include <flatbuffers/util.h>

namespace Pushbullet {

static inline auto pad_json_string(std::string& str) -> void {
  static constexpr ConstArray<char, simdjson::SIMDJSON_PADDING> PADDING_BYTES(' ');
  static constexpr std::string_view JSON_STRING_PADDING(PADDING_BYTES.arr, simdjson::SIMDJSON_PADDING);
  const auto len = str.length();
  str += JSON_STRING_PADDING;
  str.resize(len);
}

// Unwraps a simdjson result, turning a simdjson error into a DecodeError.
template <typename T>
static inline auto json_get(simdjson::simdjson_result<T>&& result, std::string_view expected) -> T {
  T out;
  if (const auto err = std::move(result).get(out)) {
    throw DecodeError(
      err == simdjson::INCORRECT_TYPE ? DecodeErrorKind::InvalidValue : DecodeErrorKind::MalformedShape,
      fmt::format("expected {} ({})", expected, simdjson::error_message(err))
    );
  }
  return out;
}

static inline auto json_object(simdjson::ondemand::value value, std::string_view what) -> simdjson::ondemand::object {
  simdjson::ondemand::object obj;
  if (value.get_object().get(obj)) {
    throw DecodeError(DecodeErrorKind::MalformedShape, fmt::format("cannot parse {} from non-object", what));
  }
  return obj;
}

template <typename T> struct JsonSerialize;
template<> struct JsonSerialize<int64_t> {
  static auto to_json(int64_t v, std::string& out) { out += std::to_string(v); }
  static auto from_json(simdjson::ondemand::value value) -> int64_t { return json_get(value.get_int64(), "integer"); }
};
template<> struct JsonSerialize<int32_t> {
  static auto to_json(int32_t v, std::string& out) { out += std::to_string(v); }
  static auto from_json(simdjson::ondemand::value value) -> int32_t {
    const auto n = json_get(value.get_int64(), "integer");
    if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
      throw DecodeError(DecodeErrorKind::InvalidValue, fmt::format("integer {} out of range", n));
    }
    return (int32_t)n;
  }
};
template <> struct JsonSerialize<bool> {
  static auto to_json(bool v, std::string& out) { out += v ? "true" : "false"; }
  static auto from_json(simdjson::ondemand::value value) -> bool { return json_get(value.get_bool(), "boolean"); }
};
template <> struct JsonSerialize<std::string_view> {
  static auto to_json(std::string_view v, std::string& out) {
    if (!flatbuffers::EscapeString(v.data(), v.length(), &out, false, true)) {
      throw std::runtime_error("Cannot write non-UTF-8 string data as JSON");
    }
  }
};
template <> struct JsonSerialize<std::string> {
  static auto to_json(const std::string& v, std::string& out) {
    if (!flatbuffers::EscapeString(v.c_str(), v.length(), &out, false, true)) {
      throw std::runtime_error("Cannot write non-UTF-8 string data as JSON");
    }
  }
  static auto from_json(simdjson::ondemand::value value) -> std::string {
    return std::string(json_get(value.get_string(), "string"));
  }
};
template <typename T> struct JsonSerialize<std::optional<T>> {
  static auto to_json(const std::optional<T>& v, std::string& out) {
    if (v) JsonSerialize<T>::to_json(*v, out); else out += "null";
  }
  static auto from_json(simdjson::ondemand::value value) -> std::optional<T> {
    if (json_get(value.is_null(), "value")) return {};
    return std::optional(JsonSerialize<T>::from_json(value));
  }
};
template <typename T> struct JsonSerialize<std::vector<T>> {
  static auto to_json(const std::vector<T>& v, std::string& out) {
    out += "[";
    for (size_t i = 0; i < v.size(); i++) {
      if (i) out += ",";
      JsonSerialize<T>::to_json(v[i], out);
    }
    out += "]";
  }
  static auto from_json(simdjson::ondemand::value value) -> std::vector<T> {
    std::vector<T> out;
    for (auto v : json_get(value.get_array(), "array")) {
      out.push_back(JsonSerialize<T>::from_json(json_get(std::move(v), "array element")));
    }
    return out;
  }
};

// Looks up a key that must be present and non-null. Errors raised while
// decoding the value are tagged with the key, unless a nested key already is.
template <typename T> struct JsonEntrySerialize {
  static auto to_json_entry(std::string_view key, const T& v, bool comma, std::string& out) -> bool {
    out += comma ? ",\"" : "\"";
    out += key;
    out += "\":";
    JsonSerialize<T>::to_json(v, out);
    return true;
  }
  static auto from_json_entry(std::string_view key, simdjson::ondemand::object object) -> T {
    auto key_result = object[key];
    if (key_result.error() == simdjson::NO_SUCH_FIELD) {
      throw DecodeError(DecodeErrorKind::MissingField, "missing required key", std::string(key));
    } else if (key_result.error()) {
      throw DecodeError(DecodeErrorKind::MalformedShape, simdjson::error_message(key_result.error()), std::string(key));
    }
    auto value = key_result.value_unsafe();
    if (json_get(value.is_null(), "value")) {
      throw DecodeError(DecodeErrorKind::MissingField, "required key is null", std::string(key));
    }
    try {
      return JsonSerialize<T>::from_json(value);
    } catch (const DecodeError& e) {
      if (!e.field.empty()) throw;
      throw DecodeError(e.kind, e.message, std::string(key));
    }
  }
};
template <typename T> struct JsonEntrySerialize<std::optional<T>> {
  // Absent optionals are written as null, not skipped.
  static auto to_json_entry(std::string_view key, const std::optional<T>& v, bool comma, std::string& out) -> bool {
    out += comma ? ",\"" : "\"";
    out += key;
    out += "\":";
    JsonSerialize<std::optional<T>>::to_json(v, out);
    return true;
  }
  static auto from_json_entry(std::string_view key, simdjson::ondemand::object object) -> std::optional<T> {
    auto key_result = object[key];
    if (key_result.error() == simdjson::NO_SUCH_FIELD) return {};
    else if (key_result.error()) {
      throw DecodeError(DecodeErrorKind::MalformedShape, simdjson::error_message(key_result.error()), std::string(key));
    }
    try {
      return JsonSerialize<std::optional<T>>::from_json(key_result.value_unsafe());
    } catch (const DecodeError& e) {
      if (!e.field.empty()) throw;
      throw DecodeError(e.kind, e.message, std::string(key));
    }
  }
};

template <typename T>
static inline auto write_json_entry(std::string_view key, const T& v, bool& comma, std::string& out) -> void {
  if (JsonEntrySerialize<T>::to_json_entry(key, v, comma, out)) comma = true;
}

template <typename T>
static inline auto read_json_entry(std::string_view key, simdjson::ondemand::object object) -> T {
  return JsonEntrySerialize<T>::from_json_entry(key, object);
}

}
