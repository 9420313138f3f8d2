#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <algorithm>
#include <chrono>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/compile.h>
#include <spdlog/spdlog.h>

namespace Pushbullet {

constexpr size_t MiB = 1024 * 1024;

const std::regex
  email_regex(
    R"((?:[a-z0-9!#$%&'*+/=?^_`{|}~-]+(?:\.[a-z0-9!#$%&'*+/=?^_`{|}~-]+)*|")"
    R"((?:[\x01-\x08\x0b\x0c\x0e-\x1f\x21\x23-\x5b\x5d-\x7f]|\\[\x01-\x09\x0b\x0c\x0e-\x7f])*")@)"
    R"((?:(?:[a-z0-9](?:[a-z0-9-]*[a-z0-9])?\.)+[a-z0-9](?:[a-z0-9-]*[a-z0-9])?|)"
    R"(\[(?:(?:(2(5[0-5]|[0-4][0-9])|1[0-9][0-9]|[1-9]?[0-9]))\.){3})"
    R"((?:(2(5[0-5]|[0-4][0-9])|1[0-9][0-9]|[1-9]?[0-9])|[a-z0-9-]*[a-z0-9]:)"
    R"((?:[\x01-\x08\x0b\x0c\x0e-\x1f\x21-\x5a\x53-\x7f]|\\[\x01-\x09\x0b\x0c\x0e-\x7f])+)\]))",
    std::regex::ECMAScript | std::regex::icase
  );

#define MIME_TYPE_REGEX_SRC R"([a-zA-Z0-9][a-zA-Z0-9!#$&^_.+-]*/[a-zA-Z0-9*][a-zA-Z0-9!#$&^_.+*-]*(?:\s*;.*)?)"
const std::regex mime_type_regex(MIME_TYPE_REGEX_SRC);

template<class... Ts> struct overload : Ts... { using Ts::operator()...; };
template<class... Ts> overload(Ts...) -> overload<Ts...>;

using Timestamp = std::chrono::system_clock::time_point;

enum class DecodeErrorKind : uint8_t {
  MalformedShape,
  MissingField,
  UnrecognizedDiscriminator,
  UnreconstructableUnion,
  InvalidValue
};

constexpr auto to_string(DecodeErrorKind kind) -> std::string_view {
  using enum DecodeErrorKind;
  switch (kind) {
    case MalformedShape: return "malformed shape";
    case MissingField: return "missing required field";
    case UnrecognizedDiscriminator: return "unrecognized discriminator";
    case UnreconstructableUnion: return "unreconstructable union";
    case InvalidValue: return "invalid value";
  }
  return "unknown";
}

// Thrown by JsonSerialize<T>::from_json; the document-level decode functions
// catch it and hand it back as a value.
struct DecodeError : public std::runtime_error {
  DecodeErrorKind kind;
  std::string message, field;
  DecodeError(DecodeErrorKind kind, std::string message, std::string field = {})
    : std::runtime_error(field.empty() ? message : fmt::format("{} (key \"{}\")", message, field)),
      kind(kind), message(message), field(field) {}
};

// Common base class for custom formatters
struct CustomFormatter {
  constexpr auto parse(fmt::format_parse_context& ctx) -> fmt::format_parse_context::iterator {
    return ctx.begin();
  }
};

template<typename T, size_t Size> struct ConstArray {
  T arr[Size];

  constexpr ConstArray(T x) : arr() {
    for (size_t i = 0; i < Size; i++) arr[i] = x;
  }
};

}
