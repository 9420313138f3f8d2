#pragma once
#include "util/json.h++"
#include <compare>
#include <spdlog/fmt/chrono.h>

namespace Pushbullet {

auto percent_encode(std::string_view str) -> std::string;

// A string identifier ("iden") whose only meaning is its value. The tag keeps
// device, user, channel, etc. identifiers from being mixed up.
template <typename Tag> struct StringValue {
  std::string value;

  StringValue() = default;
  explicit StringValue(std::string value) : value(std::move(value)) {}

  auto operator==(const StringValue&) const -> bool = default;
  auto operator<=>(const StringValue&) const = default;

  auto to_url_segment() const -> std::string { return percent_encode(value); }
};

using DeviceId = StringValue<struct DeviceIdTag>;
using UserId = StringValue<struct UserIdTag>;
using ChannelId = StringValue<struct ChannelIdTag>;
using ChannelTag = StringValue<struct ChannelTagTag>;
using ClientId = StringValue<struct ClientIdTag>;
using PushId = StringValue<struct PushIdTag>;
using Guid = StringValue<struct GuidTag>;
using Name = StringValue<struct NameTag>;

struct EmailAddress {
  std::string value;

  static auto parse(std::string_view str) -> std::optional<EmailAddress>;

  auto operator==(const EmailAddress&) const -> bool = default;
};

struct Url {
  std::string value;

  static auto parse(std::string_view str) -> std::optional<Url>;

  auto operator==(const Url&) const -> bool = default;
};

struct MimeType {
  std::string value;

  static auto parse(std::string_view str) -> std::optional<MimeType>;

  auto operator==(const MimeType&) const -> bool = default;
};

// The service sends times as fractional seconds since the Unix epoch.
// Microsecond precision is all it ever provides. from_seconds throws
// DecodeError for negative, non-finite or out-of-range values.
struct PushbulletTime {
  Timestamp time;

  static auto from_seconds(double seconds) -> PushbulletTime;
  auto seconds() const -> double;

  auto operator==(const PushbulletTime&) const -> bool = default;
  auto operator<=>(const PushbulletTime&) const = default;
};

template <typename Tag> struct JsonSerialize<StringValue<Tag>> {
  static auto to_json(const StringValue<Tag>& v, std::string& out) {
    JsonSerialize<std::string>::to_json(v.value, out);
  }
  static auto from_json(simdjson::ondemand::value value) -> StringValue<Tag> {
    return StringValue<Tag>(JsonSerialize<std::string>::from_json(value));
  }
};
template <> struct JsonSerialize<EmailAddress> {
  static auto to_json(const EmailAddress& v, std::string& out) -> void;
  static auto from_json(simdjson::ondemand::value value) -> EmailAddress;
};
template <> struct JsonSerialize<Url> {
  static auto to_json(const Url& v, std::string& out) -> void;
  static auto from_json(simdjson::ondemand::value value) -> Url;
};
template <> struct JsonSerialize<MimeType> {
  static auto to_json(const MimeType& v, std::string& out) -> void;
  static auto from_json(simdjson::ondemand::value value) -> MimeType;
};
template <> struct JsonSerialize<PushbulletTime> {
  static auto to_json(const PushbulletTime& v, std::string& out) -> void;
  static auto from_json(simdjson::ondemand::value value) -> PushbulletTime;
};

}

namespace fmt {
  template <typename Tag> struct formatter<Pushbullet::StringValue<Tag>> : public Pushbullet::CustomFormatter {
    template <typename FormatContext>
    auto format(const Pushbullet::StringValue<Tag>& v, FormatContext& ctx) const {
      return std::copy(v.value.begin(), v.value.end(), ctx.out());
    }
  };

  template <> struct formatter<Pushbullet::EmailAddress> : public Pushbullet::CustomFormatter {
    template <typename FormatContext>
    auto format(const Pushbullet::EmailAddress& v, FormatContext& ctx) const {
      return std::copy(v.value.begin(), v.value.end(), ctx.out());
    }
  };

  template <> struct formatter<Pushbullet::Url> : public Pushbullet::CustomFormatter {
    template <typename FormatContext>
    auto format(const Pushbullet::Url& v, FormatContext& ctx) const {
      return std::copy(v.value.begin(), v.value.end(), ctx.out());
    }
  };

  template <> struct formatter<Pushbullet::PushbulletTime> : public Pushbullet::CustomFormatter {
    template <typename FormatContext>
    auto format(const Pushbullet::PushbulletTime& v, FormatContext& ctx) const {
      return format_to(ctx.out(), "{:%FT%TZ}", fmt::gmtime(std::chrono::system_clock::to_time_t(v.time)));
    }
  };
}
