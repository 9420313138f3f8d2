#include "values.h++"
#include <cmath>
#include <ada.h>

using std::optional, std::string, std::string_view;

namespace Pushbullet {
  auto percent_encode(string_view str) -> string {
    static constexpr char HEX[] = "0123456789ABCDEF";
    string out;
    out.reserve(str.length());
    for (const char c : str) {
      if (
        (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~'
      ) {
        out.push_back(c);
      } else {
        const auto byte = static_cast<uint8_t>(c);
        out.push_back('%');
        out.push_back(HEX[byte >> 4]);
        out.push_back(HEX[byte & 0xf]);
      }
    }
    return out;
  }

  // std::regex recurses once per character; longer input overflows the stack.
  static constexpr size_t MAX_EMAIL_LENGTH = 254, MAX_MIME_TYPE_LENGTH = 255;

  auto EmailAddress::parse(string_view str) -> optional<EmailAddress> {
    if (str.length() > MAX_EMAIL_LENGTH) return {};
    if (!std::regex_match(str.begin(), str.end(), email_regex)) return {};
    return EmailAddress{string(str)};
  }

  auto Url::parse(string_view str) -> optional<Url> {
    if (!ada::parse(str)) return {};
    return Url{string(str)};
  }

  auto MimeType::parse(string_view str) -> optional<MimeType> {
    if (str.length() > MAX_MIME_TYPE_LENGTH) return {};
    if (!std::regex_match(str.begin(), str.end(), mime_type_regex)) return {};
    return MimeType{string(str)};
  }

  auto PushbulletTime::from_seconds(double seconds) -> PushbulletTime {
    using namespace std::chrono;
    // One second short of the limit, so rounding to microseconds cannot overflow.
    static constexpr double max_seconds = duration<double>(Timestamp::duration::max()).count() - 1.0;
    if (!std::isfinite(seconds) || seconds < 0 || seconds > max_seconds) {
      throw DecodeError(DecodeErrorKind::InvalidValue, fmt::format("not a timestamp: {}", seconds));
    }
    return { Timestamp(duration_cast<Timestamp::duration>(round<microseconds>(duration<double>(seconds)))) };
  }

  auto PushbulletTime::seconds() const -> double {
    using namespace std::chrono;
    return duration_cast<microseconds>(time.time_since_epoch()).count() / 1'000'000.0;
  }

  auto JsonSerialize<EmailAddress>::to_json(const EmailAddress& v, string& out) -> void {
    JsonSerialize<string>::to_json(v.value, out);
  }
  auto JsonSerialize<EmailAddress>::from_json(simdjson::ondemand::value value) -> EmailAddress {
    const auto str = json_get(value.get_string(), "string");
    if (auto email = EmailAddress::parse(str)) return *email;
    throw DecodeError(DecodeErrorKind::InvalidValue, fmt::format("not an email address: \"{}\"", str));
  }

  auto JsonSerialize<Url>::to_json(const Url& v, string& out) -> void {
    JsonSerialize<string>::to_json(v.value, out);
  }
  auto JsonSerialize<Url>::from_json(simdjson::ondemand::value value) -> Url {
    const auto str = json_get(value.get_string(), "string");
    if (auto url = Url::parse(str)) return *url;
    throw DecodeError(DecodeErrorKind::InvalidValue, fmt::format("not a URL: \"{}\"", str));
  }

  auto JsonSerialize<MimeType>::to_json(const MimeType& v, string& out) -> void {
    JsonSerialize<string>::to_json(v.value, out);
  }
  auto JsonSerialize<MimeType>::from_json(simdjson::ondemand::value value) -> MimeType {
    const auto str = json_get(value.get_string(), "string");
    if (auto mime = MimeType::parse(str)) return *mime;
    throw DecodeError(DecodeErrorKind::InvalidValue, fmt::format("not a MIME type: \"{}\"", str));
  }

  auto JsonSerialize<PushbulletTime>::to_json(const PushbulletTime& v, string& out) -> void {
    fmt::format_to(std::back_inserter(out), "{:.6f}", v.seconds());
  }
  auto JsonSerialize<PushbulletTime>::from_json(simdjson::ondemand::value value) -> PushbulletTime {
    return PushbulletTime::from_seconds(json_get(value.get_double(), "number"));
  }
}
