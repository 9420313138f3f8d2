#pragma once
#include "models/values.h++"
#include <variant>

namespace Pushbullet {

// Whether a push is being created by this client (New) or was reported back
// by the server (Existing). Server-assigned fields only exist on Existing.
enum class Phase : uint8_t {
  New,
  Existing
};

enum class PushDirection : uint8_t {
  Self,
  Outgoing,
  Incoming
};

# define X_PUSH_DIRECTION(X) X(Self, "self") X(Outgoing, "outgoing") X(Incoming, "incoming")
# define TO_STRING_CASE(NAME, STR) case NAME: return STR;
# define PARSE_CASE(NAME, STR) if (str == STR) return NAME;

  constexpr auto to_string(PushDirection direction) -> std::string_view {
    using enum PushDirection;
    switch (direction) { X_PUSH_DIRECTION(TO_STRING_CASE) }
    return "";
  }
  static inline auto parse_push_direction(std::string_view str) -> PushDirection {
    using enum PushDirection;
    X_PUSH_DIRECTION(PARSE_CASE)
    throw DecodeError(DecodeErrorKind::UnrecognizedDiscriminator, "invalid direction string");
  }

# undef PARSE_CASE
# undef TO_STRING_CASE

struct ToAll {
  auto operator==(const ToAll&) const -> bool = default;
};
struct ToDevice {
  DeviceId device;
  auto operator==(const ToDevice&) const -> bool = default;
};
struct ToEmail {
  EmailAddress email;
  auto operator==(const ToEmail&) const -> bool = default;
};
struct ToChannel {
  ChannelTag channel;
  auto operator==(const ToChannel&) const -> bool = default;
};
struct ToClient {
  ClientId client;
  auto operator==(const ToClient&) const -> bool = default;
};
struct SentBroadcast {
  auto operator==(const SentBroadcast&) const -> bool = default;
};
struct SentToDevice {
  DeviceId device;
  auto operator==(const SentToDevice&) const -> bool = default;
};

// A new push can be addressed five ways; once it exists, the server only
// reports whether it went to one device or to none in particular.
template <Phase P> struct PushTargetFor;
template <> struct PushTargetFor<Phase::New> {
  using type = std::variant<ToAll, ToDevice, ToEmail, ToChannel, ToClient>;
};
template <> struct PushTargetFor<Phase::Existing> {
  using type = std::variant<SentBroadcast, SentToDevice>;
};
template <Phase P> using PushTarget = typename PushTargetFor<P>::type;

struct NotePush {
  std::optional<std::string> title;
  std::string body;
  auto operator==(const NotePush&) const -> bool = default;
};

struct LinkPush {
  std::optional<std::string> title;
  std::optional<std::string> body;
  Url url;
  auto operator==(const LinkPush&) const -> bool = default;
};

struct FileFields {
  std::optional<std::string> title;
  std::optional<std::string> body;
  std::string file_name;
  MimeType file_type;
  Url file_url;
  auto operator==(const FileFields&) const -> bool = default;
};

template <Phase P> struct FilePush;
template <> struct FilePush<Phase::New> : FileFields {
  auto operator==(const FilePush&) const -> bool = default;
};
// The server generates a thumbnail for image files.
template <> struct FilePush<Phase::Existing> : FileFields {
  std::optional<Url> image_url;
  std::optional<int32_t> image_width, image_height;
  auto operator==(const FilePush&) const -> bool = default;
};

template <Phase P> using PushData = std::variant<NotePush, LinkPush, FilePush<P>>;

struct SentByUser {
  UserId user_id;
  std::optional<ClientId> client_id;
  EmailAddress email, email_normalized;
  Name name;
  auto operator==(const SentByUser&) const -> bool = default;
};
struct SentByChannel {
  ChannelId channel_id;
  Name name;
  auto operator==(const SentByChannel&) const -> bool = default;
};
using PushSender = std::variant<SentByUser, SentByChannel>;

// Only pushes received by a user carry a receiver.
struct PushReceiver {
  UserId user_id;
  EmailAddress email, email_normalized;
  auto operator==(const PushReceiver&) const -> bool = default;
};

template <Phase P> struct PushFields {
  PushData<P> data;
  std::optional<DeviceId> source_device;
  PushTarget<P> target;
  std::optional<Guid> guid;
  auto operator==(const PushFields&) const -> bool = default;
};

template <Phase P> struct Push;
template <> struct Push<Phase::New> : PushFields<Phase::New> {
  auto operator==(const Push&) const -> bool = default;
};
template <> struct Push<Phase::Existing> : PushFields<Phase::Existing> {
  PushId id;
  bool active;
  PushbulletTime created, modified;
  bool dismissed;
  PushDirection direction;
  PushSender sender;
  std::optional<PushReceiver> receiver;
  auto operator==(const Push&) const -> bool = default;
};

// The service wraps lists of pushes in an object: {"pushes": [...]}
struct ExistingPushes {
  std::vector<Push<Phase::Existing>> pushes;
  auto operator==(const ExistingPushes&) const -> bool = default;
};

#define XBEGIN(name) struct name {
#define X(field, type) type field;
#define XEND };
#include "push_wire_types.x.h++"

// Builds a push with no source device and no guid.
static inline auto simple_new_push(PushTarget<Phase::New> target, PushData<Phase::New> data) -> Push<Phase::New> {
  return {{
    .data = std::move(data),
    .source_device = {},
    .target = std::move(target),
    .guid = {}
  }};
}

template <Phase P> static inline auto push_type_name(const PushData<P>& data) -> std::string_view {
  return std::visit(overload{
    [](const NotePush&) -> std::string_view { return "note"; },
    [](const LinkPush&) -> std::string_view { return "link"; },
    [](const FilePush<P>&) -> std::string_view { return "file"; }
  }, data);
}

// Tries the user form first; the user form wins if both would match.
auto reconstruct_sender(const SenderFields& fields) -> std::optional<PushSender>;
auto reconstruct_receiver(const ReceiverFields& fields) -> std::optional<PushReceiver>;

template <> struct JsonSerialize<PushDirection> {
  static auto to_json(PushDirection v, std::string& out) -> void {
    JsonSerialize<std::string_view>::to_json(to_string(v), out);
  }
  static auto from_json(simdjson::ondemand::value value) -> PushDirection {
    std::string_view str;
    if (value.get_string().get(str)) {
      throw DecodeError(DecodeErrorKind::InvalidValue, "cannot parse push direction from non-string");
    }
    return parse_push_direction(str);
  }
};

#define XNAMESPACE()
#include "util/to_json.x.h++"
#include "push_wire_types.x.h++"

#include "util/from_json.x.h++"
#include "push_wire_types.x.h++"
#undef XNAMESPACE

// Existing pushes are only ever decoded and new pushes only ever encoded, so
// each specialization provides just the one direction.
template <> struct JsonSerialize<Push<Phase::Existing>> {
  static auto from_json(simdjson::ondemand::value value) -> Push<Phase::Existing>;
};
template <> struct JsonSerialize<Push<Phase::New>> {
  static auto to_json(const Push<Phase::New>& v, std::string& out) -> void;
};
template <> struct JsonSerialize<ExistingPushes> {
  static auto from_json(simdjson::ondemand::value value) -> ExistingPushes;
};

struct DecodeOptions {
  // Documents larger than this are rejected before parsing.
  size_t max_size = 16 * MiB;
};

template <typename T> using Decoded = std::variant<T, DecodeError>;

// Holds a parser that is reused between calls; not thread-safe.
class PushDecoder {
  DecodeOptions options;
  simdjson::ondemand::parser parser;

  template <typename T> auto decode(std::string json, std::string_view what) -> Decoded<T>;
public:
  explicit PushDecoder(DecodeOptions options = {}) : options(options) {}

  auto existing_push(std::string json) -> Decoded<Push<Phase::Existing>>;
  auto existing_pushes(std::string json) -> Decoded<ExistingPushes>;
};

auto decode_existing_push(std::string json) -> Decoded<Push<Phase::Existing>>;
auto decode_existing_pushes(std::string json) -> Decoded<ExistingPushes>;
auto encode_new_push(const Push<Phase::New>& push) -> std::string;

}

namespace fmt {
  template <> struct formatter<Pushbullet::PushDirection> : public Pushbullet::CustomFormatter {
    template <typename FormatContext>
    auto format(Pushbullet::PushDirection d, FormatContext& ctx) const {
      const auto str = Pushbullet::to_string(d);
      return std::copy(str.begin(), str.end(), ctx.out());
    }
  };
}
