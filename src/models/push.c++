#include "push.h++"

using std::optional, std::string, std::string_view, std::visit;

namespace Pushbullet {
  static auto sender_as_user(const SenderFields& f) -> optional<SentByUser> {
    if (!f.sender_iden || !f.sender_email || !f.sender_email_normalized || !f.sender_name) return {};
    return SentByUser{
      .user_id = *f.sender_iden,
      .client_id = f.client_iden,
      .email = *f.sender_email,
      .email_normalized = *f.sender_email_normalized,
      .name = *f.sender_name
    };
  }

  static auto sender_as_channel(const SenderFields& f) -> optional<SentByChannel> {
    if (!f.channel_iden || !f.sender_name) return {};
    return SentByChannel{ .channel_id = *f.channel_iden, .name = *f.sender_name };
  }

  auto reconstruct_sender(const SenderFields& fields) -> optional<PushSender> {
    if (auto user = sender_as_user(fields)) return PushSender(std::move(*user));
    if (auto channel = sender_as_channel(fields)) return PushSender(std::move(*channel));
    return {};
  }

  auto reconstruct_receiver(const ReceiverFields& f) -> optional<PushReceiver> {
    if (!f.receiver_iden || !f.receiver_email || !f.receiver_email_normalized) return {};
    return PushReceiver{
      .user_id = *f.receiver_iden,
      .email = *f.receiver_email,
      .email_normalized = *f.receiver_email_normalized
    };
  }

  // Push contents are flat keys on the push object, selected by "type".
  static auto read_push_data(simdjson::ondemand::object obj) -> PushData<Phase::Existing> {
    const auto type = read_json_entry<string>("type", obj);
    if (type == "note") {
      return NotePush{
        .title = read_json_entry<optional<string>>("title", obj),
        .body = read_json_entry<string>("body", obj)
      };
    } else if (type == "link") {
      return LinkPush{
        .title = read_json_entry<optional<string>>("title", obj),
        .body = read_json_entry<optional<string>>("body", obj),
        .url = read_json_entry<Url>("url", obj)
      };
    } else if (type == "file") {
      FilePush<Phase::Existing> file;
      file.title = read_json_entry<optional<string>>("file_title", obj);
      file.body = read_json_entry<optional<string>>("body", obj);
      file.file_name = read_json_entry<string>("file_name", obj);
      file.file_type = read_json_entry<MimeType>("file_type", obj);
      file.file_url = read_json_entry<Url>("file_url", obj);
      file.image_url = read_json_entry<optional<Url>>("image_url", obj);
      file.image_width = read_json_entry<optional<int32_t>>("image_width", obj);
      file.image_height = read_json_entry<optional<int32_t>>("image_height", obj);
      return file;
    }
    throw DecodeError(DecodeErrorKind::UnrecognizedDiscriminator, fmt::format("unrecognized push type \"{}\"", type), "type");
  }

  auto JsonSerialize<Push<Phase::Existing>>::from_json(simdjson::ondemand::value value) -> Push<Phase::Existing> {
    auto obj = json_object(value, "push");
    auto data = read_push_data(obj);

    auto sender = reconstruct_sender(JsonSerialize<SenderFields>::from_json_object(obj));
    if (!sender) {
      throw DecodeError(DecodeErrorKind::UnreconstructableUnion, "push not sent by channel or by user");
    }
    auto receiver = reconstruct_receiver(JsonSerialize<ReceiverFields>::from_json_object(obj));

    const auto target_device = read_json_entry<optional<DeviceId>>("target_device_iden", obj);
    Push<Phase::Existing> push;
    push.data = std::move(data);
    push.source_device = read_json_entry<optional<DeviceId>>("source_device_iden", obj);
    if (target_device) push.target = SentToDevice{ .device = *target_device };
    else push.target = SentBroadcast{};
    push.guid = read_json_entry<optional<Guid>>("guid", obj);
    push.id = read_json_entry<PushId>("iden", obj);
    push.active = read_json_entry<bool>("active", obj);
    push.created = read_json_entry<PushbulletTime>("created", obj);
    push.modified = read_json_entry<PushbulletTime>("modified", obj);
    push.dismissed = read_json_entry<bool>("dismissed", obj);
    push.direction = read_json_entry<PushDirection>("direction", obj);
    push.sender = std::move(*sender);
    push.receiver = std::move(receiver);
    return push;
  }

  auto JsonSerialize<ExistingPushes>::from_json(simdjson::ondemand::value value) -> ExistingPushes {
    auto obj = json_object(value, "existing pushes");
    return { .pushes = read_json_entry<std::vector<Push<Phase::Existing>>>("pushes", obj) };
  }

  static auto write_push_target(const PushTarget<Phase::New>& target, bool& comma, string& out) -> void {
    visit(overload{
      [](const ToAll&) {},
      [&](const ToDevice& t) { write_json_entry("device_iden", t.device, comma, out); },
      [&](const ToEmail& t) { write_json_entry("email", t.email, comma, out); },
      [&](const ToChannel& t) { write_json_entry("channel_tag", t.channel, comma, out); },
      [&](const ToClient& t) { write_json_entry("client_iden", t.client, comma, out); }
    }, target);
  }

  static auto write_push_data(const PushData<Phase::New>& data, bool& comma, string& out) -> void {
    write_json_entry<string_view>("type", push_type_name<Phase::New>(data), comma, out);
    visit(overload{
      [&](const NotePush& note) {
        write_json_entry("title", note.title, comma, out);
        write_json_entry("body", note.body, comma, out);
      },
      [&](const LinkPush& link) {
        write_json_entry("title", link.title, comma, out);
        write_json_entry("body", link.body, comma, out);
        write_json_entry("url", link.url, comma, out);
      },
      // Files are sent without a "title" key.
      [&](const FilePush<Phase::New>& file) {
        write_json_entry("body", file.body, comma, out);
        write_json_entry("file_name", file.file_name, comma, out);
        write_json_entry("file_type", file.file_type, comma, out);
        write_json_entry("file_url", file.file_url, comma, out);
      }
    }, data);
  }

  auto JsonSerialize<Push<Phase::New>>::to_json(const Push<Phase::New>& v, string& out) -> void {
    out += "{";
    bool comma = false;
    write_json_entry("source_device_iden", v.source_device, comma, out);
    write_json_entry("guid", v.guid, comma, out);
    write_push_target(v.target, comma, out);
    write_push_data(v.data, comma, out);
    out += "}";
  }

  static auto decode_failed(string_view what, DecodeError err) -> DecodeError {
    spdlog::warn("Cannot decode {} ({}) - {}", what, to_string(err.kind), err.what());
    return err;
  }

  template <typename T>
  auto PushDecoder::decode(string json, string_view what) -> Decoded<T> {
    if (json.length() > options.max_size) {
      return decode_failed(what, DecodeError(
        DecodeErrorKind::InvalidValue,
        fmt::format("document is too large ({:d} bytes, limit is {:d})", json.length(), options.max_size)
      ));
    }
    pad_json_string(json);
    try {
      auto doc = parser.iterate(json).value();
      auto result = JsonSerialize<T>::from_json(doc.get_value().value());
      doc.rewind();
      doc.raw_json().value();
      if (!doc.at_end()) {
        throw DecodeError(DecodeErrorKind::MalformedShape, "trailing content after JSON document");
      }
      return result;
    } catch (const DecodeError& e) {
      return decode_failed(what, e);
    } catch (const simdjson::simdjson_error& e) {
      return decode_failed(what, DecodeError(
        DecodeErrorKind::MalformedShape,
        fmt::format("invalid JSON ({})", simdjson::error_message(e.error()))
      ));
    }
  }

  auto PushDecoder::existing_push(string json) -> Decoded<Push<Phase::Existing>> {
    return decode<Push<Phase::Existing>>(std::move(json), "push");
  }

  auto PushDecoder::existing_pushes(string json) -> Decoded<ExistingPushes> {
    auto result = decode<ExistingPushes>(std::move(json), "existing pushes");
    if (const auto* pushes = std::get_if<ExistingPushes>(&result)) {
      spdlog::debug("Decoded {:d} existing pushes", pushes->pushes.size());
    }
    return result;
  }

  static auto thread_decoder() -> PushDecoder& {
    static thread_local PushDecoder decoder;
    return decoder;
  }

  auto decode_existing_push(string json) -> Decoded<Push<Phase::Existing>> {
    return thread_decoder().existing_push(std::move(json));
  }

  auto decode_existing_pushes(string json) -> Decoded<ExistingPushes> {
    return thread_decoder().existing_pushes(std::move(json));
  }

  auto encode_new_push(const Push<Phase::New>& push) -> string {
    string out;
    JsonSerialize<Push<Phase::New>>::to_json(push, out);
    spdlog::debug("Encoded new {} push ({:d} bytes)", push_type_name<Phase::New>(push.data), out.length());
    return out;
  }
}
