#include "test_common.h++"
#include <set>

static inline auto sample_file() -> FilePush<Phase::New> {
  return {{
    .title = "Screenshot",
    .body = "from my phone",
    .file_name = "screen.png",
    .file_type = MimeType{"image/png"},
    .file_url = Url{"https://dl.pushbulletusercontent.com/abc/screen.png"}
  }};
}

TEST_CASE("encode a simple note push", "[push_encode]") {
  const auto push = simple_new_push(ToDevice{ .device = DeviceId("d1") }, NotePush{ .title = nullopt, .body = "hi" });
  REQUIRE(push.source_device == nullopt);
  REQUIRE(push.guid == nullopt);
  const auto json = encode_new_push(push);
  REQUIRE(json == R"({"source_device_iden":null,"guid":null,"device_iden":"d1","type":"note","title":null,"body":"hi"})");
  REQUIRE(json_entries(json) == map<string, string>{
    {"device_iden", "d1"},
    {"type", "note"},
    {"title", "null"},
    {"body", "hi"},
    {"source_device_iden", "null"},
    {"guid", "null"}
  });
}

TEST_CASE("encode every target and content combination", "[push_encode]") {
  const vector<pair<PushTarget<Phase::New>, vector<string>>> targets{
    { ToAll{}, {} },
    { ToDevice{ .device = DeviceId("d1") }, {"device_iden"} },
    { ToEmail{ .email = EmailAddress{"friend@example.com"} }, {"email"} },
    { ToChannel{ .channel = ChannelTag("launches") }, {"channel_tag"} },
    { ToClient{ .client = ClientId("cl1") }, {"client_iden"} }
  };
  const vector<pair<PushData<Phase::New>, vector<string>>> contents{
    { NotePush{ .title = "t", .body = "b" }, {"type", "title", "body"} },
    { LinkPush{ .title = "t", .body = nullopt, .url = Url{"http://www.google.com"} }, {"type", "title", "body", "url"} },
    { sample_file(), {"type", "body", "file_name", "file_type", "file_url"} }
  };

  std::set<vector<string>> seen;
  for (const auto& [target, target_keys] : targets) {
    for (const auto& [data, data_keys] : contents) {
      vector<string> expected{"source_device_iden", "guid"};
      expected.insert(expected.end(), target_keys.begin(), target_keys.end());
      expected.insert(expected.end(), data_keys.begin(), data_keys.end());
      std::sort(expected.begin(), expected.end());

      const auto entries = json_entries(encode_new_push(simple_new_push(target, data)));
      const auto keys = keys_of(entries);
      REQUIRE(keys == expected);
      REQUIRE(entries.at("type") == push_type_name<Phase::New>(data));
      seen.insert(keys);
    }
  }
  REQUIRE(seen.size() == targets.size() * contents.size());
}

TEST_CASE("encode target values", "[push_encode]") {
  const NotePush note{ .title = nullopt, .body = "b" };
  REQUIRE(json_entries(encode_new_push(simple_new_push(ToEmail{ .email = EmailAddress{"friend@example.com"} }, note))).at("email") == "friend@example.com");
  REQUIRE(json_entries(encode_new_push(simple_new_push(ToChannel{ .channel = ChannelTag("launches") }, note))).at("channel_tag") == "launches");
  REQUIRE(json_entries(encode_new_push(simple_new_push(ToClient{ .client = ClientId("cl1") }, note))).at("client_iden") == "cl1");
  REQUIRE(encode_new_push(simple_new_push(ToAll{}, note)) == R"({"source_device_iden":null,"guid":null,"type":"note","title":null,"body":"b"})");
}

TEST_CASE("encode link pushes", "[push_encode]") {
  const auto entries = json_entries(encode_new_push(simple_new_push(
    ToAll{},
    LinkPush{ .title = "Search", .body = nullopt, .url = Url{"https://www.google.com/search?q=pushbullet"} }
  )));
  REQUIRE(entries.at("type") == "link");
  REQUIRE(entries.at("title") == "Search");
  REQUIRE(entries.at("body") == "null");
  REQUIRE(entries.at("url") == "https://www.google.com/search?q=pushbullet");
}

TEST_CASE("file pushes are encoded without a title", "[push_encode]") {
  const auto json = encode_new_push(simple_new_push(ToAll{}, sample_file()));
  REQUIRE(json ==
    R"({"source_device_iden":null,"guid":null,"type":"file","body":"from my phone","file_name":"screen.png",)"
    R"("file_type":"image/png","file_url":"https://dl.pushbulletusercontent.com/abc/screen.png"})"
  );
  REQUIRE(!json_entries(json).contains("title"));
}

TEST_CASE("encode source device and guid when set", "[push_encode]") {
  auto push = simple_new_push(ToDevice{ .device = DeviceId("d2") }, NotePush{ .title = "t", .body = "b" });
  push.source_device = DeviceId("d1");
  push.guid = Guid("993aaa48567d91068e96c75a74644159");
  const auto entries = json_entries(encode_new_push(push));
  REQUIRE(entries.at("source_device_iden") == "d1");
  REQUIRE(entries.at("guid") == "993aaa48567d91068e96c75a74644159");
  REQUIRE(entries.at("device_iden") == "d2");
}

TEST_CASE("encoded strings are escaped", "[push_encode]") {
  const auto push = simple_new_push(ToAll{}, NotePush{ .title = "\"quoted\"", .body = "line one\nline two\t\\" });
  const auto json = encode_new_push(push);
  REQUIRE(json.find('\n') == string::npos);
  const auto entries = json_entries(json);
  REQUIRE(entries.at("title") == "\"quoted\"");
  REQUIRE(entries.at("body") == "line one\nline two\t\\");
}

TEST_CASE("new pushes compare by value", "[push_encode]") {
  const auto a = simple_new_push(ToDevice{ .device = DeviceId("d1") }, NotePush{ .title = nullopt, .body = "hi" });
  auto b = simple_new_push(ToDevice{ .device = DeviceId("d1") }, NotePush{ .title = nullopt, .body = "hi" });
  REQUIRE(a == b);
  b.target = ToDevice{ .device = DeviceId("d2") };
  REQUIRE(a != b);
  REQUIRE(simple_new_push(ToAll{}, sample_file()) == simple_new_push(ToAll{}, sample_file()));
}
