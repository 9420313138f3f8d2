#include "test_common.h++"

TEST_CASE("required entries report the missing key", "[json]") {
  with_json_object(R"({"a": "x", "b": null})", [](simdjson::ondemand::object obj) {
    REQUIRE(read_json_entry<string>("a", obj) == "x");
    try {
      read_json_entry<string>("c", obj);
      FAIL("expected a decode error");
    } catch (const DecodeError& e) {
      REQUIRE(e.kind == DecodeErrorKind::MissingField);
      REQUIRE(e.field == "c");
      REQUIRE(string(e.what()) == R"(missing required key (key "c"))");
    }
    try {
      read_json_entry<string>("b", obj);
      FAIL("expected a decode error");
    } catch (const DecodeError& e) {
      REQUIRE(e.kind == DecodeErrorKind::MissingField);
      REQUIRE(e.field == "b");
    }
  });
}

TEST_CASE("optional entries may be absent or null", "[json]") {
  with_json_object(R"({"a": "x", "b": null, "n": 7})", [](simdjson::ondemand::object obj) {
    REQUIRE(read_json_entry<optional<string>>("a", obj) == "x");
    REQUIRE(read_json_entry<optional<string>>("b", obj) == nullopt);
    REQUIRE(read_json_entry<optional<string>>("c", obj) == nullopt);
    REQUIRE(read_json_entry<optional<int32_t>>("n", obj) == 7);
  });
}

TEST_CASE("present optional entries must still have the right type", "[json]") {
  with_json_object(R"({"a": 5})", [](simdjson::ondemand::object obj) {
    try {
      read_json_entry<optional<string>>("a", obj);
      FAIL("expected a decode error");
    } catch (const DecodeError& e) {
      REQUIRE(e.kind == DecodeErrorKind::InvalidValue);
      REQUIRE(e.field == "a");
    }
  });
}

TEST_CASE("integers are range checked", "[json]") {
  REQUIRE(from_json_string<int32_t>("484") == 484);
  REQUIRE(from_json_string<int64_t>("4294967296") == 4294967296);
  REQUIRE_THROWS_AS(from_json_string<int32_t>("4294967296"), DecodeError);
  REQUIRE_THROWS_AS(from_json_string<int32_t>("\"484\""), DecodeError);
}

TEST_CASE("write entries with explicit nulls", "[json]") {
  string out = "{";
  bool comma = false;
  write_json_entry("a", string("quote\"d"), comma, out);
  write_json_entry("b", optional<string>(), comma, out);
  write_json_entry("c", optional<int32_t>(3), comma, out);
  write_json_entry("d", vector<bool>{true, false}, comma, out);
  out += "}";
  REQUIRE(out == R"({"a":"quote\"d","b":null,"c":3,"d":[true,false]})");
}

TEST_CASE("decode flat wire records", "[json]") {
  const auto fields = with_json_object(
    R"({"sender_iden": "u1", "sender_name": "Someone", "unrelated": [1, 2, 3], "client_iden": null})",
    [](simdjson::ondemand::object obj) { return JsonSerialize<SenderFields>::from_json_object(obj); }
  );
  REQUIRE(fields.sender_iden == UserId("u1"));
  REQUIRE(fields.sender_name == Name("Someone"));
  REQUIRE(fields.client_iden == nullopt);
  REQUIRE(fields.channel_iden == nullopt);
  REQUIRE(fields.sender_email == nullopt);

  string out;
  JsonSerialize<ReceiverFields>::to_json({ .receiver_iden = UserId("u2"), .receiver_email = {}, .receiver_email_normalized = {} }, out);
  REQUIRE(out == R"({"receiver_iden":"u2","receiver_email":null,"receiver_email_normalized":null})");
}
