#ifndef XNAMESPACE
#  define XNAMESPACE()
#endif

#define XBEGIN(NAME) \
  template<> struct JsonSerialize<XNAMESPACE()NAME> { \
    static auto from_json_object(simdjson::ondemand::object) -> XNAMESPACE()NAME; \
    static auto from_json(simdjson::ondemand::value v) -> XNAMESPACE()NAME { \
      return from_json_object(json_object(v, #NAME)); \
    } \
    static auto to_json(const XNAMESPACE()NAME& v, std::string& out) -> void { \
      out += "{"; \
      bool comma = false;

#define X(FIELD, TYPE) \
      write_json_entry<TYPE>(#FIELD, v.FIELD, comma, out);

#define XEND \
      out += "}"; \
    } \
  };
