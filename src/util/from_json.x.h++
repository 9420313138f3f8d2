#ifndef XNAMESPACE
#  define XNAMESPACE()
#endif

#define XBEGIN(NAME) \
  inline auto JsonSerialize<XNAMESPACE()NAME>::from_json_object(simdjson::ondemand::object obj) -> XNAMESPACE()NAME { \
    return {

#define X(FIELD, TYPE) .FIELD = read_json_entry<TYPE>(#FIELD, obj),

#define XEND \
    }; \
  }
