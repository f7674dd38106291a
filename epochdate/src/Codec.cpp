#include "epochdate/Codec.hpp"

namespace epochdate {

static std::string_view trim(std::string_view s) {
  const auto a = s.find_first_not_of(" \t\r\n");
  const auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string_view::npos) return {};
  return s.substr(a, b - a + 1);
}

std::string marshal_text(Date d) {
  return to_string(d);
}

// canonical form only: what to_string() would write back
Error unmarshal_text(std::string_view text, Date& out) {
  Date d;
  if (Error e = parse(kRFC3339, text, d); e != Error::None) return e;
  if (to_string(d) != text) return Error::Parse;
  out = d;
  return Error::None;
}

std::string marshal_json(Date d) {
  return '"' + to_string(d) + '"';
}

Error unmarshal_json(std::string_view data, Date& out) {
  const std::string_view s = trim(data);
  if (s == "null") return Error::None;
  if (s.size() < 2 || s.front() != '"' || s.back() != '"') return Error::Parse;
  return unmarshal_text(s.substr(1, s.size() - 2), out);
}

} // namespace epochdate
