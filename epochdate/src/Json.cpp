#include "epochdate/Json.hpp"
#include "epochdate/Codec.hpp"

#include <stdexcept>

namespace epochdate {

void to_json(nlohmann::json& j, const Date& d) {
  j = marshal_text(d);
}

void from_json(const nlohmann::json& j, Date& d) {
  if (j.is_null()) return;
  if (!j.is_string())
    throw std::invalid_argument("expected a date string, got " + j.dump());

  const auto& s = j.get_ref<const std::string&>();
  if (Error e = unmarshal_text(s, d); e != Error::None)
    throw std::invalid_argument(to_string(e) + ": " + s);
}

} // namespace epochdate
