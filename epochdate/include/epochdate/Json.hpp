#pragma once
#include <nlohmann/json.hpp>

#include "epochdate/Date.hpp"

namespace epochdate {

// nlohmann::json conversions, found by ADL:
//   nlohmann::json j = date;  date = j.get<Date>();  j.get_to(date);
// A null value leaves the date unchanged when decoded with get_to().
// Malformed or out of range text throws std::invalid_argument.
void to_json(nlohmann::json& j, const Date& d);
void from_json(const nlohmann::json& j, Date& d);

} // namespace epochdate
