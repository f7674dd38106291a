#pragma once
#include <string>
#include <string_view>

#include "epochdate/Date.hpp"

namespace epochdate {

// Bare ISO text: 1970-01-02
std::string marshal_text(Date d);
Error unmarshal_text(std::string_view text, Date& out);

// JSON scalar: "1970-01-02". Decoding null leaves `out` unchanged.
std::string marshal_json(Date d);
Error unmarshal_json(std::string_view data, Date& out);

} // namespace epochdate
