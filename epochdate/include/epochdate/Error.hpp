#pragma once
#include <string>

namespace epochdate {

enum class Error { None, OutOfRange, Parse };

inline std::string to_string(Error e) {
  switch (e) {
    case Error::None:       return "ok";
    case Error::OutOfRange: return "the given date is out of range";
    case Error::Parse:      return "text does not match the date layout";
  }
  return "unknown error";
}

} // namespace epochdate
