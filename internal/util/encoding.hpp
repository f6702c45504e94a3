#pragma once

#include <string>
#include <string_view>

namespace flowstore::util {

/*
  Deciding whether a byte string can travel as JSON text.
*/

// Strict UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
bool IsValidUtf8(std::string_view bytes);

} // namespace flowstore::util
