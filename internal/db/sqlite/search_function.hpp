#pragma once

#include <string>
#include <string_view>

#include "sqlite_db.hpp"

namespace flowstore::db::sqlite {

/*
  search(pattern, text, flags) -> 0/1

  sqlite has no general regex support, so filters that match patterns call
  back into RE2 through this scalar function. It has to be registered on
  every connection; it is not part of the stored schema.

  flags use the conventional regex flag bits. A NULL text never matches.
*/

inline constexpr int kSearchIgnoreCase = 2;
inline constexpr int kSearchMultiline  = 8;
inline constexpr int kSearchDotAll     = 16;

void RegisterSearchFunction(SqliteDB& db);

// The same matcher outside of sqlite. Throws std::invalid_argument for a
// pattern RE2 rejects.
bool Search(const std::string& pattern, std::string_view text, int flags);

// Empty when RE2 accepts the pattern, otherwise its complaint.
std::string PatternError(const std::string& pattern);

} // namespace flowstore::db::sqlite
