#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
           return std::tolower(static_cast<unsigned char>(c1)) ==
                  std::tolower(static_cast<unsigned char>(c2));
         });
}

// Splits on any of the delimiter characters, trimming each piece and
// dropping empty ones.
inline std::vector<std::string> split(std::string_view str,
                                      std::string_view delimiters) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find_first_of(delimiters, start);
    if (end == std::string_view::npos)
      end = str.size();
    std::string piece = trim(str.substr(start, end - start));
    if (!piece.empty())
      parts.push_back(std::move(piece));
    start = end + 1;
  }
  return parts;
}

// Table and database names as MSSQL and ASE accept them unquoted. '#' is
// allowed because ASE work tables ("w#tmp") show up in real catalogs.
inline bool isValidDatabaseIdentifier(std::string_view identifier) {
  if (identifier.empty() || identifier.length() > 128) {
    return false;
  }

  for (char c : identifier) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') || c == '_' || c == '$' || c == '#')) {
      return false;
    }
  }

  if (identifier[0] >= '0' && identifier[0] <= '9') {
    return false;
  }

  return true;
}

// "schema.table" or "table".
inline bool isValidQualifiedIdentifier(std::string_view identifier) {
  size_t dot = identifier.find('.');
  if (dot == std::string_view::npos)
    return isValidDatabaseIdentifier(identifier);
  return isValidDatabaseIdentifier(identifier.substr(0, dot)) &&
         isValidDatabaseIdentifier(identifier.substr(dot + 1));
}

// Value for a single-quoted SQL string literal.
inline std::string escapeSQL(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (char c : value) {
    if (c == '\'')
      escaped += "''";
    else
      escaped += c;
  }
  return escaped;
}

inline std::string formatDuration(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int64_t total = static_cast<int64_t>(seconds + 0.5);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                static_cast<long long>(total / 3600),
                static_cast<long long>((total % 3600) / 60),
                static_cast<long long>(total % 60));
  return buffer;
}

} // namespace StringUtils

#endif
