#include "utils/pattern_matcher.h"
#include "utils/string_utils.h"
#include <cctype>

bool PatternMatcher::matches(const std::string &name,
                             const std::string &pattern) {
  if (name.empty())
    return pattern == "*";

  // Greedy scan with backtracking to the last '*'; linear in practice and
  // never recursive, so long patterns of stars cannot blow the stack.
  size_t n = 0;
  size_t p = 0;
  size_t starPos = std::string::npos;
  size_t resumeAt = 0;

  while (n < name.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      starPos = p++;
      resumeAt = n;
    } else if (p < pattern.size() &&
               std::tolower(static_cast<unsigned char>(pattern[p])) ==
                   std::tolower(static_cast<unsigned char>(name[n]))) {
      ++p;
      ++n;
    } else if (starPos != std::string::npos) {
      p = starPos + 1;
      n = ++resumeAt;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*')
    ++p;
  return p == pattern.size();
}

bool PatternMatcher::matchesAny(const std::string &name,
                                const std::vector<std::string> &patterns) {
  for (const auto &pattern : patterns) {
    if (matches(name, pattern))
      return true;
  }
  return false;
}

std::vector<std::string>
PatternMatcher::filter(const std::vector<std::string> &names,
                       const std::vector<std::string> &includePatterns,
                       const std::vector<std::string> &excludePatterns) {
  std::vector<std::string> selected;
  for (const auto &name : names) {
    if (!includePatterns.empty() && !matchesAny(name, includePatterns))
      continue;
    if (matchesAny(name, excludePatterns))
      continue;
    selected.push_back(name);
  }
  return selected;
}

std::vector<std::string>
PatternMatcher::parsePatternInput(const std::string &input) {
  return StringUtils::split(input, ", \t");
}
