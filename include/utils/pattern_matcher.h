#ifndef PATTERN_MATCHER_H
#define PATTERN_MATCHER_H

#include <string>
#include <vector>

// Wildcard selection of database and table names. '*' matches any run of
// characters (including none); every other character matches itself,
// case-insensitively. Patterns always match the whole name.
class PatternMatcher {
public:
  static bool matches(const std::string &name, const std::string &pattern);

  // Names matching at least one include pattern (every name when include is
  // empty) and no exclude pattern, in input order.
  static std::vector<std::string>
  filter(const std::vector<std::string> &names,
         const std::vector<std::string> &includePatterns,
         const std::vector<std::string> &excludePatterns);

  // "sbn*, ibs  w#*" -> {"sbn*", "ibs", "w#*"}
  static std::vector<std::string> parsePatternInput(const std::string &input);

private:
  static bool matchesAny(const std::string &name,
                         const std::vector<std::string> &patterns);
};

#endif
