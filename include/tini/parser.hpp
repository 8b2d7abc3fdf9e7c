/**
 * @file parser.hpp
 * @brief Stateless single-line INI classifier plus the matching write-side
 *        escaping helpers.
 *
 * Line grammar (after stripping the whitespace envelope):
 *   ""                     -> kBlank
 *   ";..." | "#..."        -> kComment
 *   "[" name "]"           -> kSection   (name trimmed, must be non-blank)
 *   key "=" value          -> kKeyValue  (first unescaped '=' separates)
 *   anything else          -> kError
 *
 * Keys: '\x' stands for a literal 'x', so a key may contain '=' or start
 * with ';', '#' or '['. Values are taken literally after the separator;
 * a value wrapped in matching '"' or '\'' quotes keeps its interior
 * verbatim (leading/trailing blanks included).
 *
 * The "current section" is not tracked here; see Ini::Decode.
 */

#ifndef TINI_PARSER_HPP_
#define TINI_PARSER_HPP_

#include <cstdint>
#include <string>

namespace tini {

// ============================================================================
// Helper Functions
// ============================================================================

/** Returns a string of whitespace characters. */
constexpr const char* Whitespaces() {
  return " \t\n\r\f\v";
}

/** Trims a string in place.
 * @param str string to be trimmed in place */
inline void Trim(std::string& str) {
  // erase from the end first so the front erase moves fewer chars
  auto lastpos = str.find_last_not_of(Whitespaces());
  if (lastpos == std::string::npos) {
    str.clear();
    return;
  }

  str.erase(lastpos + 1);
  str.erase(0, str.find_first_not_of(Whitespaces()));
}

inline std::string TrimCopy(std::string str) {
  Trim(str);
  return str;
}

inline bool IsWhitespace(char c) {
  return c != '\0' && std::char_traits<char>::find(Whitespaces(), 6, c) != nullptr;
}

// ============================================================================
// Line Classification
// ============================================================================

constexpr char kFieldSep = '=';
constexpr char kEscapeChar = '\\';

constexpr const char* kErrInvalidSection = "invalid section header";
constexpr const char* kErrMissingSeparator = "missing separator";
constexpr const char* kErrEmptyKey = "empty key";

enum class LineKind : uint8_t {
  kBlank = 0,
  kComment,
  kSection,
  kKeyValue,
  kError,
};

/**
 * @brief Result of classifying one line.
 *
 * kSection uses @c name, kKeyValue uses @c name and @c value, kError uses
 * @c error (points at one of the kErr* literals).
 */
struct ParsedLine {
  LineKind kind = LineKind::kBlank;
  std::string name;
  std::string value;
  const char* error = nullptr;

  static ParsedLine Error(const char* message) {
    ParsedLine p;
    p.kind = LineKind::kError;
    p.error = message;
    return p;
  }
};

namespace detail {

inline bool IsCommentStart(char c) { return c == ';' || c == '#'; }

inline bool IsQuote(char c) { return c == '"' || c == '\''; }

/// Position of the first '=' not preceded by the escape character.
inline std::string::size_type FindSeparator(const std::string& line) {
  for (std::string::size_type i = 0; i < line.size(); ++i) {
    if (line[i] == kEscapeChar) {
      ++i;
    } else if (line[i] == kFieldSep) {
      return i;
    }
  }
  return std::string::npos;
}

/// '\x' -> 'x'. A dangling trailing escape is kept as-is.
inline std::string UnescapeKey(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::string::size_type i = 0; i < raw.size(); ++i) {
    if (raw[i] == kEscapeChar && i + 1 < raw.size()) ++i;
    out.push_back(raw[i]);
  }
  return out;
}

inline ParsedLine ParseSection(const std::string& line) {
  // line[0] == '['
  std::string::size_type close = line.rfind(']');
  if (close == std::string::npos || close == 0 || close != line.size() - 1)
    return ParsedLine::Error(kErrInvalidSection);

  std::string name = line.substr(1, close - 1);
  Trim(name);
  if (name.empty()) return ParsedLine::Error(kErrInvalidSection);

  ParsedLine p;
  p.kind = LineKind::kSection;
  p.name = std::move(name);
  return p;
}

inline ParsedLine ParseKeyValue(const std::string& line) {
  std::string::size_type sep = FindSeparator(line);
  if (sep == std::string::npos) return ParsedLine::Error(kErrMissingSeparator);

  std::string key = line.substr(0, sep);
  Trim(key);
  if (key.empty()) return ParsedLine::Error(kErrEmptyKey);

  std::string value = line.substr(sep + 1);
  Trim(value);
  if (value.size() >= 2 && IsQuote(value.front()) &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }

  ParsedLine p;
  p.kind = LineKind::kKeyValue;
  p.name = UnescapeKey(key);
  p.value = std::move(value);
  return p;
}

}  // namespace detail

/**
 * @brief Classify a single line of INI text.
 *
 * Never fails: malformed lines come back as LineKind::kError with a
 * message. The caller attaches the line index.
 */
inline ParsedLine ParseLine(const std::string& raw) {
  std::string line = TrimCopy(raw);
  if (line.empty()) return ParsedLine();
  if (detail::IsCommentStart(line[0])) {
    ParsedLine p;
    p.kind = LineKind::kComment;
    return p;
  }
  if (line[0] == '[') return detail::ParseSection(line);
  return detail::ParseKeyValue(line);
}

// ============================================================================
// Write-Side Escaping
// ============================================================================

/// Escape a key so ParseLine reads it back unchanged.
inline std::string EscapeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size() + 2);
  for (std::string::size_type i = 0; i < key.size(); ++i) {
    char c = key[i];
    bool leading = (i == 0) && (detail::IsCommentStart(c) || c == '[');
    if (c == kFieldSep || c == kEscapeChar || leading) out.push_back(kEscapeChar);
    out.push_back(c);
  }
  return out;
}

/// Wrap a value in double quotes when trimming or quote-stripping would
/// otherwise alter it on the way back in.
inline std::string QuoteValue(const std::string& value) {
  if (value.empty()) return value;
  bool needs_quotes = IsWhitespace(value.front()) || IsWhitespace(value.back()) ||
                      (value.size() >= 2 && detail::IsQuote(value.front()) &&
                       value.back() == value.front());
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  out.append(value);
  out.push_back('"');
  return out;
}

}  // namespace tini

#endif  // TINI_PARSER_HPP_
