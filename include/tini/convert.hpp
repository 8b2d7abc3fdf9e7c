/**
 * @file convert.hpp
 * @brief Text <-> value conversion functors used by the typed accessors.
 *
 * Convert<T> is the "parsable from text" capability: Decode() returns false
 * when the text is not a valid T and leaves @p result unspecified; Encode()
 * renders the canonical text. Add a specialization in namespace tini to
 * make your own type usable with Ini::Get / GetVec / ItemVec:
 *
 * @code
 *   namespace tini {
 *   template <>
 *   struct Convert<Color> {
 *     bool Decode(const std::string& value, Color& result) { ... }
 *     void Encode(const Color& value, std::string& result) { ... }
 *   };
 *   }  // namespace tini
 * @endcode
 *
 * Numbers are decimal only, with an optional sign and no surrounding
 * blanks. int8_t / uint8_t (signed / unsigned char) are numbers; plain
 * char is a single character.
 */

#ifndef TINI_CONVERT_HPP_
#define TINI_CONVERT_HPP_

#include "tini/parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>

namespace tini {

namespace detail {

inline bool HasNumericEnvelope(const std::string& value) {
  return !value.empty() && !IsWhitespace(value.front()) &&
         !IsWhitespace(value.back());
}

template <typename T>
bool DecodeSigned(const std::string& value, T& result) {
  if (!HasNumericEnvelope(value)) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(value.c_str(), &end, 10);
  if (end != value.c_str() + value.size() || errno == ERANGE) return false;
  if (v < static_cast<long long>(std::numeric_limits<T>::min()) ||
      v > static_cast<long long>(std::numeric_limits<T>::max()))
    return false;
  result = static_cast<T>(v);
  return true;
}

template <typename T>
bool DecodeUnsigned(const std::string& value, T& result) {
  // strtoull silently wraps negative input
  if (!HasNumericEnvelope(value) || value[0] == '-') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(value.c_str(), &end, 10);
  if (end != value.c_str() + value.size() || errno == ERANGE) return false;
  if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max()))
    return false;
  result = static_cast<T>(v);
  return true;
}

template <typename T>
bool DecodeFloat(const std::string& value, T& result) {
  if (!HasNumericEnvelope(value)) return false;
  char* end = nullptr;
  long double v = std::strtold(value.c_str(), &end);
  if (end != value.c_str() + value.size()) return false;
  result = static_cast<T>(v);
  return true;
}

template <typename T>
void EncodeInteger(const T value, std::string& result) {
  result = std::to_string(value);
}

/// Shortest "%g" rendering that reads back to the same value.
template <typename T>
void EncodeFloat(const T value, std::string& result) {
  char buf[64];
  for (int precision = 1; precision <= std::numeric_limits<T>::max_digits10;
       ++precision) {
    (void)std::snprintf(buf, sizeof(buf), "%.*Lg", precision,
                        static_cast<long double>(value));
    if (static_cast<T>(std::strtold(buf, nullptr)) == value) break;
  }
  result = buf;
}

}  // namespace detail

/************************************************
 * Conversion Functors
 ************************************************/

template <typename T, typename Enable = void>
struct Convert {};

template <>
struct Convert<bool> {
  bool Decode(const std::string& value, bool& result) {
    std::string str(value);
    std::transform(str.begin(), str.end(), str.begin(), [](const char c) {
      return static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    });

    if (str == "true") {
      result = true;
      return true;
    }
    if (str == "false") {
      result = false;
      return true;
    }
    return false;
  }

  void Encode(const bool value, std::string& result) {
    result = value ? "true" : "false";
  }
};

template <>
struct Convert<char> {
  bool Decode(const std::string& value, char& result) {
    if (value.size() != 1) return false;
    result = value[0];
    return true;
  }

  void Encode(const char value, std::string& result) {
    result.assign(1, value);
  }
};

/// All signed integers, int8_t included.
template <typename T>
struct Convert<T, typename std::enable_if<std::is_integral<T>::value &&
                                          std::is_signed<T>::value &&
                                          !std::is_same<T, char>::value>::type> {
  bool Decode(const std::string& value, T& result) {
    return detail::DecodeSigned(value, result);
  }

  void Encode(const T value, std::string& result) {
    detail::EncodeInteger(static_cast<long long>(value), result);
  }
};

/// All unsigned integers, uint8_t included.
template <typename T>
struct Convert<T, typename std::enable_if<std::is_integral<T>::value &&
                                          std::is_unsigned<T>::value &&
                                          !std::is_same<T, bool>::value &&
                                          !std::is_same<T, char>::value>::type> {
  bool Decode(const std::string& value, T& result) {
    return detail::DecodeUnsigned(value, result);
  }

  void Encode(const T value, std::string& result) {
    detail::EncodeInteger(static_cast<unsigned long long>(value), result);
  }
};

template <typename T>
struct Convert<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
  bool Decode(const std::string& value, T& result) {
    return detail::DecodeFloat(value, result);
  }

  void Encode(const T value, std::string& result) {
    detail::EncodeFloat(value, result);
  }
};

template <>
struct Convert<std::string> {
  bool Decode(const std::string& value, std::string& result) {
    result = value;
    return true;
  }

  void Encode(const std::string& value, std::string& result) { result = value; }
};

template <>
struct Convert<const char*> {
  void Encode(const char* const& value, std::string& result) { result = value; }
};

template <>
struct Convert<char*> {
  void Encode(const char* const& value, std::string& result) { result = value; }
};

template <typename T>
std::string EncodeValue(const T& value) {
  Convert<T> conv;
  std::string text;
  conv.Encode(value, text);
  return text;
}

}  // namespace tini

#endif  // TINI_CONVERT_HPP_
