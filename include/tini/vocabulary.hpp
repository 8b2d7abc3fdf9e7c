/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: optional<T>, expected<V, E>, and tini error codes.
 *
 * Errors are values, never exceptions:
 *   - optional<T>       : "maybe a value" (lookups, removals, typed getters)
 *   - expected<V, E>    : value or error code (I/O and parsing entry points)
 *
 * Usage:
 * @code
 *   auto r = tini::Ini::FromFile("app.ini");
 *   if (!r) {
 *     const tini::IniError& e = r.get_error();
 *     ...
 *   }
 * @endcode
 */

#ifndef TINI_VOCABULARY_HPP_
#define TINI_VOCABULARY_HPP_

#include "tini/platform.hpp"

#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace tini {

// ============================================================================
// Error Codes
// ============================================================================

enum class IniErrorCode : uint8_t {
  kOpenFailed = 0,  ///< File could not be opened for reading or writing.
  kReadFailed,      ///< Stream reported failure while reading.
  kWriteFailed,     ///< Stream reported failure while writing or flushing.
  kParseError,      ///< A line of input is malformed.
};

inline const char* IniErrorCodeName(IniErrorCode code) noexcept {
  switch (code) {
    case IniErrorCode::kOpenFailed:
      return "open failed";
    case IniErrorCode::kReadFailed:
      return "read failed";
    case IniErrorCode::kWriteFailed:
      return "write failed";
    case IniErrorCode::kParseError:
      return "parse error";
  }
  return "unknown";
}

/// One malformed line: 0-based index plus a human-readable message.
struct ParseError {
  uint32_t line = 0;
  std::string message;
};

/**
 * @brief Error returned by the load/save entry points.
 *
 * I/O failures carry the platform errno in @c sys_errno; parse failures
 * carry the offending line in @c parse.
 */
struct IniError {
  IniErrorCode code = IniErrorCode::kParseError;
  int sys_errno = 0;
  ParseError parse;

  static IniError Io(IniErrorCode c, int err) {
    IniError e;
    e.code = c;
    e.sys_errno = err;
    return e;
  }

  static IniError Parse(uint32_t line, std::string message) {
    IniError e;
    e.code = IniErrorCode::kParseError;
    e.parse.line = line;
    e.parse.message = std::move(message);
    return e;
  }

  bool IsIo() const noexcept { return code != IniErrorCode::kParseError; }
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional value with inline storage.
 *
 * Default-constructed instances are empty; `return {};` yields an empty
 * optional and `return value;` an engaged one.
 */
template <typename T>
class optional {
 public:
  optional() noexcept : engaged_(false) {}

  optional(const T& v) : engaged_(false) { emplace(v); }
  optional(T&& v) : engaged_(false) { emplace(std::move(v)); }

  optional(const optional& other) : engaged_(false) {
    if (other.engaged_) emplace(*other.ptr());
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : engaged_(false) {
    if (other.engaged_) emplace(std::move(*other.ptr()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.engaged_) emplace(*other.ptr());
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.engaged_) emplace(std::move(*other.ptr()));
    }
    return *this;
  }

  ~optional() { reset(); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(&storage_)) T(std::forward<Args>(args)...);
    engaged_ = true;
    return *ptr();
  }

  void reset() noexcept {
    if (engaged_) {
      ptr()->~T();
      engaged_ = false;
    }
  }

  bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() & {
    TINI_ASSERT(engaged_);
    return *ptr();
  }
  const T& value() const& {
    TINI_ASSERT(engaged_);
    return *ptr();
  }
  T&& value() && {
    TINI_ASSERT(engaged_);
    return std::move(*ptr());
  }

  T& operator*() & { return value(); }
  const T& operator*() const& { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return engaged_ ? *ptr() : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  T* ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool engaged_;
};

template <typename T>
bool operator==(const optional<T>& lhs, const optional<T>& rhs) {
  if (lhs.has_value() != rhs.has_value()) return false;
  return !lhs.has_value() || *lhs == *rhs;
}

template <typename T>
bool operator!=(const optional<T>& lhs, const optional<T>& rhs) {
  return !(lhs == rhs);
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result. Construct through success() / error().
 * @tparam E Error type; must be default-constructible.
 */
template <typename V, typename E>
class expected {
  static_assert(std::is_default_constructible<E>::value,
                "expected<V, E> requires a default-constructible E");

 public:
  static expected success(const V& v) {
    expected r;
    r.value_.emplace(v);
    return r;
  }
  static expected success(V&& v) {
    expected r;
    r.value_.emplace(std::move(v));
    return r;
  }
  static expected error(E e) {
    expected r;
    r.error_ = std::move(e);
    return r;
  }

  bool has_value() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return value_.has_value(); }

  V& value() & { return value_.value(); }
  const V& value() const& { return value_.value(); }
  V&& value() && { return std::move(value_).value(); }

  const E& get_error() const noexcept {
    TINI_ASSERT(!value_.has_value());
    return error_;
  }

  template <typename U>
  V value_or(U&& fallback) const& {
    return value_.value_or(std::forward<U>(fallback));
  }

 private:
  expected() = default;

  optional<V> value_;
  E error_{};
};

template <typename E>
class expected<void, E> {
  static_assert(std::is_default_constructible<E>::value,
                "expected<void, E> requires a default-constructible E");

 public:
  static expected success() {
    expected r;
    r.ok_ = true;
    return r;
  }
  static expected error(E e) {
    expected r;
    r.error_ = std::move(e);
    return r;
  }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  const E& get_error() const noexcept {
    TINI_ASSERT(!ok_);
    return error_;
  }

 private:
  expected() = default;

  bool ok_ = false;
  E error_{};
};

}  // namespace tini

#endif  // TINI_VOCABULARY_HPP_
