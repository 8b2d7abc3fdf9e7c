/**
 * @file ini.hpp
 * @brief Order-preserving INI document: builder, typed accessors, codec.
 *
 * Structure:
 *   IniDocument = OrderedMap<section name, IniSection>
 *   IniSection  = OrderedMap<key, value>        (values are always text)
 *
 * Loading is fail-fast: FromBuffer / FromStream / FromFile stop at the
 * first malformed line and report it. ParseLenient keeps going, logs each
 * bad line and returns whatever parsed.
 *
 * Usage:
 * @code
 *   tini::Ini conf;
 *   conf.Section("floats").Item("consts", "3.1416, 2.7183")
 *       .Section("integers").Item("lost", "4,8,15,16,23,42");
 *   auto lost = conf.GetVec<int>("integers", "lost");   // {4, 8, ...}
 *
 *   auto loaded = tini::Ini::FromFile("app.ini");
 *   if (!loaded) { ... loaded.get_error() ... }
 * @endcode
 *
 * Canonical output: sections in insertion order, "[name]" then
 * "key = value" lines, one blank line between sections, no trailing
 * newline. Comments and blank lines from the input are not kept.
 */

#ifndef TINI_INI_HPP_
#define TINI_INI_HPP_

#include "tini/convert.hpp"
#include "tini/log.hpp"
#include "tini/ordered_map.hpp"
#include "tini/parser.hpp"
#include "tini/platform.hpp"
#include "tini/vocabulary.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

/// Separator GetVec splits on when none is given.
#ifndef TINI_VEC_SEP
#define TINI_VEC_SEP ","
#endif

/// Separator ItemVec joins with when none is given.
#ifndef TINI_VEC_JOIN_SEP
#define TINI_VEC_JOIN_SEP ", "
#endif

namespace tini {

using IniSection = OrderedMap<std::string, std::string>;
using IniDocument = OrderedMap<std::string, IniSection>;

class Ini {
 public:
  using iterator = IniDocument::iterator;
  using const_iterator = IniDocument::const_iterator;

  Ini() = default;

  // --------------------------------------------------------------------------
  // Loading
  // --------------------------------------------------------------------------

  /** Parses @p text, stopping at the first malformed line. */
  static expected<Ini, IniError> FromBuffer(const std::string& text) {
    Ini ini;
    ParseError failure;
    bool failed = false;
    ini.Decode(text, [&failure, &failed](ParseError&& err) {
      failure = std::move(err);
      failed = true;
      return false;
    });
    if (failed) {
      TINI_LOG_WARN("Ini", "line %u: %s", failure.line,
                    failure.message.c_str());
      return expected<Ini, IniError>::error(
          IniError::Parse(failure.line, std::move(failure.message)));
    }
    return expected<Ini, IniError>::success(std::move(ini));
  }

  /** Reads @p is to the end, then parses as FromBuffer does. */
  static expected<Ini, IniError> FromStream(std::istream& is) {
    if (!is) {
      int err = errno;
      TINI_LOG_ERROR("Ini", "stream not readable: %s", std::strerror(err));
      return expected<Ini, IniError>::error(
          IniError::Io(IniErrorCode::kReadFailed, err));
    }
    std::string text((std::istreambuf_iterator<char>(is)),
                     std::istreambuf_iterator<char>());
    if (is.bad()) {
      int err = errno;
      TINI_LOG_ERROR("Ini", "stream read failed: %s", std::strerror(err));
      return expected<Ini, IniError>::error(
          IniError::Io(IniErrorCode::kReadFailed, err));
    }
    return FromBuffer(text);
  }

  /** Opens, reads and parses the file at @p path. The file is closed on
   * every path out, parse failure included. */
  static expected<Ini, IniError> FromFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      int err = errno;
      TINI_LOG_ERROR("Ini", "cannot open '%s' for reading: %s", path.c_str(),
                     std::strerror(err));
      return expected<Ini, IniError>::error(
          IniError::Io(IniErrorCode::kOpenFailed, err));
    }
    auto result = FromStream(in);
    if (result.has_value()) {
      TINI_LOG_DEBUG("Ini", "loaded %zu section(s) from '%s'",
                     result.value().SectionCount(), path.c_str());
    }
    return result;
  }

  /**
   * @brief Parses every well-formed line of @p text, skipping bad ones.
   *
   * Each malformed line is logged at WARN and, when @p errors is non-null,
   * appended to it. Lines after a bad one are still applied.
   */
  static Ini ParseLenient(const std::string& text,
                          std::vector<ParseError>* errors = nullptr) {
    Ini ini;
    ini.Decode(text, [errors](ParseError&& err) {
      TINI_LOG_WARN("Parser", "line %u: error: %s", err.line,
                    err.message.c_str());
      if (errors != nullptr) errors->push_back(std::move(err));
      return true;
    });
    return ini;
  }

  // --------------------------------------------------------------------------
  // Builder
  // --------------------------------------------------------------------------

  /** Sets the section the following Item() calls write to. Does not create
   * the section by itself. The name is trimmed, as a header line would be;
   * a blank name selects the unnamed section. */
  Ini& Section(std::string name) {
    Trim(name);
    current_section_ = std::move(name);
    return *this;
  }

  /** Adds or overwrites @p key in the current section, creating the section
   * at the end of the document if needed. A blank key cannot be written
   * back and is dropped with a warning. */
  Ini& Item(std::string key, std::string value) {
    if (IsBlank(key)) {
      TINI_LOG_WARN("Ini", "dropping item with blank key in section '%s'",
                    current_section_.c_str());
      return *this;
    }
    IniSection& section = document_.GetOrInsertWith(
        current_section_, []() { return IniSection(); });
    section.Insert(std::move(key), std::move(value));
    return *this;
  }

  /** Adds @p values to the current section, joined by @p sep. */
  template <typename T>
  Ini& ItemVec(std::string key, const std::vector<T>& values,
               const std::string& sep = TINI_VEC_JOIN_SEP) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
      if (i != 0) joined += sep;
      joined += EncodeValue<T>(values[i]);
    }
    return Item(std::move(key), std::move(joined));
  }

  /**
   * @brief Replaces (or appends) section @p name with @p entries.
   *
   * @p entries is any range of pairs whose members have a Convert<>
   * Encode. An existing section keeps its position. @p name is trimmed
   * and also becomes the current section. Entries with a blank key are
   * dropped as in Item().
   */
  template <typename Container>
  void InsertSection(std::string name, const Container& entries) {
    Trim(name);
    IniSection section;
    for (const auto& kv : entries) {
      std::string key = EncodeValue(kv.first);
      if (IsBlank(key)) {
        TINI_LOG_WARN("Ini", "dropping item with blank key in section '%s'",
                      name.c_str());
        continue;
      }
      section.Insert(std::move(key), EncodeValue(kv.second));
    }
    current_section_ = std::move(name);
    document_.Insert(current_section_, std::move(section));
  }

  void InsertSection(
      std::string name,
      std::initializer_list<std::pair<std::string, std::string>> entries) {
    InsertSection<std::initializer_list<std::pair<std::string, std::string>>>(
        std::move(name), entries);
  }

  optional<IniSection> RemoveSection(const std::string& name) {
    return document_.Remove(name);
  }

  optional<std::string> RemoveItem(const std::string& section,
                                   const std::string& key) {
    IniSection* sec = document_.Get(section);
    if (sec == nullptr) return {};
    return sec->Remove(key);
  }

  /** Drops every section and resets the current section to the unnamed one. */
  void Clear() {
    document_.Clear();
    current_section_.clear();
  }

  // --------------------------------------------------------------------------
  // Access
  // --------------------------------------------------------------------------

  const IniSection* GetSection(const std::string& name) const {
    return document_.Get(name);
  }

  IniSection* GetSection(const std::string& name) { return document_.Get(name); }

  const std::string* GetRaw(const std::string& section,
                            const std::string& key) const {
    const IniSection* sec = document_.Get(section);
    return (sec != nullptr) ? sec->Get(key) : nullptr;
  }

  /**
   * @brief Typed value of @p key in @p section.
   *
   * Empty if the section or key is missing *or* the text does not convert;
   * the two cases are not distinguished.
   */
  template <typename T>
  optional<T> Get(const std::string& section, const std::string& key) const {
    const std::string* raw = GetRaw(section, key);
    if (raw == nullptr) return {};
    Convert<T> conv;
    T result;
    if (!conv.Decode(*raw, result)) return {};
    return result;
  }

  /**
   * @brief Splits the value on @p sep, trims and converts every piece.
   *
   * All or nothing: one piece that fails to convert empties the result.
   */
  template <typename T>
  optional<std::vector<T>> GetVec(const std::string& section,
                                  const std::string& key,
                                  const std::string& sep = TINI_VEC_SEP) const {
    const std::string* raw = GetRaw(section, key);
    if (raw == nullptr) return {};

    std::vector<T> out;
    Convert<T> conv;
    std::string::size_type start = 0;
    while (true) {
      std::string::size_type end =
          sep.empty() ? std::string::npos : raw->find(sep, start);
      std::string piece = raw->substr(
          start, end == std::string::npos ? std::string::npos : end - start);
      Trim(piece);
      T decoded;
      if (!conv.Decode(piece, decoded)) return {};
      out.push_back(std::move(decoded));
      if (end == std::string::npos) break;
      start = end + sep.size();
    }
    return out;
  }

  size_t SectionCount() const noexcept { return document_.Size(); }

  const IniDocument& Document() const noexcept { return document_; }

  /// Sections as (name, IniSection) pairs in insertion order. Values may be
  /// edited through the non-const iterators.
  iterator begin() { return document_.begin(); }
  iterator end() { return document_.end(); }
  const_iterator begin() const { return document_.begin(); }
  const_iterator end() const { return document_.end(); }

  // --------------------------------------------------------------------------
  // Writing
  // --------------------------------------------------------------------------

  /**
   * @brief Writes the canonical text form to @p os.
   *
   * The unnamed section has no header to write, so it always comes first;
   * anywhere else its entries would fold into the preceding section.
   */
  void Encode(std::ostream& os) const {
    bool first = true;
    auto begin_block = [&os, &first]() {
      if (!first) os << "\n\n";
      first = false;
    };

    const IniSection* unnamed = document_.Get(std::string());
    if (unnamed != nullptr && !unnamed->Empty()) {
      begin_block();
      WriteItems(os, *unnamed);
    }

    for (const auto& sec : document_) {
      if (sec.first.empty()) continue;
      begin_block();
      os << '[' << sec.first << ']';
      if (!sec.second.Empty()) {
        os << '\n';
        WriteItems(os, sec.second);
      }
    }
  }

  std::string ToBuffer() const {
    std::ostringstream ss;
    Encode(ss);
    return ss.str();
  }

  expected<void, IniError> ToStream(std::ostream& os) const {
    Encode(os);
    os.flush();
    if (!os) {
      int err = errno;
      TINI_LOG_ERROR("Ini", "stream write failed: %s", std::strerror(err));
      return expected<void, IniError>::error(
          IniError::Io(IniErrorCode::kWriteFailed, err));
    }
    return expected<void, IniError>::success();
  }

  /** Truncates (or creates) @p path and writes the canonical form to it. */
  expected<void, IniError> ToFile(const std::string& path) const {
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
      int err = errno;
      TINI_LOG_ERROR("Ini", "cannot open '%s' for writing: %s", path.c_str(),
                     std::strerror(err));
      return expected<void, IniError>::error(
          IniError::Io(IniErrorCode::kOpenFailed, err));
    }
    auto result = ToStream(out);
    if (result.has_value()) {
      TINI_LOG_DEBUG("Ini", "saved %zu section(s) to '%s'", SectionCount(),
                     path.c_str());
    }
    return result;
  }

  friend bool operator==(const Ini& a, const Ini& b) {
    return a.document_ == b.document_;
  }
  friend bool operator!=(const Ini& a, const Ini& b) { return !(a == b); }

 private:
  /**
   * Feeds every line of @p text through ParseLine. @p on_error receives
   * each malformed line and returns whether to keep going.
   */
  template <typename OnError>
  void Decode(const std::string& text, OnError&& on_error) {
    uint32_t line_no = 0;
    std::string::size_type start = 0;
    while (start <= text.size()) {
      std::string::size_type nl = text.find('\n', start);
      std::string::size_type len =
          (nl == std::string::npos) ? std::string::npos : nl - start;
      ParsedLine parsed = ParseLine(text.substr(start, len));

      switch (parsed.kind) {
        case LineKind::kSection:
          Section(std::move(parsed.name));
          break;
        case LineKind::kKeyValue:
          Item(std::move(parsed.name), std::move(parsed.value));
          break;
        case LineKind::kError: {
          ParseError err;
          err.line = line_no;
          err.message = parsed.error;
          if (!on_error(std::move(err))) return;
          break;
        }
        case LineKind::kBlank:
        case LineKind::kComment:
          break;
      }

      if (nl == std::string::npos) break;
      start = nl + 1;
      ++line_no;
    }
  }

  static bool IsBlank(const std::string& text) {
    return text.find_first_not_of(Whitespaces()) == std::string::npos;
  }

  static void WriteItems(std::ostream& os, const IniSection& section) {
    bool first = true;
    for (const auto& kv : section) {
      if (!first) os << '\n';
      first = false;
      os << EscapeKey(kv.first) << " = " << QuoteValue(kv.second);
    }
  }

  IniDocument document_;
  std::string current_section_;
};

/// Streams the canonical text form, same as Ini::Encode.
inline std::ostream& operator<<(std::ostream& os, const Ini& ini) {
  ini.Encode(os);
  return os;
}

}  // namespace tini

#endif  // TINI_INI_HPP_
