/**
 * @file test_ordered_map.cpp
 * @brief Tests for ordered_map.hpp - insertion-ordered hash map.
 */

#include "tini/ordered_map.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using StrMap = tini::OrderedMap<std::string, std::string>;
using IntMap = tini::OrderedMap<std::string, int>;

namespace {

std::vector<std::string> KeysOf(const IntMap& m) {
  std::vector<std::string> keys;
  for (const auto& k : m.Keys()) keys.push_back(k);
  return keys;
}

std::vector<std::pair<std::string, int>> EntriesOf(const IntMap& m) {
  std::vector<std::pair<std::string, int>> out;
  for (const auto& kv : m) out.emplace_back(kv.first, kv.second);
  return out;
}

}  // namespace

// ============================================================================
// Basic operations
// ============================================================================

TEST_CASE("OrderedMap starts empty", "[ordered_map]") {
  IntMap m;
  REQUIRE(m.Empty());
  REQUIRE(m.Size() == 0);
  REQUIRE(m.begin() == m.end());
  REQUIRE(m.Get("x") == nullptr);
  REQUIRE_FALSE(m.Contains("x"));
}

TEST_CASE("OrderedMap Insert new key returns empty", "[ordered_map]") {
  IntMap m;
  auto prev = m.Insert("a", 1);
  REQUIRE_FALSE(prev.has_value());
  REQUIRE(m.Size() == 1);
  REQUIRE(m.Contains("a"));
  REQUIRE(*m.Get("a") == 1);
}

TEST_CASE("OrderedMap Insert existing key returns previous value", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  auto prev = m.Insert("a", 2);
  REQUIRE(prev.has_value());
  REQUIRE(prev.value() == 1);
  REQUIRE(*m.Get("a") == 2);
  REQUIRE(m.Size() == 1);
}

TEST_CASE("OrderedMap Get mutable pointer edits in place", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  int* v = m.Get("a");
  REQUIRE(v != nullptr);
  *v = 42;
  REQUIRE(*m.Get("a") == 42);

  const IntMap& cm = m;
  REQUIRE(*cm.Get("a") == 42);
  REQUIRE(cm.Get("missing") == nullptr);
}

// ============================================================================
// Ordering
// ============================================================================

TEST_CASE("OrderedMap iterates in insertion order, not key order", "[ordered_map]") {
  IntMap m;
  m.Insert("c", 1);
  m.Insert("b", 2);
  m.Insert("a", 3);

  REQUIRE(KeysOf(m) == std::vector<std::string>{"c", "b", "a"});
  REQUIRE(EntriesOf(m) ==
          std::vector<std::pair<std::string, int>>{{"c", 1}, {"b", 2}, {"a", 3}});
}

TEST_CASE("OrderedMap overwrite keeps original position", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);
  m.Insert("a", 10);

  REQUIRE(EntriesOf(m) ==
          std::vector<std::pair<std::string, int>>{{"a", 10}, {"b", 2}, {"c", 3}});
}

TEST_CASE("OrderedMap Remove keeps remaining order", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);
  m.Insert("d", 4);

  auto removed = m.Remove("b");
  REQUIRE(removed.has_value());
  REQUIRE(removed.value() == 2);
  REQUIRE(m.Size() == 3);
  REQUIRE_FALSE(m.Contains("b"));
  REQUIRE(m.Get("b") == nullptr);
  REQUIRE(KeysOf(m) == std::vector<std::string>{"a", "c", "d"});
}

TEST_CASE("OrderedMap Remove missing key returns empty", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  REQUIRE_FALSE(m.Remove("zzz").has_value());
  REQUIRE(m.Size() == 1);
}

TEST_CASE("OrderedMap remove then reinsert moves key to the end", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);

  m.Remove("a");
  m.Insert("a", 100);

  REQUIRE(EntriesOf(m) ==
          std::vector<std::pair<std::string, int>>{{"b", 2}, {"c", 3}, {"a", 100}});
}

TEST_CASE("OrderedMap removing every key leaves an empty map", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Remove("a");
  m.Remove("b");
  REQUIRE(m.Empty());
  REQUIRE(m.begin() == m.end());
  REQUIRE(m.SlotCount() == 0);
}

TEST_CASE("OrderedMap trailing removal does not leave tombstones", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);
  m.Remove("c");
  REQUIRE(m.SlotCount() == 2);
  m.Remove("a");
  REQUIRE(m.SlotCount() == 2);  // head tombstone stays until compaction
  REQUIRE(KeysOf(m) == std::vector<std::string>{"b"});
}

TEST_CASE("OrderedMap compaction preserves order and lookups", "[ordered_map]") {
  IntMap m;
  const int n = static_cast<int>(IntMap::kCompactMin) * 4;
  for (int i = 0; i < n; ++i) m.Insert("k" + std::to_string(i), i);

  // drop every key except multiples of 5, front to back
  for (int i = 0; i < n; ++i) {
    if (i % 5 != 0) m.Remove("k" + std::to_string(i));
  }

  REQUIRE(m.Size() == static_cast<size_t>((n + 4) / 5));
  REQUIRE(m.SlotCount() < static_cast<size_t>(n));

  int expected = 0;
  for (const auto& kv : m) {
    REQUIRE(kv.first == "k" + std::to_string(expected));
    REQUIRE(kv.second == expected);
    REQUIRE(*m.Get(kv.first) == expected);
    expected += 5;
  }
  REQUIRE(expected >= n);

  m.Insert("k1", 1);
  REQUIRE(KeysOf(m).back() == "k1");
}

TEST_CASE("OrderedMap mixed insert/remove sequence follows most recent insertion",
          "[ordered_map]") {
  IntMap m;
  m.Insert("x", 1);
  m.Insert("y", 2);
  m.Insert("z", 3);
  m.Remove("y");
  m.Insert("x", 4);   // update in place
  m.Insert("y", 5);   // re-added at the end
  m.Remove("z");
  m.Insert("w", 6);

  REQUIRE(EntriesOf(m) ==
          std::vector<std::pair<std::string, int>>{{"x", 4}, {"y", 5}, {"w", 6}});
}

// ============================================================================
// GetOrInsertWith
// ============================================================================

TEST_CASE("OrderedMap GetOrInsertWith creates once", "[ordered_map]") {
  IntMap m;
  int calls = 0;
  auto make = [&calls]() {
    ++calls;
    return 7;
  };

  int& v = m.GetOrInsertWith("a", make);
  REQUIRE(v == 7);
  REQUIRE(calls == 1);
  v = 8;

  int& again = m.GetOrInsertWith("a", make);
  REQUIRE(again == 8);
  REQUIRE(calls == 1);
  REQUIRE(m.Size() == 1);
}

TEST_CASE("OrderedMap GetOrInsertWith appends at the end", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.GetOrInsertWith("b", []() { return 2; });
  REQUIRE(KeysOf(m) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("OrderedMap nested maps", "[ordered_map]") {
  tini::OrderedMap<std::string, StrMap> doc;
  doc.GetOrInsertWith("one", []() { return StrMap(); }).Insert("a", "1");
  doc.GetOrInsertWith("two", []() { return StrMap(); }).Insert("b", "2");
  doc.GetOrInsertWith("one", []() { return StrMap(); }).Insert("c", "3");

  REQUIRE(doc.Size() == 2);
  const StrMap* one = doc.Get("one");
  REQUIRE(one != nullptr);
  REQUIRE(one->Size() == 2);
  REQUIRE(*one->Get("a") == "1");
  REQUIRE(*one->Get("c") == "3");
}

// ============================================================================
// Iteration
// ============================================================================

TEST_CASE("OrderedMap mutable iteration edits values", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);

  for (auto& kv : m) kv.second += 1;

  REQUIRE(*m.Get("a") == 2);
  REQUIRE(*m.Get("b") == 3);
  REQUIRE(*m.Get("c") == 4);
}

TEST_CASE("OrderedMap each begin() is a fresh traversal", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);

  auto it = m.begin();
  ++it;
  ++it;
  REQUIRE(it == m.end());
  REQUIRE(m.begin()->first == "a");
}

TEST_CASE("OrderedMap traversal skips tombstones", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Insert("c", 3);
  m.Remove("a");
  m.Remove("b");

  auto it = m.begin();
  REQUIRE(it->first == "c");
  ++it;
  REQUIRE(it == m.end());
}

TEST_CASE("OrderedMap iterator converts to const_iterator", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  IntMap::const_iterator cit = m.begin();
  REQUIRE(cit->second == 1);
}

TEST_CASE("OrderedMap cbegin/cend walk in insertion order", "[ordered_map]") {
  IntMap m{{"b", 2}, {"a", 1}};
  std::vector<std::string> keys;
  for (auto it = m.cbegin(); it != m.cend(); ++it) keys.push_back(it->first);
  REQUIRE(keys == std::vector<std::string>{"b", "a"});
}

// ============================================================================
// Misc
// ============================================================================

TEST_CASE("OrderedMap Clear", "[ordered_map]") {
  IntMap m;
  m.Insert("a", 1);
  m.Insert("b", 2);
  m.Clear();
  REQUIRE(m.Empty());
  REQUIRE_FALSE(m.Contains("a"));
  m.Insert("b", 3);
  REQUIRE(KeysOf(m) == std::vector<std::string>{"b"});
}

TEST_CASE("OrderedMap initializer list", "[ordered_map]") {
  IntMap m{{"z", 26}, {"a", 1}, {"z", 0}};
  REQUIRE(m.Size() == 2);
  REQUIRE(EntriesOf(m) ==
          std::vector<std::pair<std::string, int>>{{"z", 0}, {"a", 1}});
}

TEST_CASE("OrderedMap equality is order-sensitive", "[ordered_map]") {
  IntMap a{{"x", 1}, {"y", 2}};
  IntMap b{{"x", 1}, {"y", 2}};
  IntMap c{{"y", 2}, {"x", 1}};

  REQUIRE(a == b);
  REQUIRE(a != c);

  b.Insert("y", 3);
  REQUIRE(a != b);
}

TEST_CASE("OrderedMap copy is independent", "[ordered_map]") {
  IntMap a{{"x", 1}, {"y", 2}};
  IntMap b = a;
  b.Remove("x");
  b.Insert("x", 5);

  REQUIRE(KeysOf(a) == std::vector<std::string>{"x", "y"});
  REQUIRE(KeysOf(b) == std::vector<std::string>{"y", "x"});
  REQUIRE(*a.Get("x") == 1);
}

TEST_CASE("OrderedMap move leaves source empty and usable", "[ordered_map]") {
  IntMap a{{"x", 1}};
  IntMap b = std::move(a);
  REQUIRE(*b.Get("x") == 1);
  REQUIRE(a.Empty());
  REQUIRE(a.begin() == a.end());
  a.Insert("q", 2);
  REQUIRE(a.Size() == 1);
}

TEST_CASE("OrderedMap copy drops tombstones", "[ordered_map]") {
  IntMap a{{"x", 1}, {"y", 2}, {"z", 3}};
  a.Remove("x");
  REQUIRE(a.SlotCount() == 3);

  IntMap b(a);
  REQUIRE(b.SlotCount() == 2);
  REQUIRE(b == a);
}

// ============================================================================
// Storage
// ============================================================================

namespace {

struct CopyCounter {
  static int copies;

  CopyCounter() = default;
  CopyCounter(const CopyCounter&) { ++copies; }
  CopyCounter(CopyCounter&&) noexcept {}
  CopyCounter& operator=(const CopyCounter&) {
    ++copies;
    return *this;
  }
  CopyCounter& operator=(CopyCounter&&) noexcept { return *this; }
};

int CopyCounter::copies = 0;

}  // namespace

TEST_CASE("OrderedMap growth never copies values", "[ordered_map][storage]") {
  tini::OrderedMap<std::string, CopyCounter> m;
  CopyCounter::copies = 0;
  for (int i = 0; i < 1024; ++i) m.Insert("k" + std::to_string(i), CopyCounter());
  REQUIRE(CopyCounter::copies == 0);

  // compaction moves nodes, not values
  for (int i = 0; i < 1000; ++i) m.Remove("k" + std::to_string(i));
  REQUIRE(m.Size() == 24);
  REQUIRE(CopyCounter::copies == 0);
}

TEST_CASE("OrderedMap holds move-only values", "[ordered_map][storage]") {
  tini::OrderedMap<std::string, std::unique_ptr<int>> m;
  m.Insert("a", std::make_unique<int>(1));
  m.GetOrInsertWith("b", []() { return std::make_unique<int>(2); });

  REQUIRE(**m.Get("a") == 1);
  REQUIRE(**m.Get("b") == 2);

  auto old = m.Insert("a", std::make_unique<int>(10));
  REQUIRE(old.has_value());
  REQUIRE(**old == 1);

  auto removed = m.Remove("b");
  REQUIRE(removed.has_value());
  REQUIRE(**removed == 2);
  REQUIRE(m.Size() == 1);
}

TEST_CASE("OrderedMap value pointers survive growth and compaction",
          "[ordered_map][storage]") {
  IntMap m;
  m.Insert("keep", 42);
  const int* keep = m.Get("keep");

  const int n = static_cast<int>(IntMap::kCompactMin) * 8;
  for (int i = 0; i < n; ++i) m.Insert("k" + std::to_string(i), i);
  for (int i = 0; i < n; ++i) m.Remove("k" + std::to_string(i));

  REQUIRE(m.Size() == 1);
  REQUIRE(m.Get("keep") == keep);
  REQUIRE(*keep == 42);
}
