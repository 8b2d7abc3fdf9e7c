/**
 * @file ordered_map.hpp
 * @brief Insertion-ordered hash map with O(1) amortized lookup and removal.
 *
 * Layout:
 *   index_ : unordered_map<K, slot number>
 *   slots_ : vector<unique_ptr<pair<const K, V>>>   (insertion order,
 *            nullptr marks a removed entry)
 *
 *   Insert  "c"  "b"  "a"           Remove "b"            Insert "b"
 *   slots_ [c:1][b:2][a:3]    ->    [c:1][ -- ][a:3]  ->  [c:1][ -- ][a:3][b:4]
 *
 * Removal leaves a tombstone; iteration skips tombstones, so the relative
 * order of the remaining entries never changes. Re-inserting a removed key
 * appends it at the end. Once at least TINI_ORDERED_MAP_COMPACT_MIN slots
 * exist and more than half of them are dead, the slot vector is compacted
 * in order and the index rebuilt.
 *
 * Entries live in their own nodes, so growing or compacting slots_ only
 * moves pointers and never copies or moves a V.
 *
 * Iterator invalidation (same discipline as the standard containers):
 *   - Insert of a new key, GetOrInsertWith that creates, Remove, Clear and
 *     Reserve invalidate all iterators.
 *   - Pointers and references to a value stay valid until that key is
 *     removed or the map is cleared.
 *   - Insert of an existing key, Get, and writes through iterators or
 *     returned pointers invalidate nothing.
 * Structural mutation while a traversal is in progress is undefined.
 */

#ifndef TINI_ORDERED_MAP_HPP_
#define TINI_ORDERED_MAP_HPP_

#include "tini/platform.hpp"
#include "tini/vocabulary.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef TINI_ORDERED_MAP_COMPACT_MIN
#define TINI_ORDERED_MAP_COMPACT_MIN 32U
#endif

namespace tini {

template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class OrderedMap {
 public:
  using key_type = K;
  using mapped_type = V;
  using value_type = std::pair<const K, V>;
  using size_type = std::size_t;

 private:
  using Slot = std::unique_ptr<value_type>;
  using Index = std::unordered_map<K, size_type, Hash, KeyEqual>;

  // --------------------------------------------------------------------------
  // Iterators
  // --------------------------------------------------------------------------

  template <bool IsConst>
  class IteratorImpl {
    using SlotPtr = typename std::conditional<IsConst, const Slot*, Slot*>::type;

   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = OrderedMap::value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = typename std::conditional<IsConst, const value_type*,
                                              value_type*>::type;
    using reference = typename std::conditional<IsConst, const value_type&,
                                                value_type&>::type;

    IteratorImpl() = default;

    IteratorImpl(SlotPtr cur, SlotPtr end) : cur_(cur), end_(end) {
      SkipDead();
    }

    /// iterator -> const_iterator
    template <bool C = IsConst, typename = typename std::enable_if<C>::type>
    IteratorImpl(const IteratorImpl<false>& other)
        : cur_(other.cur_), end_(other.end_) {}

    reference operator*() const { return **cur_; }
    pointer operator->() const { return cur_->get(); }

    IteratorImpl& operator++() {
      ++cur_;
      SkipDead();
      return *this;
    }

    IteratorImpl operator++(int) {
      IteratorImpl tmp(*this);
      ++*this;
      return tmp;
    }

    friend bool operator==(const IteratorImpl& a, const IteratorImpl& b) {
      return a.cur_ == b.cur_;
    }
    friend bool operator!=(const IteratorImpl& a, const IteratorImpl& b) {
      return a.cur_ != b.cur_;
    }

   private:
    friend class IteratorImpl<true>;

    void SkipDead() {
      while (cur_ != end_ && *cur_ == nullptr) ++cur_;
    }

    SlotPtr cur_ = nullptr;
    SlotPtr end_ = nullptr;
  };

 public:
  using iterator = IteratorImpl<false>;
  using const_iterator = IteratorImpl<true>;

  /// Forward range over the keys, in insertion order.
  class KeyRange {
   public:
    class Iterator {
     public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = K;
      using difference_type = std::ptrdiff_t;
      using pointer = const K*;
      using reference = const K&;

      explicit Iterator(const_iterator it) : it_(it) {}

      const K& operator*() const { return it_->first; }
      const K* operator->() const { return &it_->first; }

      Iterator& operator++() {
        ++it_;
        return *this;
      }
      Iterator operator++(int) {
        Iterator tmp(*this);
        ++it_;
        return tmp;
      }

      friend bool operator==(const Iterator& a, const Iterator& b) {
        return a.it_ == b.it_;
      }
      friend bool operator!=(const Iterator& a, const Iterator& b) {
        return a.it_ != b.it_;
      }

     private:
      const_iterator it_;
    };

    explicit KeyRange(const OrderedMap& map) : map_(&map) {}

    Iterator begin() const { return Iterator(map_->begin()); }
    Iterator end() const { return Iterator(map_->end()); }

   private:
    const OrderedMap* map_;
  };

  static constexpr size_type kCompactMin = TINI_ORDERED_MAP_COMPACT_MIN;

  OrderedMap() = default;

  /// Deep copy; tombstones are dropped, order is kept.
  OrderedMap(const OrderedMap& other) {
    Reserve(other.live_);
    for (const auto& kv : other) Append(K(kv.first), V(kv.second));
  }

  OrderedMap& operator=(const OrderedMap& other) {
    if (this != &other) {
      OrderedMap tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  /// The moved-from map is left empty.
  OrderedMap(OrderedMap&& other) noexcept(
      std::is_nothrow_move_constructible<Index>::value)
      : slots_(std::move(other.slots_)),
        index_(std::move(other.index_)),
        live_(other.live_) {
    other.Clear();
  }

  OrderedMap& operator=(OrderedMap&& other) noexcept(
      std::is_nothrow_move_assignable<Index>::value) {
    if (this != &other) {
      slots_ = std::move(other.slots_);
      index_ = std::move(other.index_);
      live_ = other.live_;
      other.Clear();
    }
    return *this;
  }

  OrderedMap(std::initializer_list<std::pair<K, V>> init) {
    Reserve(init.size());
    for (const auto& kv : init) Insert(kv.first, kv.second);
  }

  // --------------------------------------------------------------------------
  // Lookup
  // --------------------------------------------------------------------------

  /// @return Pointer to the value for @p key, or nullptr if absent.
  const V* Get(const K& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &LiveSlot(it->second).second;
  }

  V* Get(const K& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &LiveSlot(it->second).second;
  }

  bool Contains(const K& key) const { return index_.find(key) != index_.end(); }

  // --------------------------------------------------------------------------
  // Mutation
  // --------------------------------------------------------------------------

  /**
   * @brief Insert or overwrite.
   *
   * An existing key keeps its position and its previous value is returned.
   * A new key is appended at the end and an empty optional is returned.
   */
  optional<V> Insert(K key, V value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      V& slot_value = LiveSlot(it->second).second;
      optional<V> previous(std::move(slot_value));
      slot_value = std::move(value);
      return previous;
    }
    Append(std::move(key), std::move(value));
    return {};
  }

  /**
   * @brief Value for @p key, appending @p make() first if the key is absent.
   *
   * One hash lookup on the hit path. @p make is only invoked on a miss.
   */
  template <typename Fn>
  V& GetOrInsertWith(K key, Fn&& make) {
    auto it = index_.find(key);
    if (it != index_.end()) return LiveSlot(it->second).second;
    return Append(std::move(key), std::forward<Fn>(make)());
  }

  /**
   * @brief Remove @p key, returning its value.
   *
   * Remaining entries keep their relative order. A later Insert of the same
   * key appends it at the end.
   */
  optional<V> Remove(const K& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return {};

    size_type pos = it->second;
    index_.erase(it);

    Slot& slot = slots_[pos];
    optional<V> removed(std::move(slot->second));
    slot.reset();
    --live_;

    // Trailing tombstones carry no ordering information.
    while (!slots_.empty() && slots_.back() == nullptr) slots_.pop_back();
    MaybeCompact();
    return removed;
  }

  void Clear() noexcept {
    slots_.clear();
    index_.clear();
    live_ = 0;
  }

  void Reserve(size_type n) {
    slots_.reserve(n);
    index_.reserve(n);
  }

  // --------------------------------------------------------------------------
  // Capacity
  // --------------------------------------------------------------------------

  size_type Size() const noexcept { return live_; }
  bool Empty() const noexcept { return live_ == 0; }

  /// Slots in use including tombstones.
  size_type SlotCount() const noexcept { return slots_.size(); }

  // --------------------------------------------------------------------------
  // Iteration
  // --------------------------------------------------------------------------

  iterator begin() { return iterator(SlotBegin(), SlotEnd()); }
  iterator end() { return iterator(SlotEnd(), SlotEnd()); }
  const_iterator begin() const { return const_iterator(SlotBegin(), SlotEnd()); }
  const_iterator end() const { return const_iterator(SlotEnd(), SlotEnd()); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  KeyRange Keys() const { return KeyRange(*this); }

  /// Equal when both hold the same entries in the same order.
  friend bool operator==(const OrderedMap& a, const OrderedMap& b) {
    if (a.Size() != b.Size()) return false;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
      if (!(KeyEqual()(ia->first, ib->first)) || !(ia->second == ib->second))
        return false;
    }
    return true;
  }

  friend bool operator!=(const OrderedMap& a, const OrderedMap& b) {
    return !(a == b);
  }

 private:
  V& Append(K&& key, V&& value) {
    slots_.push_back(
        std::make_unique<value_type>(std::move(key), std::move(value)));
    value_type& entry = *slots_.back();
    index_.emplace(entry.first, slots_.size() - 1);
    ++live_;
    return entry.second;
  }

  value_type& LiveSlot(size_type pos) {
    TINI_ASSERT(pos < slots_.size() && slots_[pos] != nullptr);
    return *slots_[pos];
  }

  const value_type& LiveSlot(size_type pos) const {
    TINI_ASSERT(pos < slots_.size() && slots_[pos] != nullptr);
    return *slots_[pos];
  }

  void MaybeCompact() {
    size_type dead = slots_.size() - live_;
    if (slots_.size() >= kCompactMin && dead * 2 > slots_.size()) Compact();
  }

  void Compact() {
    std::vector<Slot> packed;
    packed.reserve(live_);
    for (Slot& slot : slots_) {
      if (slot == nullptr) continue;
      auto it = index_.find(slot->first);
      TINI_ASSERT(it != index_.end());
      it->second = packed.size();
      packed.emplace_back(std::move(slot));
    }
    TINI_ASSERT(packed.size() == live_);
    slots_.swap(packed);
  }

  Slot* SlotBegin() noexcept { return slots_.data(); }
  Slot* SlotEnd() noexcept { return slots_.data() + slots_.size(); }
  const Slot* SlotBegin() const noexcept { return slots_.data(); }
  const Slot* SlotEnd() const noexcept { return slots_.data() + slots_.size(); }

  std::vector<Slot> slots_;
  Index index_;
  size_type live_ = 0;
};

}  // namespace tini

#endif  // TINI_ORDERED_MAP_HPP_
