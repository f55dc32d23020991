/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

// Hash-indexed heap: a mapping from unique keys to priorities with
// O(1) access to the extremal priority, O(log n) insertion, removal
// and priority change for arbitrary keys, and iteration in insertion
// order.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ipq/errors.hpp"
#include "ipq/ordering.hpp"

namespace ipq {

  template <typename K,
            std::totally_ordered P,
            ordering Order = min_max_order,
            typename Hash = std::hash<K>,
            typename KeyEqual = std::equal_to<K>>
  class indexed_priority_queue;

  template <typename T>
  struct is_indexed_priority_queue : std::false_type {};

  template <typename K, std::totally_ordered P, ordering Order,
            typename Hash, typename KeyEqual>
  struct is_indexed_priority_queue<
    indexed_priority_queue<K, P, Order, Hash, KeyEqual>> : std::true_type {};

  // A range of (key, priority) pairs. Associative containers qualify.
  template <typename R, typename K, typename P>
  concept pair_range = std::ranges::input_range<R>
    && requires(std::ranges::range_reference_t<R> e) {
      { std::get<0>(e) } -> std::convertible_to<K>;
      { std::get<1>(e) } -> std::convertible_to<P>;
    };

  // Anything that looks up priorities by key.
  template <typename M, typename K, typename P>
  concept mapping = requires(const M& m, const K& k) {
    { m.size() } -> std::convertible_to<size_t>;
    { m.find(k) == m.end() } -> std::convertible_to<bool>;
    { m.find(k)->second } -> std::convertible_to<const P&>;
  };

  template <typename K,
            std::totally_ordered P,
            ordering Order,
            typename Hash,
            typename KeyEqual>
  class indexed_priority_queue {
  public:
    using key_type = K;
    using priority_type = P;
    using item_type = std::pair<const K, P>;
    using value_type = item_type;
    using order_type = Order;
    using size_type = size_t;

  private:
    // One entry. [pos] is the entry's current slot in the heap array.
    struct node {
      item_type item;
      size_t pos;
    };

    using node_list = std::list<node>;
    using handle = typename node_list::iterator;
    using index_map = std::unordered_map<K, handle, Hash, KeyEqual>;

  public:
    // Walks entries in insertion order.
    class const_iterator {
    public:
      using iterator_category = std::bidirectional_iterator_tag;
      using value_type = item_type;
      using difference_type = std::ptrdiff_t;
      using pointer = const item_type*;
      using reference = const item_type&;

      const_iterator() = default;

      reference operator*() const { return this->_it->item; }
      pointer operator->() const { return &this->_it->item; }

      const_iterator& operator++() {
        ++this->_it;
        return *this;
      }

      const_iterator operator++(int) {
        const_iterator tmp = *this;
        ++this->_it;
        return tmp;
      }

      const_iterator& operator--() {
        --this->_it;
        return *this;
      }

      const_iterator operator--(int) {
        const_iterator tmp = *this;
        --this->_it;
        return tmp;
      }

      bool operator==(const const_iterator&) const = default;

    private:
      friend class indexed_priority_queue;

      explicit const_iterator(typename node_list::const_iterator it) : _it(it) {}

      typename node_list::const_iterator _it;
    };

    using iterator = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator = const_reverse_iterator;

    indexed_priority_queue() = default;

    indexed_priority_queue(std::initializer_list<std::pair<K, P>> pairs) {
      this->_build(pairs);
    }

    // Build from pairs or a mapping in O(n). A key seen more than once
    // keeps its first position and its last priority.
    template <pair_range<K, P> R>
      requires (!std::same_as<std::remove_cvref_t<R>, indexed_priority_queue>)
    explicit indexed_priority_queue(R&& pairs) {
      this->_build(pairs);
    }

    template <std::input_iterator It>
    indexed_priority_queue(It first, It last) {
      this->_build(std::ranges::subrange(first, last));
    }

    indexed_priority_queue(const indexed_priority_queue& other)
      : _nodes(other._nodes),
        _index(other._nodes.size(),
               other._index.hash_function(),
               other._index.key_eq()) {
      this->_heap.resize(this->_nodes.size());
      for (auto it = this->_nodes.begin(); it != this->_nodes.end(); ++it) {
        this->_heap[it->pos] = it;
        this->_index.emplace(it->item.first, it);
      }
    }

    // std::list keeps element iterators valid across moves.
    indexed_priority_queue(indexed_priority_queue&&) = default;
    indexed_priority_queue& operator=(indexed_priority_queue&&) = default;

    indexed_priority_queue& operator=(const indexed_priority_queue& other) {
      if (this != &other) {
        indexed_priority_queue tmp(other);
        this->swap(tmp);
      }
      return *this;
    }

    // Every key in [keys] with the same [priority].
    template <std::ranges::input_range R>
    static indexed_priority_queue from_keys(R&& keys, const P& priority) {
      indexed_priority_queue q;
      for (const auto& k : keys) {
        q._append_or_assign(k, priority);
      }
      q._heapify();
      return q;
    }

    void swap(indexed_priority_queue& other) noexcept {
      this->_nodes.swap(other._nodes);
      this->_heap.swap(other._heap);
      this->_index.swap(other._index);
    }

    indexed_priority_queue copy() const {
      return *this;
    }

    size_t size() const { return this->_heap.size(); }
    bool empty() const { return this->_heap.empty(); }

    bool contains(const K& k) const {
      return this->_index.find(k) != this->_index.end();
    }

    const_iterator find(const K& k) const {
      const auto found = this->_index.find(k);
      if (found == this->_index.end()) {
        return this->end();
      }
      return const_iterator(found->second);
    }

    const P& get(const K& k) const {
      const auto found = this->_index.find(k);
      if (found == this->_index.end()) {
        throw key_not_found("indexed_priority_queue::get: key not found");
      }
      return found->second->item.second;
    }

    P get_or(const K& k, const P& fallback) const {
      const auto found = this->_index.find(k);
      return found == this->_index.end() ? fallback : found->second->item.second;
    }

    // Associate [k] with [p]. An existing key keeps its place in
    // insertion order and is re-sifted in place; a new key is appended.
    // If hashing [k] throws, the queue is left unchanged.
    void set(const K& k, const P& p) {
      const auto found = this->_index.find(k);
      if (found != this->_index.end()) {
        const handle h = found->second;
        h->item.second = p;
        this->_restore(h->pos);
      } else {
        const handle h = this->_push_node(k, p);
        // A fresh leaf can only be out of order with its ancestors.
        this->_sift_up(h->pos);
      }
    }

    void erase(const K& k) {
      const auto found = this->_index.find(k);
      if (found == this->_index.end()) {
        throw key_not_found("indexed_priority_queue::erase: key not found");
      }
      this->_remove(found);
    }

    // Remove [k] and return its priority.
    P pop(const K& k) {
      const auto found = this->_index.find(k);
      if (found == this->_index.end()) {
        throw key_not_found("indexed_priority_queue::pop: key not found");
      }
      P p = found->second->item.second;
      this->_remove(found);
      return p;
    }

    P pop_or(const K& k, const P& fallback) {
      const auto found = this->_index.find(k);
      if (found == this->_index.end()) {
        return fallback;
      }
      P p = found->second->item.second;
      this->_remove(found);
      return p;
    }

    const item_type& peek_min() const requires (Order::tracks_min) {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::peek_min: queue is empty");
      }
      return this->_heap[this->_min_pos()]->item;
    }

    const item_type& peek_max() const requires (Order::tracks_max) {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::peek_max: queue is empty");
      }
      return this->_heap[this->_max_pos()]->item;
    }

    item_type peek_min_or(const item_type& fallback) const requires (Order::tracks_min) {
      return this->empty() ? fallback : this->_heap[this->_min_pos()]->item;
    }

    item_type peek_max_or(const item_type& fallback) const requires (Order::tracks_max) {
      return this->empty() ? fallback : this->_heap[this->_max_pos()]->item;
    }

    item_type pop_min() requires (Order::tracks_min) {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::pop_min: queue is empty");
      }
      return this->_pop_at(this->_min_pos());
    }

    item_type pop_max() requires (Order::tracks_max) {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::pop_max: queue is empty");
      }
      return this->_pop_at(this->_max_pos());
    }

    item_type pop_min_or(const item_type& fallback) requires (Order::tracks_min) {
      return this->empty() ? fallback : this->_pop_at(this->_min_pos());
    }

    item_type pop_max_or(const item_type& fallback) requires (Order::tracks_max) {
      return this->empty() ? fallback : this->_pop_at(this->_max_pos());
    }

    // Remove the item at the root: the minimum, or the maximum for a
    // max_order queue.
    item_type pop_item() {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::pop_item: queue is empty");
      }
      return this->_pop_at(0);
    }

    item_type pop_item_or(const item_type& fallback) {
      return this->empty() ? fallback : this->_pop_at(0);
    }

    // Remove the most recently inserted item.
    item_type pop_last() {
      if (this->empty()) {
        throw empty_queue("indexed_priority_queue::pop_last: queue is empty");
      }
      return this->_pop_at(std::prev(this->_nodes.end())->pos);
    }

    // Drop everything without touching the heap order.
    void clear() noexcept {
      this->_heap.clear();
      this->_index.clear();
      this->_nodes.clear();
    }

    template <pair_range<K, P> R>
    void update(const R& pairs) {
      for (const auto& e : pairs) {
        this->set(std::get<0>(e), std::get<1>(e));
      }
    }

    template <pair_range<K, P> R>
    indexed_priority_queue& operator|=(const R& pairs) {
      this->update(pairs);
      return *this;
    }

    // Entries of [a] followed by those of [b]; [b] wins on shared keys.
    template <pair_range<K, P> R>
    friend indexed_priority_queue operator|(const indexed_priority_queue& a, const R& b) {
      indexed_priority_queue res(a);
      res.update(b);
      return res;
    }

    template <pair_range<K, P> R>
      requires (!is_indexed_priority_queue<std::remove_cvref_t<R>>::value)
    friend indexed_priority_queue operator|(const R& a, const indexed_priority_queue& b) {
      indexed_priority_queue res(a);
      res.update(b);
      return res;
    }

    // Same (key, priority) pairs, in any order.
    template <mapping<K, P> M>
    friend bool operator==(const indexed_priority_queue& a, const M& b) {
      if (a.size() != static_cast<size_t>(b.size())) {
        return false;
      }
      for (const auto& [k, p] : a) {
        const auto it = b.find(k);
        if (it == b.end() || !(it->second == p)) {
          return false;
        }
      }
      return true;
    }

    const_iterator begin() const { return const_iterator(this->_nodes.cbegin()); }
    const_iterator end() const { return const_iterator(this->_nodes.cend()); }
    const_reverse_iterator rbegin() const { return const_reverse_iterator(this->end()); }
    const_reverse_iterator rend() const { return const_reverse_iterator(this->begin()); }

    // Keys in insertion order. Don't mutate the queue while walking.
    auto keys() const {
      return std::views::keys(std::ranges::subrange(this->begin(), this->end()));
    }

    auto reversed_keys() const {
      return this->keys() | std::views::reverse;
    }

    // Check that the list, heap array and index hold the same keys, that
    // heap positions and the index agree, and that the heap order holds.
    bool well_formed() const {
      const size_t n = this->_heap.size();
      if (this->_nodes.size() != n || this->_index.size() != n) {
        return false;
      }
      for (auto it = this->_nodes.cbegin(); it != this->_nodes.cend(); ++it) {
        if (it->pos >= n || typename node_list::const_iterator(this->_heap[it->pos]) != it) {
          return false;
        }
        const auto found = this->_index.find(it->item.first);
        if (found == this->_index.end() || found->second->pos != it->pos) {
          return false;
        }
      }
      for (size_t i = 1; i < n; ++i) {
        const size_t p = _parent(i);
        if (this->_before(i, p, Order::is_max_level(p))) {
          return false;
        }
        if (Order::interleaved && i > 2) {
          const size_t g = _parent(p);
          if (this->_before(i, g, Order::is_max_level(g))) {
            return false;
          }
        }
      }
      return true;
    }

  private:
    node_list _nodes;
    std::vector<handle> _heap;
    index_map _index;

    static constexpr size_t _parent(size_t i) { return (i - 1) / 2; }
    static constexpr size_t _left(size_t i) { return 2 * i + 1; }

    const P& _priority(size_t i) const {
      return this->_heap[i]->item.second;
    }

    // True when the element at [i] belongs above the one at [j] on a
    // level of the given kind.
    bool _before(size_t i, size_t j, bool max_level) const {
      return max_level
        ? this->_priority(j) < this->_priority(i)
        : this->_priority(i) < this->_priority(j);
    }

    void _swap(size_t i, size_t j) noexcept {
      std::swap(this->_heap[i], this->_heap[j]);
      this->_heap[i]->pos = i;
      this->_heap[j]->pos = j;
    }

    size_t _min_pos() const {
      return 0;
    }

    size_t _max_pos() const {
      if (!Order::interleaved || this->size() == 1) {
        return 0;
      }
      if (this->size() == 2) {
        return 1;
      }
      return this->_priority(1) < this->_priority(2) ? 2 : 1;
    }

    // Append a node to all three views. Either every view gains the
    // node or none does.
    handle _push_node(const K& k, const P& p) {
      if (this->_heap.size() == this->_heap.capacity()) {
        this->_heap.reserve(std::max<size_t>(8, 2 * this->_heap.capacity()));
      }
      const handle h = this->_nodes.insert(this->_nodes.end(),
                                           node{ item_type(k, p), this->_heap.size() });
      try {
        this->_index.emplace(k, h);
      }
      catch (...) {
        this->_nodes.erase(h);
        throw;
      }
      this->_heap.push_back(h);
      return h;
    }

    void _append_or_assign(const K& k, const P& p) {
      const auto found = this->_index.find(k);
      if (found != this->_index.end()) {
        found->second->item.second = p;
      } else {
        this->_push_node(k, p);
      }
    }

    template <typename R>
    void _build(const R& pairs) {
      for (const auto& e : pairs) {
        this->_append_or_assign(std::get<0>(e), std::get<1>(e));
      }
      this->_heapify();
    }

    // Bottom-up heap construction, O(n).
    void _heapify() {
      for (size_t i = this->_heap.size() / 2; i-- > 0;) {
        this->_sift_down(i);
      }
    }

    // Swap-with-last removal. The element moved into the vacated slot
    // can be out of order in either direction.
    void _remove(typename index_map::iterator found) {
      const handle h = found->second;
      const size_t i = h->pos;
      this->_swap(i, this->_heap.size() - 1);
      this->_heap.pop_back();
      this->_index.erase(found);
      this->_nodes.erase(h);
      if (i < this->_heap.size()) {
        this->_restore(i);
      }
    }

    item_type _pop_at(size_t i) {
      item_type item = this->_heap[i]->item;
      this->_remove(this->_index.find(item.first));
      return item;
    }

    // Re-establish the heap order after the priority at [i] changed.
    // Sifting up leaves at [i] an element that may still have to move
    // down, so both passes start from [i].
    void _restore(size_t i) {
      this->_sift_up(i);
      this->_sift_down(i);
    }

    // Move the element at [i] up [generations] levels at a time while it
    // belongs above that ancestor.
    void _climb(size_t i, size_t generations, bool max_level) {
      for (;;) {
        size_t a = i;
        for (size_t g = 0; g < generations; ++g) {
          if (a == 0) {
            return;
          }
          a = _parent(a);
        }
        if (!this->_before(i, a, max_level)) {
          return;
        }
        this->_swap(i, a);
        i = a;
      }
    }

    void _sift_up(size_t i) {
      if constexpr (Order::interleaved) {
        if (i == 0) {
          return;
        }
        const size_t p = _parent(i);
        const bool max_level = Order::is_max_level(i);
        // Out of order with the parent: the element belongs to the
        // parent's kind of level from here on.
        if (this->_before(i, p, !max_level)) {
          this->_swap(i, p);
          this->_climb(p, 2, !max_level);
        } else {
          this->_climb(i, 2, max_level);
        }
      } else {
        this->_climb(i, 1, Order::is_max_level(i));
      }
    }

    void _sift_down(size_t i) {
      const size_t n = this->_heap.size();
      if constexpr (Order::interleaved) {
        const bool max_level = Order::is_max_level(i);
        for (;;) {
          const size_t c = _left(i);
          if (c >= n) {
            return;
          }
          // Most extreme of the children and grandchildren.
          size_t m = c;
          const size_t rest[] = { c + 1, _left(c), _left(c) + 1, _left(c + 1), _left(c + 1) + 1 };
          for (const size_t j : rest) {
            if (j < n && this->_before(j, m, max_level)) {
              m = j;
            }
          }
          if (!this->_before(m, i, max_level)) {
            return;
          }
          this->_swap(i, m);
          if (m <= c + 1) {
            return;
          }
          const size_t p = _parent(m);
          if (this->_before(p, m, max_level)) {
            this->_swap(m, p);
          }
          i = m;
        }
      } else {
        const bool max_level = Order::is_max_level(i);
        for (;;) {
          const size_t c = _left(i);
          size_t best = i;
          if (c < n && this->_before(c, best, max_level)) {
            best = c;
          }
          if (c + 1 < n && this->_before(c + 1, best, max_level)) {
            best = c + 1;
          }
          if (best == i) {
            return;
          }
          this->_swap(i, best);
          i = best;
        }
      }
    }
  };

  template <typename K, typename P,
            typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
  using min_queue = indexed_priority_queue<K, P, min_order, Hash, KeyEqual>;

  template <typename K, typename P,
            typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
  using max_queue = indexed_priority_queue<K, P, max_order, Hash, KeyEqual>;

  template <typename K, typename P,
            typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
  using min_max_queue = indexed_priority_queue<K, P, min_max_order, Hash, KeyEqual>;

  template <typename K, typename P, typename Order, typename Hash, typename KeyEqual>
  void swap(indexed_priority_queue<K, P, Order, Hash, KeyEqual>& a,
            indexed_priority_queue<K, P, Order, Hash, KeyEqual>& b) noexcept {
    a.swap(b);
  }
}  // namespace ipq
