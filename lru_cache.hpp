#ifndef PATTRIE_LRU_CACHE_HPP
#define PATTRIE_LRU_CACHE_HPP

#include "pattrie.hpp"
#include "pattrie_hash_map.hpp"
#include <limits>

namespace pattrie {

// ======================================================================
// lru_cache<KEY, VALUE> -- persistent bounded cache, least recently used
// entry evicted first.
//
// Two tries kept in bijection:
//   primary_ : KEY -> (recency, value)
//   recency_ : recency -> KEY
// Recency indices are minted from next_index_ on every touch (insert or
// successful lookup), so the smallest index is always the oldest entry.
// When the counter is exhausted all entries are renumbered 0..n-1 in
// recency order before minting.
// ======================================================================

template<typename KEY, typename VALUE,
         typename HASH  = std::hash<KEY>,
         typename LESS  = std::less<KEY>,
         typename EQUAL = std::equal_to<KEY>>
class lru_cache {
public:
    using key_type    = KEY;
    using mapped_type = VALUE;
    using size_type   = std::size_t;

private:
    struct slot_t {
        uint32_t recency;
        VALUE    value;
    };

    using primary_t = hash_map<KEY, slot_t, HASH, LESS, EQUAL>;
    using recency_t = int_map<uint32_t, KEY>;

    static constexpr uint32_t INDEX_LIMIT = std::numeric_limits<uint32_t>::max();

    primary_t primary_;
    recency_t recency_;
    uint32_t  capacity_;
    uint32_t  next_index_;

    lru_cache(primary_t p, recency_t r, uint32_t capacity, uint32_t next_index)
        : primary_(std::move(p)), recency_(std::move(r)),
          capacity_(capacity), next_index_(next_index) {}

    // Drop oldest entries until size <= limit.
    static void evict_to_(primary_t& p, recency_t& r, size_t limit) {
        while (r.size() > limit) {
            auto [idx, victim] = r.front();
            r = r.erase(idx);
            p = p.erase(victim);
        }
    }

    // Reassign recency 0..n-1 in current order.
    lru_cache renumbered_() const {
        primary_t p;
        recency_t r;
        uint32_t next = 0;
        recency_.for_each([&](uint32_t, const KEY& key) {
            const slot_t* slot = primary_.find_value(key);
            assert(slot);
            p = p.insert(key, slot_t{next, slot->value});
            r = r.insert(next, key);
            ++next;
        });
        return lru_cache(std::move(p), std::move(r), capacity_, next);
    }

public:
    explicit lru_cache(uint32_t capacity) noexcept
        : primary_(), recency_(), capacity_(capacity), next_index_(0) {}

    template<typename It>
    static lru_cache of_range(uint32_t capacity, It first, It last) {
        lru_cache c(capacity);
        for (; first != last; ++first) {
            const auto& [k, v] = *first;
            c = c.insert(k, v);
        }
        return c;
    }

    static lru_cache of_array(uint32_t capacity, const std::pair<KEY, VALUE>* data, size_t count) {
        if (!data && count > 0)
            throw std::invalid_argument("lru_cache::of_array: null data with non-zero count");
        if (count == 0) return lru_cache(capacity);
        return of_range(capacity, data, data + count);
    }

    template<typename CMP, typename A>
    static lru_cache of_map(uint32_t capacity, const std::map<KEY, VALUE, CMP, A>& src) {
        return of_range(capacity, src.begin(), src.end());
    }

    // ==================================================================
    // Queries (do not touch recency)
    // ==================================================================

    [[nodiscard]] bool      empty()    const noexcept { return recency_.empty(); }
    [[nodiscard]] size_type size()     const noexcept { return recency_.size(); }
    [[nodiscard]] uint32_t  capacity() const noexcept { return capacity_; }

    bool contains(const KEY& key) const { return primary_.contains(key); }

    // ==================================================================
    // Update
    // ==================================================================

    lru_cache insert(const KEY& key, const VALUE& value) const {
        if (capacity_ == 0) return *this;
        if (next_index_ == INDEX_LIMIT) return renumbered_().insert(key, value);

        uint32_t idx = next_index_;
        recency_t r = recency_;
        if (const slot_t* old = primary_.find_value(key))
            r = r.erase(old->recency);
        r = r.insert(idx, key);
        primary_t p = primary_.insert(key, slot_t{idx, value});
        evict_to_(p, r, capacity_);
        return lru_cache(std::move(p), std::move(r), capacity_, idx + 1);
    }

    // A hit refreshes the entry; a miss returns this cache unchanged.
    std::pair<std::optional<VALUE>, lru_cache> try_find(const KEY& key) const {
        const slot_t* slot = primary_.find_value(key);
        if (!slot) return {std::nullopt, *this};
        VALUE v = slot->value;
        lru_cache next = insert(key, v);
        return {std::move(v), std::move(next)};
    }

    std::pair<VALUE, lru_cache> find(const KEY& key) const {
        auto [v, next] = try_find(key);
        if (!v) throw std::out_of_range("lru_cache::find: key not found");
        return {std::move(*v), std::move(next)};
    }

    lru_cache erase(const KEY& key) const {
        const slot_t* slot = primary_.find_value(key);
        if (!slot) return *this;
        return lru_cache(primary_.erase(key), recency_.erase(slot->recency),
                         capacity_, next_index_);
    }

    lru_cache change_capacity(uint32_t capacity) const {
        if (capacity >= capacity_)
            return lru_cache(primary_, recency_, capacity, next_index_);
        primary_t p = primary_;
        recency_t r = recency_;
        evict_to_(p, r, capacity);
        return lru_cache(std::move(p), std::move(r), capacity, next_index_);
    }

    // ==================================================================
    // Enumeration, oldest first
    // ==================================================================

    // fn(key, value)
    template<typename Fn>
    void for_each(Fn&& fn) const {
        recency_.for_each([&](uint32_t, const KEY& key) {
            const slot_t* slot = primary_.find_value(key);
            assert(slot);
            fn(key, slot->value);
        });
    }

    // fn(state, key, value) -> state
    template<typename S, typename Fn>
    S fold(S state, Fn&& fn) const {
        for_each([&](const KEY& k, const VALUE& v) { state = fn(std::move(state), k, v); });
        return state;
    }

    std::vector<std::pair<KEY, VALUE>> to_vector() const {
        std::vector<std::pair<KEY, VALUE>> out;
        out.reserve(size());
        for_each([&](const KEY& k, const VALUE& v) { out.emplace_back(k, v); });
        return out;
    }

    std::map<KEY, VALUE, LESS> to_map() const {
        std::map<KEY, VALUE, LESS> out;
        for_each([&](const KEY& k, const VALUE& v) { out.emplace(k, v); });
        return out;
    }

    // ==================================================================
    // Debug
    // ==================================================================

    uint32_t debug_next_index() const noexcept { return next_index_; }

    // Moves the recency counter forward; used to exercise renumbering.
    lru_cache debug_advance_clock(uint32_t next_index) const {
        if (next_index < next_index_)
            throw std::invalid_argument("lru_cache::debug_advance_clock: counter cannot move back");
        return lru_cache(primary_, recency_, capacity_, next_index);
    }

    bool check_invariants() const {
        if (!primary_.check_invariants() || !recency_.check_invariants()) return false;
        if (primary_.size() != recency_.size()) return false;
        if (recency_.size() > capacity_) return false;
        if (!recency_.empty() && recency_.back().first >= next_index_) return false;

        bool ok = true;
        recency_.for_each([&](uint32_t idx, const KEY& key) {
            const slot_t* slot = primary_.find_value(key);
            if (!slot || slot->recency != idx) ok = false;
        });
        primary_.for_each([&](const KEY& key, const slot_t& slot) {
            const KEY* back = recency_.find_value(slot.recency);
            if (!back || !EQUAL{}(*back, key)) ok = false;
        });
        return ok;
    }
};

} // namespace pattrie

#endif // PATTRIE_LRU_CACHE_HPP
