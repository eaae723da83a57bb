#ifndef PATTRIE_HASH_MAP_HPP
#define PATTRIE_HASH_MAP_HPP

#include "pattrie_impl.hpp"
#include "pattrie_bucket.hpp"
#include <functional>
#include <stdexcept>
#include <vector>

namespace pattrie {

// ======================================================================
// hash_map<K, V, HASH, LESS, EQUAL> -- persistent map over arbitrary keys.
//
// Same layout as hash_set; bucket cells hold (key, value) entries ordered
// and compared by key only.
// ======================================================================

template<typename K, typename V,
         typename HASH  = std::hash<K>,
         typename LESS  = std::less<K>,
         typename EQUAL = std::equal_to<K>>
class hash_map {
public:
    using key_type    = K;
    using mapped_type = V;
    using value_type  = std::pair<K, V>;
    using size_type   = std::size_t;

private:
    using entry_t = std::pair<K, V>;

    struct entry_less {
        bool operator()(const entry_t& a, const entry_t& b) const { return LESS{}(a.first, b.first); }
        bool operator()(const entry_t& a, const K& b)       const { return LESS{}(a.first, b); }
        bool operator()(const K& a, const entry_t& b)       const { return LESS{}(a, b.first); }
    };

    struct entry_equal {
        bool operator()(const entry_t& a, const entry_t& b) const { return EQUAL{}(a.first, b.first); }
        bool operator()(const entry_t& a, const K& b)       const { return EQUAL{}(a.first, b); }
    };

    using bucket_t = bucket_ptr<entry_t>;
    using BKO      = bucket_ops<entry_t, entry_less, entry_equal>;
    using impl_t   = pattrie_impl<bucket_t>;

    impl_t impl_;

    explicit hash_map(impl_t impl) noexcept : impl_(std::move(impl)) {}

    static uint32_t hash_of_(const K& k) { return fold_hash(HASH{}(k)); }

public:
    hash_map() noexcept = default;

    template<typename It>
    static hash_map of_range(It first, It last) {
        hash_map m;
        for (; first != last; ++first) {
            const auto& [k, v] = *first;
            m = m.insert(k, v);
        }
        return m;
    }

    [[nodiscard]] bool      empty() const noexcept { return impl_.empty(); }
    [[nodiscard]] size_type size()  const noexcept { return impl_.size(); }

    const V* find_value(const K& key) const {
        const bucket_t* b = impl_.find(hash_of_(key));
        if (!b) return nullptr;
        const entry_t* e = BKO::find(*b, key);
        return e ? &e->second : nullptr;
    }

    bool contains(const K& key) const { return find_value(key) != nullptr; }

    std::optional<V> try_find(const K& key) const {
        const V* v = find_value(key);
        if (!v) return std::nullopt;
        return *v;
    }

    const V& at(const K& key) const {
        const V* v = find_value(key);
        if (!v) throw std::out_of_range("hash_map::at: key not found");
        return *v;
    }

    // Last write wins.
    hash_map insert(const K& key, const V& value) const {
        entry_t e(key, value);
        auto merge = [&](const bucket_t& existing, const bucket_t&) -> std::optional<bucket_t> {
            return BKO::upsert(existing, e);
        };
        return hash_map(impl_.insert(hash_of_(key), BKO::make(e), merge));
    }

    hash_map erase(const K& key) const {
        auto shrink = [&](const bucket_t& existing) -> shrink_result_t<bucket_t> {
            bucket_t r = BKO::remove(existing, key);
            if (r == existing) return {false, std::nullopt};
            if (!r) return {true, std::nullopt};
            return {true, std::move(r)};
        };
        return hash_map(impl_.erase(hash_of_(key), shrink));
    }

    // fn(key, value)
    template<typename Fn>
    void for_each(Fn&& fn) const {
        impl_.for_each([&](uint32_t, const bucket_t& b) {
            BKO::for_each(b.get(), [&](const entry_t& e) { fn(e.first, e.second); });
        });
    }

    // fn(state, key, value) -> state
    template<typename S, typename Fn>
    S fold(S state, Fn&& fn) const {
        for_each([&](const K& k, const V& v) { state = fn(std::move(state), k, v); });
        return state;
    }

    std::vector<std::pair<K, V>> to_vector() const {
        std::vector<std::pair<K, V>> out;
        out.reserve(size());
        for_each([&](const K& k, const V& v) { out.emplace_back(k, v); });
        return out;
    }

    bool same_root(const hash_map& o) const noexcept { return impl_.same_root(o.impl_); }

    pattrie_stats_t debug_stats() const { return impl_.debug_stats(); }

    bool check_invariants() const {
        return impl_.check_invariants([](uint32_t key, const bucket_t& b) {
            return BKO::check(b, [&](const entry_t& e) { return hash_of_(e.first) == key; });
        });
    }
};

} // namespace pattrie

#endif // PATTRIE_HASH_MAP_HPP
