#ifndef PATTRIE_HPP
#define PATTRIE_HPP

#include "pattrie_impl.hpp"
#include <iterator>
#include <map>
#include <stdexcept>
#include <vector>

namespace pattrie {

// ======================================================================
// int_map<KEY, VALUE> -- persistent map keyed by integers of <= 32 bits.
//
// Every update returns a new map; existing maps never change. Iteration
// order is ascending by the unsigned 32-bit pattern of the key.
// ======================================================================

template<typename KEY, typename VALUE>
class int_map {
public:
    using key_type    = KEY;
    using mapped_type = VALUE;
    using value_type  = std::pair<KEY, VALUE>;
    using size_type   = std::size_t;

private:
    using KO     = key_ops<KEY>;
    using impl_t = pattrie_impl<VALUE>;

    impl_t impl_;

    explicit int_map(impl_t impl) noexcept : impl_(std::move(impl)) {}

    // Existing value is replaced.
    struct replace_merge {
        std::optional<VALUE> operator()(const VALUE&, const VALUE& incoming) const {
            return incoming;
        }
    };

    // Existing value is kept.
    struct keep_merge {
        std::optional<VALUE> operator()(const VALUE&, const VALUE&) const {
            return std::nullopt;
        }
    };

    struct drop_shrink {
        shrink_result_t<VALUE> operator()(const VALUE&) const {
            return {true, std::nullopt};
        }
    };

public:
    // ==================================================================
    // Iterator -- wraps a trie cursor, converts keys back to KEY
    // ==================================================================

    template<bool FORWARD>
    class iter_t {
        using cursor_t = trie_cursor_t<VALUE, FORWARD>;
        cursor_t cur_;

        friend class int_map;
        explicit iter_t(cursor_t c) : cur_(std::move(c)) {}

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::pair<KEY, VALUE>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = std::pair<KEY, const VALUE&>;

        iter_t() = default;

        KEY          key()   const noexcept { return KO::to_key(cur_.key()); }
        const VALUE& value() const noexcept { return cur_.payload(); }

        reference operator*() const noexcept { return {key(), value()}; }

        iter_t& operator++() { ++cur_; return *this; }
        iter_t  operator++(int) { iter_t tmp = *this; ++cur_; return tmp; }

        bool operator==(const iter_t& o) const noexcept { return cur_ == o.cur_; }
        bool operator!=(const iter_t& o) const noexcept { return cur_ != o.cur_; }
    };

    using const_iterator         = iter_t<true>;
    using iterator               = const_iterator;
    using const_reverse_iterator = iter_t<false>;
    using reverse_iterator       = const_reverse_iterator;

    // ==================================================================
    // Construction
    // ==================================================================

    int_map() noexcept = default;

    static int_map singleton(KEY key, const VALUE& value) {
        return int_map(impl_t::singleton(KO::to_internal(key), value));
    }

    // Later duplicates overwrite earlier ones.
    template<typename It>
    static int_map of_range(It first, It last) {
        int_map m;
        for (; first != last; ++first) {
            const auto& [k, v] = *first;
            m = m.insert(k, v);
        }
        return m;
    }

    static int_map of_array(const std::pair<KEY, VALUE>* data, size_t count) {
        if (!data && count > 0)
            throw std::invalid_argument("int_map::of_array: null data with non-zero count");
        if (count == 0) return int_map();
        return of_range(data, data + count);
    }

    template<typename CMP, typename A>
    static int_map of_map(const std::map<KEY, VALUE, CMP, A>& src) {
        return of_range(src.begin(), src.end());
    }

    // ==================================================================
    // Size / lookup
    // ==================================================================

    [[nodiscard]] bool      empty() const noexcept { return impl_.empty(); }
    [[nodiscard]] size_type size()  const noexcept { return impl_.size(); }

    bool contains(KEY key) const noexcept {
        return impl_.find(KO::to_internal(key)) != nullptr;
    }

    const VALUE* find_value(KEY key) const noexcept {
        return impl_.find(KO::to_internal(key));
    }

    std::optional<VALUE> try_find(KEY key) const {
        const VALUE* v = find_value(key);
        if (!v) return std::nullopt;
        return *v;
    }

    const VALUE& at(KEY key) const {
        const VALUE* v = find_value(key);
        if (!v) throw std::out_of_range("int_map::at: key not found");
        return *v;
    }

    // ==================================================================
    // Update
    // ==================================================================

    // Last write wins.
    int_map insert(KEY key, const VALUE& value) const {
        return int_map(impl_.insert(KO::to_internal(key), value, replace_merge{}));
    }

    // Existing entry wins; returns the same map if key is present.
    int_map try_insert(KEY key, const VALUE& value) const {
        return int_map(impl_.insert(KO::to_internal(key), value, keep_merge{}));
    }

    int_map erase(KEY key) const {
        return int_map(impl_.erase(KO::to_internal(key), drop_shrink{}));
    }

    // Left-biased: on shared keys the value from *this is kept.
    int_map union_with(const int_map& o) const {
        auto combine = [](const VALUE&, const VALUE&) {
            return combine_result_t<VALUE>::take_left();
        };
        return int_map(impl_.union_with(o.impl_, combine));
    }

    // ==================================================================
    // Traversal
    // ==================================================================

    // fn(key, value)
    template<typename Fn>
    void for_each(Fn&& fn) const {
        impl_.for_each([&](uint32_t ik, const VALUE& v) { fn(KO::to_key(ik), v); });
    }

    template<typename Fn>
    void for_each_back(Fn&& fn) const {
        impl_.for_each_back([&](uint32_t ik, const VALUE& v) { fn(KO::to_key(ik), v); });
    }

    // fn(state, key, value) -> state
    template<typename S, typename Fn>
    S fold(S state, Fn&& fn) const {
        return impl_.fold(std::move(state), [&](S s, uint32_t ik, const VALUE& v) {
            return fn(std::move(s), KO::to_key(ik), v);
        });
    }

    // fn(key, value, state) -> state
    template<typename S, typename Fn>
    S fold_back(S state, Fn&& fn) const {
        return impl_.fold_back(std::move(state), [&](uint32_t ik, const VALUE& v, S s) {
            return fn(KO::to_key(ik), v, std::move(s));
        });
    }

    template<typename Pred>
    std::optional<KEY> try_find_key(Pred&& pred) const {
        auto* lf = impl_.find_leaf_if([&](uint32_t ik, const VALUE& v) {
            return pred(KO::to_key(ik), v);
        });
        if (!lf) return std::nullopt;
        return KO::to_key(lf->prefix);
    }

    template<typename Pred>
    KEY find_key(Pred&& pred) const {
        std::optional<KEY> k = try_find_key(pred);
        if (!k) throw std::out_of_range("int_map::find_key: no entry matches");
        return *k;
    }

    template<typename Pred>
    bool exists(Pred&& pred) const {
        return try_find_key(pred).has_value();
    }

    template<typename Pred>
    bool forall(Pred&& pred) const {
        return !try_find_key([&](KEY k, const VALUE& v) { return !pred(k, v); });
    }

    // fn(key, value) -> optional<R>
    template<typename Fn>
    auto try_pick(Fn&& fn) const {
        using R = typename std::invoke_result_t<Fn&, KEY, const VALUE&>::value_type;
        return impl_.template try_pick<R>([&](uint32_t ik, const VALUE& v) {
            return fn(KO::to_key(ik), v);
        });
    }

    template<typename Fn>
    auto pick(Fn&& fn) const {
        auto r = try_pick(fn);
        if (!r) throw std::out_of_range("int_map::pick: no entry matches");
        return *r;
    }

    // Smallest / largest unsigned key.
    std::pair<KEY, VALUE> front() const {
        auto* lf = impl_.min_leaf();
        if (!lf) throw std::out_of_range("int_map::front: empty map");
        return {KO::to_key(lf->prefix), lf->payload};
    }

    std::pair<KEY, VALUE> back() const {
        auto* lf = impl_.max_leaf();
        if (!lf) throw std::out_of_range("int_map::back: empty map");
        return {KO::to_key(lf->prefix), lf->payload};
    }

    std::vector<std::pair<KEY, VALUE>> to_vector() const {
        std::vector<std::pair<KEY, VALUE>> out;
        out.reserve(size());
        for_each([&](KEY k, const VALUE& v) { out.emplace_back(k, v); });
        return out;
    }

    std::map<KEY, VALUE> to_map() const {
        std::map<KEY, VALUE> out;
        for_each([&](KEY k, const VALUE& v) { out.emplace(k, v); });
        return out;
    }

    const_iterator         begin()  const { return const_iterator(impl_.begin()); }
    const_iterator         end()    const { return const_iterator(impl_.end()); }
    const_reverse_iterator rbegin() const { return const_reverse_iterator(impl_.rbegin()); }
    const_reverse_iterator rend()   const { return const_reverse_iterator(impl_.rend()); }

    friend bool operator==(const int_map& a, const int_map& b) {
        if (a.impl_.same_root(b.impl_)) return true;
        if (a.size() != b.size()) return false;
        auto i = a.begin();
        auto j = b.begin();
        for (; i != a.end(); ++i, ++j) {
            if (i.key() != j.key() || !(i.value() == j.value())) return false;
        }
        return true;
    }

    // ==================================================================
    // Debug
    // ==================================================================

    bool same_root(const int_map& o) const noexcept { return impl_.same_root(o.impl_); }

    pattrie_stats_t debug_stats() const { return impl_.debug_stats(); }

    bool check_invariants() const {
        return impl_.check_invariants([](uint32_t, const VALUE&) { return true; });
    }
};

} // namespace pattrie

#endif // PATTRIE_HPP
