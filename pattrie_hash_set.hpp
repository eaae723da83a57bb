#ifndef PATTRIE_HASH_SET_HPP
#define PATTRIE_HASH_SET_HPP

#include "pattrie_impl.hpp"
#include "pattrie_bucket.hpp"
#include <functional>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace pattrie {

// ======================================================================
// hash_set<T, HASH, LESS, EQUAL> -- persistent set over arbitrary values.
//
// Elements are keyed in the trie by their 32-bit folded hash; elements
// with the same hash share a leaf through a collision bucket ordered by
// LESS. Iteration order is ascending hash, then LESS within a bucket.
// ======================================================================

template<typename T,
         typename HASH  = std::hash<T>,
         typename LESS  = std::less<T>,
         typename EQUAL = std::equal_to<T>>
class hash_set {
public:
    using value_type = T;
    using size_type  = std::size_t;

private:
    using bucket_t = bucket_ptr<T>;
    using BKO      = bucket_ops<T, LESS, EQUAL>;
    using impl_t   = pattrie_impl<bucket_t>;
    using cell_t   = bucket_cell<T>;
    using combine_t = combine_result_t<bucket_t>;

    impl_t impl_;

    explicit hash_set(impl_t impl) noexcept : impl_(std::move(impl)) {}

    static uint32_t hash_of_(const T& v) { return fold_hash(HASH{}(v)); }

    static combine_t pick_bucket_(const bucket_t& r, const bucket_t& a, const bucket_t& b) {
        if (!r) return combine_t::drop();
        if (r == a) return combine_t::take_left();
        if (r == b) return combine_t::take_right();
        return combine_t::make(r);
    }

    // Walks every element: leaf order, then bucket order.
    template<bool FORWARD, typename Visit>
    bool walk_(Visit&& visit) const {
        return pattrie_iter_ops<bucket_t>::template walk<FORWARD>(impl_.root().get(),
            [&](const leaf_node<bucket_t>* lf) {
                if constexpr (FORWARD) {
                    for (const cell_t* c = lf->payload.get(); c; c = c->next.get())
                        if (!visit(c->value)) return false;
                    return true;
                } else {
                    bool go = true;
                    BKO::for_each_back(lf->payload.get(), [&](const T& v) {
                        if (go) go = visit(v);
                    });
                    return go;
                }
            });
    }

public:
    // ==================================================================
    // Iterator -- trie cursor plus position within the current bucket
    // ==================================================================

    class const_iterator {
        trie_cursor<bucket_t> cur_;
        const cell_t*         cell_ = nullptr;

        friend class hash_set;
        explicit const_iterator(trie_cursor<bucket_t> c) : cur_(std::move(c)) {
            if (!cur_.done()) cell_ = cur_.payload().get();
        }

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        const_iterator() = default;

        reference operator*()  const noexcept { return cell_->value; }
        pointer   operator->() const noexcept { return &cell_->value; }

        const_iterator& operator++() {
            cell_ = cell_->next.get();
            if (!cell_) {
                ++cur_;
                if (!cur_.done()) cell_ = cur_.payload().get();
            }
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const const_iterator& o) const noexcept { return cell_ == o.cell_; }
        bool operator!=(const const_iterator& o) const noexcept { return cell_ != o.cell_; }
    };

    using iterator = const_iterator;

    // ==================================================================
    // Construction
    // ==================================================================

    hash_set() noexcept = default;

    static hash_set singleton(const T& v) {
        return hash_set(impl_t::singleton(hash_of_(v), BKO::make(v)));
    }

    template<typename It>
    static hash_set of_range(It first, It last) {
        hash_set s;
        for (; first != last; ++first) s = s.insert(*first);
        return s;
    }

    static hash_set of_array(const T* data, size_t count) {
        if (!data && count > 0)
            throw std::invalid_argument("hash_set::of_array: null data with non-zero count");
        if (count == 0) return hash_set();
        return of_range(data, data + count);
    }

    // ==================================================================
    // Size / lookup
    // ==================================================================

    [[nodiscard]] bool      empty() const noexcept { return impl_.empty(); }
    [[nodiscard]] size_type size()  const noexcept { return impl_.size(); }

    bool contains(const T& v) const {
        const bucket_t* b = impl_.find(hash_of_(v));
        return b && BKO::contains(*b, v);
    }

    // ==================================================================
    // Update
    // ==================================================================

    // Returns a set sharing the same root if v is already present.
    hash_set insert(const T& v) const {
        auto merge = [&](const bucket_t& existing, const bucket_t&) -> std::optional<bucket_t> {
            bucket_t r = BKO::add(existing, v);
            if (r == existing) return std::nullopt;
            return r;
        };
        return hash_set(impl_.insert(hash_of_(v), BKO::make(v), merge));
    }

    hash_set erase(const T& v) const {
        auto shrink = [&](const bucket_t& existing) -> shrink_result_t<bucket_t> {
            bucket_t r = BKO::remove(existing, v);
            if (r == existing) return {false, std::nullopt};
            if (!r) return {true, std::nullopt};
            return {true, std::move(r)};
        };
        return hash_set(impl_.erase(hash_of_(v), shrink));
    }

    // ==================================================================
    // Set algebra
    // ==================================================================

    hash_set union_with(const hash_set& o) const {
        auto combine = [](const bucket_t& a, const bucket_t& b) {
            return pick_bucket_(BKO::union_of(a, b), a, b);
        };
        return hash_set(impl_.union_with(o.impl_, combine));
    }

    hash_set intersect_with(const hash_set& o) const {
        auto combine = [](const bucket_t& a, const bucket_t& b) {
            return pick_bucket_(BKO::intersect_of(a, b), a, b);
        };
        return hash_set(impl_.intersect_with(o.impl_, combine));
    }

    hash_set difference_with(const hash_set& o) const {
        auto subtract = [](const bucket_t& a, const bucket_t& b) {
            bucket_t r = BKO::difference_of(a, b);
            if (!r) return combine_t::drop();
            if (r == a) return combine_t::take_left();
            return combine_t::make(std::move(r));
        };
        return hash_set(impl_.difference_with(o.impl_, subtract));
    }

    template<typename It>
    static hash_set union_many(It first, It last) {
        hash_set acc;
        for (; first != last; ++first) acc = acc.union_with(*first);
        return acc;
    }

    // Intersection of an empty sequence is the empty set.
    template<typename It>
    static hash_set intersect_many(It first, It last) {
        if (first == last) return hash_set();
        hash_set acc = *first;
        for (++first; first != last && !acc.empty(); ++first)
            acc = acc.intersect_with(*first);
        return acc;
    }

    bool is_subset_of(const hash_set& o) const {
        if (size() > o.size()) return false;
        return forall([&](const T& v) { return o.contains(v); });
    }

    bool is_proper_subset_of(const hash_set& o) const {
        return size() < o.size() && is_subset_of(o);
    }

    bool is_superset_of(const hash_set& o) const { return o.is_subset_of(*this); }

    bool is_proper_superset_of(const hash_set& o) const { return o.is_proper_subset_of(*this); }

    // ==================================================================
    // Traversal
    // ==================================================================

    template<typename Fn>
    void for_each(Fn&& fn) const {
        walk_<true>([&](const T& v) { fn(v); return true; });
    }

    template<typename Fn>
    void for_each_back(Fn&& fn) const {
        walk_<false>([&](const T& v) { fn(v); return true; });
    }

    // fn(state, value) -> state
    template<typename S, typename Fn>
    S fold(S state, Fn&& fn) const {
        walk_<true>([&](const T& v) { state = fn(std::move(state), v); return true; });
        return state;
    }

    // fn(value, state) -> state
    template<typename S, typename Fn>
    S fold_back(S state, Fn&& fn) const {
        walk_<false>([&](const T& v) { state = fn(v, std::move(state)); return true; });
        return state;
    }

    template<typename Pred>
    std::optional<T> try_find(Pred&& pred) const {
        const T* hit = nullptr;
        walk_<true>([&](const T& v) {
            if (!pred(v)) return true;
            hit = &v;
            return false;
        });
        if (!hit) return std::nullopt;
        return *hit;
    }

    template<typename Pred>
    T find(Pred&& pred) const {
        std::optional<T> r = try_find(pred);
        if (!r) throw std::out_of_range("hash_set::find: no element matches");
        return *r;
    }

    template<typename Pred>
    bool exists(Pred&& pred) const {
        return !walk_<true>([&](const T& v) { return !pred(v); });
    }

    template<typename Pred>
    bool forall(Pred&& pred) const {
        return walk_<true>([&](const T& v) { return static_cast<bool>(pred(v)); });
    }

    const T& first() const {
        auto* lf = impl_.min_leaf();
        if (!lf) throw std::out_of_range("hash_set::first: empty set");
        return *BKO::first(lf->payload.get());
    }

    const T& last() const {
        auto* lf = impl_.max_leaf();
        if (!lf) throw std::out_of_range("hash_set::last: empty set");
        return *BKO::last(lf->payload.get());
    }

    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size());
        for_each([&](const T& v) { out.push_back(v); });
        return out;
    }

    const_iterator begin() const { return const_iterator(impl_.begin()); }
    const_iterator end()   const { return const_iterator(); }

    friend bool operator==(const hash_set& a, const hash_set& b) {
        if (a.impl_.same_root(b.impl_)) return true;
        return a.size() == b.size() && a.is_subset_of(b);
    }

    // ==================================================================
    // Debug
    // ==================================================================

    bool same_root(const hash_set& o) const noexcept { return impl_.same_root(o.impl_); }

    pattrie_stats_t debug_stats() const { return impl_.debug_stats(); }

    bool check_invariants() const {
        return impl_.check_invariants([](uint32_t key, const bucket_t& b) {
            return BKO::check(b, [&](const T& v) { return hash_of_(v) == key; });
        });
    }
};

} // namespace pattrie

#endif // PATTRIE_HASH_SET_HPP
