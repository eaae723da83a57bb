#ifndef PATTRIE_IMPL_HPP
#define PATTRIE_IMPL_HPP

#include "pattrie_ops.hpp"
#include "pattrie_iter_ops.hpp"

namespace pattrie {

// ======================================================================
// pattrie_impl<PAYLOAD> -- persistent trie value: root plus entry count.
//
// Copying is O(1) and shares the whole tree. Updates return a new value;
// the receiver is never modified. The facades (int_map, hash_set,
// hash_map) canonicalize keys and supply the payload policies.
// ======================================================================

template<typename PAYLOAD>
class pattrie_impl {
public:
    using payload_type = PAYLOAD;
    using size_type    = std::size_t;
    using leaf_t       = leaf_node<PAYLOAD>;
    using cursor       = trie_cursor<PAYLOAD>;
    using rcursor      = trie_rcursor<PAYLOAD>;

private:
    using OPS  = pattrie_ops<PAYLOAD>;
    using ITER = pattrie_iter_ops<PAYLOAD>;

    node_ptr root_;
    size_t   size_;

    pattrie_impl(node_ptr root, size_t size) noexcept
        : root_(std::move(root)), size_(size) {}

    static size_t apply_delta_(size_t size, std::ptrdiff_t delta) noexcept {
        assert(delta >= 0 || static_cast<size_t>(-delta) <= size);
        return static_cast<size_t>(static_cast<std::ptrdiff_t>(size) + delta);
    }

    static pattrie_impl from_root_(node_ptr root) {
        size_t n = ITER::count(root.get());
        return pattrie_impl(std::move(root), n);
    }

public:
    pattrie_impl() noexcept : root_(), size_(0) {}

    static pattrie_impl singleton(uint32_t key, PAYLOAD payload) {
        size_t w = payload_traits<PAYLOAD>::weight(payload);
        return pattrie_impl(OPS::make_leaf(key, std::move(payload)), w);
    }

    [[nodiscard]] bool      empty() const noexcept { return !root_; }
    [[nodiscard]] size_type size()  const noexcept { return size_; }

    const node_ptr& root() const noexcept { return root_; }

    bool same_root(const pattrie_impl& o) const noexcept { return root_ == o.root_; }

    // ==================================================================
    // Lookup
    // ==================================================================

    const PAYLOAD* find(uint32_t key) const noexcept {
        return OPS::find(root_.get(), key);
    }

    const leaf_t* min_leaf() const noexcept { return OPS::min_leaf(root_.get()); }
    const leaf_t* max_leaf() const noexcept { return OPS::max_leaf(root_.get()); }

    // ==================================================================
    // Update
    // ==================================================================

    template<typename Merge>
    pattrie_impl insert(uint32_t key, const PAYLOAD& payload, Merge&& merge) const {
        insert_result_t r = OPS::insert(root_, key, payload, merge);
        if (r.node == root_) return *this;
        return pattrie_impl(std::move(r.node), apply_delta_(size_, r.delta));
    }

    template<typename Shrink>
    pattrie_impl erase(uint32_t key, Shrink&& shrink) const {
        erase_result_t r = OPS::erase(root_, key, shrink);
        if (r.node == root_) return *this;
        return pattrie_impl(std::move(r.node), apply_delta_(size_, r.delta));
    }

    // ==================================================================
    // Merge
    // ==================================================================

    template<typename Combine>
    pattrie_impl union_with(const pattrie_impl& o, Combine&& combine) const {
        node_ptr r = OPS::union_with(root_, o.root_, combine);
        if (r == root_) return *this;
        if (r == o.root_) return o;
        return from_root_(std::move(r));
    }

    template<typename Combine>
    pattrie_impl intersect_with(const pattrie_impl& o, Combine&& combine) const {
        node_ptr r = OPS::intersect_with(root_, o.root_, combine);
        if (r == root_) return *this;
        if (r == o.root_) return o;
        return from_root_(std::move(r));
    }

    template<typename Subtract>
    pattrie_impl difference_with(const pattrie_impl& o, Subtract&& subtract) const {
        node_ptr r = OPS::difference_with(root_, o.root_, subtract);
        if (r == root_) return *this;
        return from_root_(std::move(r));
    }

    // ==================================================================
    // Traversal
    // ==================================================================

    size_t count() const { return ITER::count(root_.get()); }

    template<typename Fn>
    void for_each(Fn&& fn) const { ITER::for_each(root_.get(), fn); }

    template<typename Fn>
    void for_each_back(Fn&& fn) const { ITER::for_each_back(root_.get(), fn); }

    template<typename S, typename Fn>
    S fold(S state, Fn&& fn) const {
        return ITER::fold(root_.get(), std::move(state), fn);
    }

    template<typename S, typename Fn>
    S fold_back(S state, Fn&& fn) const {
        return ITER::fold_back(root_.get(), std::move(state), fn);
    }

    template<typename Pred>
    const leaf_t* find_leaf_if(Pred&& pred) const {
        return ITER::find_leaf_if(root_.get(), pred);
    }

    template<typename R, typename Fn>
    std::optional<R> try_pick(Fn&& fn) const {
        return ITER::template try_pick<R>(root_.get(), fn);
    }

    cursor  begin()  const { return cursor(root_); }
    cursor  end()    const noexcept { return cursor(); }
    rcursor rbegin() const { return rcursor(root_); }
    rcursor rend()   const noexcept { return rcursor(); }

    // ==================================================================
    // Debug
    // ==================================================================

    pattrie_stats_t debug_stats() const {
        pattrie_stats_t s;
        ITER::collect_stats(root_.get(), s);
        return s;
    }

    // valid(key, payload) -> bool, applied to every leaf.
    template<typename Valid>
    bool check_invariants(Valid&& valid) const {
        if (!OPS::check_invariants(root_.get(), valid)) return false;
        return size_ == ITER::count(root_.get());
    }
};

} // namespace pattrie

#endif // PATTRIE_IMPL_HPP
