#ifndef PATTRIE_ITER_OPS_HPP
#define PATTRIE_ITER_OPS_HPP

#include "pattrie_support.hpp"
#include <iterator>
#include <vector>

namespace pattrie {

// Standalone stats accumulator
struct pattrie_stats_t {
    size_t total_entries    = 0;
    size_t leaves           = 0;
    size_t branches         = 0;
    size_t max_depth        = 0;   // edges from root to deepest leaf
    size_t collision_leaves = 0;   // leaves standing for more than one entry
};

// ======================================================================
// pattrie_iter_ops<PAYLOAD> -- traversal, count, stats.
//
// All walks use an explicit stack. A branch whose lead child is a leaf
// visits that leaf in place and continues with the other child without a
// push; otherwise the other child is pushed and the lead edge followed.
// Forward order is ascending unsigned key, back order descending.
// ======================================================================

template<typename PAYLOAD>
struct pattrie_iter_ops {
    using leaf_t = leaf_node<PAYLOAD>;
    using PT     = payload_traits<PAYLOAD>;

    // visit(const leaf_t*) -> bool; false stops the walk.
    template<bool FORWARD, typename Visit>
    static bool walk(const node_header* root, Visit&& visit) {
        if (!root) return true;
        if (root->is_leaf()) return visit(as_leaf<PAYLOAD>(root));

        std::vector<const node_header*> stack;
        stack.reserve(TRAVERSAL_RESERVE);
        stack.push_back(root);

        while (!stack.empty()) {
            const node_header* n = stack.back();
            stack.pop_back();
            for (;;) {
                if (n->is_leaf()) {
                    if (!visit(as_leaf<PAYLOAD>(n))) return false;
                    break;
                }
                const branch_node* br = as_branch(n);
                const node_header* lead = FORWARD ? br->left.get()  : br->right.get();
                const node_header* rest = FORWARD ? br->right.get() : br->left.get();
                if (lead->is_leaf()) {
                    if (!visit(as_leaf<PAYLOAD>(lead))) return false;
                    n = rest;
                    continue;
                }
                stack.push_back(rest);
                n = lead;
            }
        }
        return true;
    }

    static size_t count(const node_header* root) {
        size_t n = 0;
        walk<true>(root, [&](const leaf_t* lf) {
            n += PT::weight(lf->payload);
            return true;
        });
        return n;
    }

    // fn(key, payload)
    template<typename Fn>
    static void for_each(const node_header* root, Fn&& fn) {
        walk<true>(root, [&](const leaf_t* lf) {
            fn(lf->prefix, lf->payload);
            return true;
        });
    }

    template<typename Fn>
    static void for_each_back(const node_header* root, Fn&& fn) {
        walk<false>(root, [&](const leaf_t* lf) {
            fn(lf->prefix, lf->payload);
            return true;
        });
    }

    // fn(state, key, payload) -> state
    template<typename S, typename Fn>
    static S fold(const node_header* root, S state, Fn&& fn) {
        walk<true>(root, [&](const leaf_t* lf) {
            state = fn(std::move(state), lf->prefix, lf->payload);
            return true;
        });
        return state;
    }

    // fn(key, payload, state) -> state
    template<typename S, typename Fn>
    static S fold_back(const node_header* root, S state, Fn&& fn) {
        walk<false>(root, [&](const leaf_t* lf) {
            state = fn(lf->prefix, lf->payload, std::move(state));
            return true;
        });
        return state;
    }

    // First leaf in ascending order satisfying pred(key, payload).
    template<typename Pred>
    static const leaf_t* find_leaf_if(const node_header* root, Pred&& pred) {
        const leaf_t* hit = nullptr;
        walk<true>(root, [&](const leaf_t* lf) {
            if (!pred(lf->prefix, lf->payload)) return true;
            hit = lf;
            return false;
        });
        return hit;
    }

    // First engaged result of fn(key, payload) -> optional<R>.
    template<typename R, typename Fn>
    static std::optional<R> try_pick(const node_header* root, Fn&& fn) {
        std::optional<R> out;
        walk<true>(root, [&](const leaf_t* lf) {
            out = fn(lf->prefix, lf->payload);
            return !out.has_value();
        });
        return out;
    }

    // ==================================================================
    // Stats
    // ==================================================================

    static void collect_stats(const node_header* root, pattrie_stats_t& s) {
        if (!root) return;
        std::vector<std::pair<const node_header*, size_t>> stack;
        stack.reserve(TRAVERSAL_RESERVE);
        stack.emplace_back(root, 0);
        while (!stack.empty()) {
            auto [n, depth] = stack.back();
            stack.pop_back();
            if (n->is_leaf()) {
                size_t w = PT::weight(as_leaf<PAYLOAD>(n)->payload);
                s.leaves++;
                s.total_entries += w;
                if (w > 1) s.collision_leaves++;
                if (depth > s.max_depth) s.max_depth = depth;
                continue;
            }
            const branch_node* br = as_branch(n);
            s.branches++;
            stack.emplace_back(br->right.get(), depth + 1);
            stack.emplace_back(br->left.get(), depth + 1);
        }
    }
};

// ======================================================================
// trie_cursor_t -- lazy ordered traversal over (key, payload) leaves.
//
// Holds a reference on the root so the snapshot outlives its container.
// The stack holds only the unvisited siblings along the current path.
// ======================================================================

template<typename PAYLOAD, bool FORWARD>
class trie_cursor_t {
public:
    using leaf_t            = leaf_node<PAYLOAD>;
    using iterator_category = std::input_iterator_tag;
    using value_type        = leaf_t;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const leaf_t*;
    using reference         = const leaf_t&;

    trie_cursor_t() noexcept : root_(), current_(nullptr) {}

    explicit trie_cursor_t(node_ptr root) : root_(std::move(root)), current_(nullptr) {
        if (!root_) return;
        stack_.reserve(TRAVERSAL_RESERVE);
        seek_(root_.get());
    }

    uint32_t       key()     const noexcept { return current_->prefix; }
    const PAYLOAD& payload() const noexcept { return current_->payload; }
    const leaf_t*  leaf()    const noexcept { return current_; }
    bool           done()    const noexcept { return current_ == nullptr; }

    reference operator*()  const noexcept { return *current_; }
    pointer   operator->() const noexcept { return current_; }

    trie_cursor_t& operator++() {
        advance_();
        return *this;
    }

    trie_cursor_t operator++(int) {
        trie_cursor_t tmp = *this;
        advance_();
        return tmp;
    }

    bool operator==(const trie_cursor_t& o) const noexcept { return current_ == o.current_; }
    bool operator!=(const trie_cursor_t& o) const noexcept { return current_ != o.current_; }

private:
    node_ptr                        root_;
    std::vector<const node_header*> stack_;
    const leaf_t*                   current_;

    void seek_(const node_header* n) {
        while (!n->is_leaf()) {
            const branch_node* br = as_branch(n);
            stack_.push_back(FORWARD ? br->right.get() : br->left.get());
            n = FORWARD ? br->left.get() : br->right.get();
        }
        current_ = as_leaf<PAYLOAD>(n);
    }

    void advance_() {
        assert(current_);
        if (stack_.empty()) {
            current_ = nullptr;
            return;
        }
        const node_header* n = stack_.back();
        stack_.pop_back();
        seek_(n);
    }
};

template<typename PAYLOAD> using trie_cursor  = trie_cursor_t<PAYLOAD, true>;
template<typename PAYLOAD> using trie_rcursor = trie_cursor_t<PAYLOAD, false>;

} // namespace pattrie

#endif // PATTRIE_ITER_OPS_HPP
