#ifndef PATTRIE_OPS_HPP
#define PATTRIE_OPS_HPP

#include "pattrie_support.hpp"

namespace pattrie {

// ======================================================================
// pattrie_ops<PAYLOAD> -- stateless persistent trie operations.
//
// Every update returns a new root. Unchanged subtrees are shared, and an
// update that changes nothing returns its input root by identity.
// Recursion is bounded by trie depth (at most 33 nodes per path).
// ======================================================================

template<typename PAYLOAD>
struct pattrie_ops {
    using leaf_t = leaf_node<PAYLOAD>;
    using PT     = payload_traits<PAYLOAD>;
    using combine_t = combine_result_t<PAYLOAD>;

    static node_ptr make_leaf(uint32_t key, PAYLOAD payload) {
        return std::make_shared<const leaf_t>(key, std::move(payload));
    }

    static node_ptr make_branch(uint32_t prefix, uint32_t mask,
                                node_ptr left, node_ptr right) {
        assert(left && right);
        return std::make_shared<const branch_node>(prefix, mask,
                                                   std::move(left), std::move(right));
    }

    static const PAYLOAD& payload_of(const node_header* n) noexcept {
        return as_leaf<PAYLOAD>(n)->payload;
    }

    // ==================================================================
    // Join: combine two non-empty subtrees whose prefixes disagree
    // ==================================================================

    static node_ptr join(uint32_t p0, node_ptr t0, uint32_t p1, node_ptr t1) {
        uint32_t m = branching_bit(p0, p1);
        uint32_t p = mask_prefix(p0, m);
        if (zero_bit(p0, m))
            return make_branch(p, m, std::move(t0), std::move(t1));
        return make_branch(p, m, std::move(t1), std::move(t0));
    }

    // Rebuild a branch around new children, or keep it by identity.
    static node_ptr rebranch_(const node_ptr& node, node_ptr l, node_ptr r) {
        const branch_node* br = as_branch(node.get());
        if (l == br->left && r == br->right) return node;
        return make_branch(br->prefix, br->mask, std::move(l), std::move(r));
    }

    // Branch whose child may have become empty collapses to the sibling.
    static node_ptr collapse_(const node_ptr& node, node_ptr l, node_ptr r) {
        if (!l) return r;
        if (!r) return l;
        return rebranch_(node, std::move(l), std::move(r));
    }

    // ==================================================================
    // Find
    // ==================================================================

    static const PAYLOAD* find(const node_header* node, uint32_t key) noexcept {
        while (node) {
            if (node->is_leaf())
                return node->prefix == key ? &payload_of(node) : nullptr;
            const branch_node* br = as_branch(node);
            node = zero_bit(key, br->mask) ? br->left.get() : br->right.get();
        }
        return nullptr;
    }

    static const leaf_t* min_leaf(const node_header* node) noexcept {
        if (!node) return nullptr;
        while (!node->is_leaf()) node = as_branch(node)->left.get();
        return as_leaf<PAYLOAD>(node);
    }

    static const leaf_t* max_leaf(const node_header* node) noexcept {
        if (!node) return nullptr;
        while (!node->is_leaf()) node = as_branch(node)->right.get();
        return as_leaf<PAYLOAD>(node);
    }

    // ==================================================================
    // Insert
    //
    // merge(existing, incoming) -> optional<PAYLOAD>; nullopt keeps the
    // existing leaf by identity.
    // ==================================================================

    template<typename Merge>
    static insert_result_t insert(const node_ptr& node, uint32_t key,
                                  const PAYLOAD& payload, Merge& merge) {
        if (!node)
            return {make_leaf(key, payload),
                    static_cast<std::ptrdiff_t>(PT::weight(payload))};

        if (node->is_leaf()) {
            if (node->prefix == key) {
                const PAYLOAD& existing = payload_of(node.get());
                std::optional<PAYLOAD> merged = merge(existing, payload);
                if (!merged) return {node, 0};
                std::ptrdiff_t delta = static_cast<std::ptrdiff_t>(PT::weight(*merged))
                                     - static_cast<std::ptrdiff_t>(PT::weight(existing));
                return {make_leaf(key, std::move(*merged)), delta};
            }
            return {join(key, make_leaf(key, payload), node->prefix, node),
                    static_cast<std::ptrdiff_t>(PT::weight(payload))};
        }

        const branch_node* br = as_branch(node.get());
        if (!match_prefix(key, br->prefix, br->mask))
            return {join(key, make_leaf(key, payload), br->prefix, node),
                    static_cast<std::ptrdiff_t>(PT::weight(payload))};

        if (zero_bit(key, br->mask)) {
            insert_result_t r = insert(br->left, key, payload, merge);
            return {rebranch_(node, std::move(r.node), br->right), r.delta};
        }
        insert_result_t r = insert(br->right, key, payload, merge);
        return {rebranch_(node, br->left, std::move(r.node)), r.delta};
    }

    // ==================================================================
    // Erase
    //
    // shrink(existing) -> shrink_result_t<PAYLOAD>
    // ==================================================================

    template<typename Shrink>
    static erase_result_t erase(const node_ptr& node, uint32_t key, Shrink& shrink) {
        if (!node) return {node, 0};

        if (node->is_leaf()) {
            if (node->prefix != key) return {node, 0};
            const PAYLOAD& existing = payload_of(node.get());
            shrink_result_t<PAYLOAD> s = shrink(existing);
            if (!s.changed) return {node, 0};
            std::ptrdiff_t old_w = static_cast<std::ptrdiff_t>(PT::weight(existing));
            if (!s.payload) return {nullptr, -old_w};
            std::ptrdiff_t delta = static_cast<std::ptrdiff_t>(PT::weight(*s.payload)) - old_w;
            return {make_leaf(key, std::move(*s.payload)), delta};
        }

        const branch_node* br = as_branch(node.get());
        if (!match_prefix(key, br->prefix, br->mask)) return {node, 0};

        if (zero_bit(key, br->mask)) {
            erase_result_t r = erase(br->left, key, shrink);
            if (r.node == br->left) return {node, 0};
            return {collapse_(node, std::move(r.node), br->right), r.delta};
        }
        erase_result_t r = erase(br->right, key, shrink);
        if (r.node == br->right) return {node, 0};
        return {collapse_(node, br->left, std::move(r.node)), r.delta};
    }

    // ==================================================================
    // Union
    //
    // Tie-break: equal masks and prefixes recurse pairwise; equal masks
    // with different prefixes are disjoint; otherwise the node with the
    // larger mask is higher and the other one goes into the child its
    // prefix selects.
    //
    // combine(left, right) -> combine_result_t for leaves with equal keys.
    // ==================================================================

    static node_ptr pick_(const node_ptr& s, const node_ptr& t, combine_t c) {
        switch (c.from) {
        case combine_t::source::left:  return s;
        case combine_t::source::right: return t;
        case combine_t::source::fresh: return make_leaf(s->prefix, std::move(*c.payload));
        case combine_t::source::none:  break;
        }
        return nullptr;
    }

    template<typename Combine>
    static node_ptr union_with(const node_ptr& s, const node_ptr& t, Combine& combine) {
        if (s == t || !t) return s;
        if (!s) return t;

        if (s->is_leaf() && t->is_leaf()) {
            if (s->prefix == t->prefix)
                return pick_(s, t, combine(payload_of(s.get()), payload_of(t.get())));
            return join(s->prefix, s, t->prefix, t);
        }

        if (t->is_leaf()) {
            const branch_node* sb = as_branch(s.get());
            uint32_t k = t->prefix;
            if (!match_prefix(k, sb->prefix, sb->mask))
                return join(k, t, sb->prefix, s);
            if (zero_bit(k, sb->mask))
                return rebranch_(s, union_with(sb->left, t, combine), sb->right);
            return rebranch_(s, sb->left, union_with(sb->right, t, combine));
        }

        if (s->is_leaf()) {
            const branch_node* tb = as_branch(t.get());
            uint32_t k = s->prefix;
            if (!match_prefix(k, tb->prefix, tb->mask))
                return join(k, s, tb->prefix, t);
            if (zero_bit(k, tb->mask))
                return rebranch_(t, union_with(s, tb->left, combine), tb->right);
            return rebranch_(t, tb->left, union_with(s, tb->right, combine));
        }

        const branch_node* sb = as_branch(s.get());
        const branch_node* tb = as_branch(t.get());
        uint32_t p = sb->prefix, m = sb->mask;
        uint32_t q = tb->prefix, n = tb->mask;

        if (m == n) {
            if (p != q) return join(p, s, q, t);
            node_ptr l = union_with(sb->left, tb->left, combine);
            node_ptr r = union_with(sb->right, tb->right, combine);
            if (l == tb->left && r == tb->right) return t;
            return rebranch_(s, std::move(l), std::move(r));
        }
        if (m > n) {
            if (!match_prefix(q, p, m)) return join(p, s, q, t);
            if (zero_bit(q, m))
                return rebranch_(s, union_with(sb->left, t, combine), sb->right);
            return rebranch_(s, sb->left, union_with(sb->right, t, combine));
        }
        if (!match_prefix(p, q, n)) return join(p, s, q, t);
        if (zero_bit(p, n))
            return rebranch_(t, union_with(s, tb->left, combine), tb->right);
        return rebranch_(t, tb->left, union_with(s, tb->right, combine));
    }

    // ==================================================================
    // Intersect
    // ==================================================================

    template<typename Combine>
    static node_ptr intersect_with(const node_ptr& s, const node_ptr& t, Combine& combine) {
        if (!s || !t) return nullptr;
        if (s == t) return s;

        if (s->is_leaf() && t->is_leaf()) {
            if (s->prefix != t->prefix) return nullptr;
            return pick_(s, t, combine(payload_of(s.get()), payload_of(t.get())));
        }

        if (t->is_leaf()) {
            const branch_node* sb = as_branch(s.get());
            uint32_t k = t->prefix;
            if (!match_prefix(k, sb->prefix, sb->mask)) return nullptr;
            return intersect_with(zero_bit(k, sb->mask) ? sb->left : sb->right, t, combine);
        }

        if (s->is_leaf()) {
            const branch_node* tb = as_branch(t.get());
            uint32_t k = s->prefix;
            if (!match_prefix(k, tb->prefix, tb->mask)) return nullptr;
            return intersect_with(s, zero_bit(k, tb->mask) ? tb->left : tb->right, combine);
        }

        const branch_node* sb = as_branch(s.get());
        const branch_node* tb = as_branch(t.get());
        uint32_t p = sb->prefix, m = sb->mask;
        uint32_t q = tb->prefix, n = tb->mask;

        if (m == n) {
            if (p != q) return nullptr;
            node_ptr l = intersect_with(sb->left, tb->left, combine);
            node_ptr r = intersect_with(sb->right, tb->right, combine);
            if (l && r && l == tb->left && r == tb->right) return t;
            return collapse_(s, std::move(l), std::move(r));
        }
        if (m > n) {
            if (!match_prefix(q, p, m)) return nullptr;
            return intersect_with(zero_bit(q, m) ? sb->left : sb->right, t, combine);
        }
        if (!match_prefix(p, q, n)) return nullptr;
        return intersect_with(s, zero_bit(p, n) ? tb->left : tb->right, combine);
    }

    // ==================================================================
    // Difference
    //
    // subtract(left, right) -> combine_result_t (left / fresh / none).
    // ==================================================================

    template<typename Subtract>
    static node_ptr difference_with(const node_ptr& s, const node_ptr& t, Subtract& subtract) {
        if (!s) return nullptr;
        if (!t) return s;
        if (s == t) return nullptr;

        if (s->is_leaf() && t->is_leaf()) {
            if (s->prefix != t->prefix) return s;
            return pick_(s, t, subtract(payload_of(s.get()), payload_of(t.get())));
        }

        if (t->is_leaf()) {
            const branch_node* sb = as_branch(s.get());
            uint32_t k = t->prefix;
            if (!match_prefix(k, sb->prefix, sb->mask)) return s;
            if (zero_bit(k, sb->mask))
                return collapse_(s, difference_with(sb->left, t, subtract), sb->right);
            return collapse_(s, sb->left, difference_with(sb->right, t, subtract));
        }

        if (s->is_leaf()) {
            const branch_node* tb = as_branch(t.get());
            uint32_t k = s->prefix;
            if (!match_prefix(k, tb->prefix, tb->mask)) return s;
            return difference_with(s, zero_bit(k, tb->mask) ? tb->left : tb->right, subtract);
        }

        const branch_node* sb = as_branch(s.get());
        const branch_node* tb = as_branch(t.get());
        uint32_t p = sb->prefix, m = sb->mask;
        uint32_t q = tb->prefix, n = tb->mask;

        if (m == n) {
            if (p != q) return s;
            return collapse_(s, difference_with(sb->left, tb->left, subtract),
                                difference_with(sb->right, tb->right, subtract));
        }
        if (m > n) {
            if (!match_prefix(q, p, m)) return s;
            if (zero_bit(q, m))
                return collapse_(s, difference_with(sb->left, t, subtract), sb->right);
            return collapse_(s, sb->left, difference_with(sb->right, t, subtract));
        }
        if (!match_prefix(p, q, n)) return s;
        return difference_with(s, zero_bit(p, n) ? tb->left : tb->right, subtract);
    }

    // ==================================================================
    // Invariant check
    //
    // valid(key, payload) validates each leaf payload.
    // ==================================================================

    template<typename Valid>
    static bool check_invariants(const node_header* node, Valid& valid) {
        if (!node) return true;
        if (node->is_leaf()) return valid(node->prefix, payload_of(node));

        const branch_node* br = as_branch(node);
        uint32_t p = br->prefix, m = br->mask;
        if (!std::has_single_bit(m)) return false;
        if (mask_prefix(p, m) != p) return false;
        if (!br->left || !br->right) return false;

        const node_header* kids[2] = {br->left.get(), br->right.get()};
        for (int side = 0; side < 2; ++side) {
            const node_header* c = kids[side];
            // Child prefix carries the child's key bits above its own mask,
            // which include every bit at or above m.
            if (!c->is_leaf() && c->mask >= m) return false;
            if (!match_prefix(c->prefix, p, m)) return false;
            if (zero_bit(c->prefix, m) != (side == 0)) return false;
            if (!check_invariants(c, valid)) return false;
        }
        return true;
    }
};

} // namespace pattrie

#endif // PATTRIE_OPS_HPP
