#ifndef PATTRIE_BUCKET_HPP
#define PATTRIE_BUCKET_HPP

#include "pattrie_support.hpp"
#include <vector>

namespace pattrie {

// ======================================================================
// Collision bucket: persistent, strictly ascending singly linked chain
// of distinct values sharing one 32-bit hash.
//
// LESS must be a strict weak order and EQUAL must agree with it:
//   !LESS(a,b) && !LESS(b,a)  <=>  EQUAL(a,b)
// Scans stop at the first element greater than the probe, so a LESS
// that disagrees with EQUAL can hide elements.
// ======================================================================

template<typename T>
struct bucket_cell {
    T                                 value;
    std::shared_ptr<const bucket_cell> next;

    bucket_cell(T v, std::shared_ptr<const bucket_cell> n)
        : value(std::move(v)), next(std::move(n)) {}
};

template<typename T>
using bucket_ptr = std::shared_ptr<const bucket_cell<T>>;

template<typename T>
struct payload_traits<bucket_ptr<T>> {
    static size_t weight(const bucket_ptr<T>& b) noexcept {
        size_t n = 0;
        for (const bucket_cell<T>* c = b.get(); c; c = c->next.get()) ++n;
        return n;
    }
};

// ======================================================================
// bucket_ops<T, LESS, EQUAL> -- stateless chain operations.
// Every function returning a bucket returns its input by identity when
// the result would be equal to it; null means an empty bucket.
// ======================================================================

template<typename T, typename LESS, typename EQUAL>
struct bucket_ops {
    using cell_t = bucket_cell<T>;
    using ptr    = bucket_ptr<T>;

    static ptr make(T v, ptr next = nullptr) {
        return std::make_shared<const cell_t>(std::move(v), std::move(next));
    }

    static size_t count(const ptr& b) noexcept {
        return payload_traits<ptr>::weight(b);
    }

    // ==================================================================
    // Lookup
    // ==================================================================

    template<typename Q>
    static const T* find(const ptr& b, const Q& probe) {
        LESS less{};
        EQUAL eq{};
        for (const cell_t* c = b.get(); c; c = c->next.get()) {
            if (eq(c->value, probe)) return &c->value;
            if (less(probe, c->value)) return nullptr;
        }
        return nullptr;
    }

    template<typename Q>
    static bool contains(const ptr& b, const Q& probe) {
        return find(b, probe) != nullptr;
    }

    static const T* first(const cell_t* c) noexcept {
        return c ? &c->value : nullptr;
    }

    static const T* last(const cell_t* c) noexcept {
        if (!c) return nullptr;
        while (c->next) c = c->next.get();
        return &c->value;
    }

    // ==================================================================
    // Add / Upsert / Remove
    //
    // The cells before the change point are copied; the tail after it is
    // shared with the input chain.
    // ==================================================================

    static ptr add(const ptr& b, const T& v) {
        LESS less{};
        EQUAL eq{};
        std::vector<const cell_t*> path;
        ptr cur = b;
        while (cur) {
            const cell_t* c = cur.get();
            if (std::addressof(c->value) == std::addressof(v)) return b;
            if (eq(c->value, v)) return b;
            if (less(v, c->value)) break;
            path.push_back(c);
            cur = c->next;
        }
        return rebuild_(path, make(v, std::move(cur)));
    }

    static ptr upsert(const ptr& b, const T& v) {
        LESS less{};
        EQUAL eq{};
        std::vector<const cell_t*> path;
        ptr cur = b;
        while (cur) {
            const cell_t* c = cur.get();
            if (eq(c->value, v))
                return rebuild_(path, make(v, c->next));
            if (less(v, c->value)) break;
            path.push_back(c);
            cur = c->next;
        }
        return rebuild_(path, make(v, std::move(cur)));
    }

    template<typename Q>
    static ptr remove(const ptr& b, const Q& probe) {
        LESS less{};
        EQUAL eq{};
        std::vector<const cell_t*> path;
        for (const cell_t* c = b.get(); c; c = c->next.get()) {
            if (eq(c->value, probe)) return rebuild_(path, c->next);
            if (less(probe, c->value)) return b;
            path.push_back(c);
        }
        return b;
    }

    // ==================================================================
    // Sorted merges
    // ==================================================================

    static ptr union_of(const ptr& a, const ptr& b) {
        if (a == b || !b) return a;
        if (!a) return b;
        LESS less{};
        std::vector<const T*> out;
        const cell_t* x = a.get();
        const cell_t* y = b.get();
        while (x && y) {
            if (less(x->value, y->value))      { out.push_back(&x->value); x = x->next.get(); }
            else if (less(y->value, x->value)) { out.push_back(&y->value); y = y->next.get(); }
            else { out.push_back(&x->value); x = x->next.get(); y = y->next.get(); }
        }
        for (; x; x = x->next.get()) out.push_back(&x->value);
        for (; y; y = y->next.get()) out.push_back(&y->value);
        if (out.size() == count(a)) return a;
        if (out.size() == count(b)) return b;
        return from_values_(out);
    }

    static ptr intersect_of(const ptr& a, const ptr& b) {
        if (a == b) return a;
        if (!a || !b) return nullptr;
        LESS less{};
        std::vector<const T*> out;
        const cell_t* x = a.get();
        const cell_t* y = b.get();
        while (x && y) {
            if (less(x->value, y->value))      x = x->next.get();
            else if (less(y->value, x->value)) y = y->next.get();
            else { out.push_back(&x->value); x = x->next.get(); y = y->next.get(); }
        }
        if (out.empty()) return nullptr;
        if (out.size() == count(a)) return a;
        if (out.size() == count(b)) return b;
        return from_values_(out);
    }

    static ptr difference_of(const ptr& a, const ptr& b) {
        if (a == b) return nullptr;
        if (!a || !b) return a;
        LESS less{};
        std::vector<const T*> out;
        const cell_t* x = a.get();
        const cell_t* y = b.get();
        while (x && y) {
            if (less(x->value, y->value))      { out.push_back(&x->value); x = x->next.get(); }
            else if (less(y->value, x->value)) y = y->next.get();
            else { x = x->next.get(); y = y->next.get(); }
        }
        for (; x; x = x->next.get()) out.push_back(&x->value);
        if (out.empty()) return nullptr;
        if (out.size() == count(a)) return a;
        return from_values_(out);
    }

    // ==================================================================
    // Traversal
    // ==================================================================

    template<typename Fn>
    static void for_each(const cell_t* c, Fn&& fn) {
        for (; c; c = c->next.get()) fn(c->value);
    }

    template<typename Fn>
    static void for_each_back(const cell_t* c, Fn&& fn) {
        std::vector<const T*> vals;
        for (; c; c = c->next.get()) vals.push_back(&c->value);
        for (auto it = vals.rbegin(); it != vals.rend(); ++it) fn(**it);
    }

    template<typename S, typename Fn>
    static S fold(const cell_t* c, S state, Fn&& fn) {
        for (; c; c = c->next.get()) state = fn(std::move(state), c->value);
        return state;
    }

    template<typename S, typename Fn>
    static S fold_back(const cell_t* c, S state, Fn&& fn) {
        std::vector<const T*> vals;
        for (; c; c = c->next.get()) vals.push_back(&c->value);
        for (auto it = vals.rbegin(); it != vals.rend(); ++it)
            state = fn(**it, std::move(state));
        return state;
    }

    // Non-empty, strictly ascending, every element satisfies pred.
    template<typename Pred>
    static bool check(const ptr& b, Pred&& pred) {
        if (!b) return false;
        LESS less{};
        const T* prev = nullptr;
        for (const cell_t* c = b.get(); c; c = c->next.get()) {
            if (prev && !less(*prev, c->value)) return false;
            if (!pred(c->value)) return false;
            prev = &c->value;
        }
        return true;
    }

private:
    static ptr rebuild_(const std::vector<const cell_t*>& path, ptr tail) {
        for (auto it = path.rbegin(); it != path.rend(); ++it)
            tail = make((*it)->value, std::move(tail));
        return tail;
    }

    static ptr from_values_(const std::vector<const T*>& vals) {
        ptr out;
        for (auto it = vals.rbegin(); it != vals.rend(); ++it)
            out = make(**it, std::move(out));
        return out;
    }
};

} // namespace pattrie

#endif // PATTRIE_BUCKET_HPP
