#ifndef PATTRIE_SUPPORT_HPP
#define PATTRIE_SUPPORT_HPP

#include <cstdint>
#include <cstddef>
#include <bit>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <cassert>

// Initial capacity of the explicit stacks used by count / fold / cursors.
#ifndef PATTRIE_TRAVERSAL_RESERVE
#define PATTRIE_TRAVERSAL_RESERVE 64
#endif

namespace pattrie {

// ==========================================================================
// Constants
// ==========================================================================

inline constexpr size_t TRAVERSAL_RESERVE = PATTRIE_TRAVERSAL_RESERVE;
inline constexpr int    KEY_BITS          = 32;

// ==========================================================================
// Bit operations  (big-endian Patricia trie)
//
// A branch routes on a single mask bit m. Its stored prefix keeps the key
// bits above m, clears m, and sets every bit below m:
//
//   prefix = (k | (m - 1)) & ~m
//
// Two keys share a branch iff they produce the same prefix for its mask.
// ==========================================================================

inline constexpr bool zero_bit(uint32_t k, uint32_t m) noexcept {
    return (k & m) == 0;
}

inline constexpr uint32_t mask_prefix(uint32_t k, uint32_t m) noexcept {
    return (k | (m - 1)) & ~m;
}

inline constexpr bool match_prefix(uint32_t k, uint32_t p, uint32_t m) noexcept {
    return mask_prefix(k, m) == p;
}

// Highest bit at which p0 and p1 disagree, as a single-bit mask.
inline constexpr uint32_t branching_bit(uint32_t p0, uint32_t p1) noexcept {
    return std::bit_floor(p0 ^ p1);
}

static_assert(branching_bit(0b1000u, 0b1011u) == 0b10u);
static_assert(mask_prefix(0b1010'0110u, 0b100u) == 0b1010'0011u);

// 64-bit hashes are folded so both halves contribute to the trie key.
inline constexpr uint32_t fold_hash(size_t h) noexcept {
    uint64_t w = static_cast<uint64_t>(h);
    return static_cast<uint32_t>(w ^ (w >> 32));
}

// ==========================================================================
// Key operations
//
// Keys are stored as their raw unsigned bit pattern. Signed keys are NOT
// remapped, so negative keys order after all non-negative keys.
// ==========================================================================

template<typename KEY>
struct key_ops {
    static_assert(std::is_integral_v<KEY>, "KEY must be integral");
    static_assert(!std::is_same_v<KEY, bool>, "KEY must not be bool");
    static_assert(static_cast<int>(sizeof(KEY) * 8) <= KEY_BITS, "KEY must be at most 32 bits");

    using UK = std::make_unsigned_t<KEY>;

    static constexpr uint32_t to_internal(KEY k) noexcept {
        return static_cast<uint32_t>(static_cast<UK>(k));
    }

    static constexpr KEY to_key(uint32_t ik) noexcept {
        return static_cast<KEY>(static_cast<UK>(ik));
    }
};

// ==========================================================================
// Node layout
//
// Empty  : null node_ptr
// Leaf   : header{key, 0} + payload
// Branch : header{prefix, mask} + two non-null children
//
// mask == 0 tags a leaf (a branch mask always has exactly one bit set).
// Nodes are never modified after construction; subtrees are shared between
// versions through reference counting.
// ==========================================================================

struct node_header {
    uint32_t prefix;   // leaf: full key
    uint32_t mask;     // leaf: 0

    node_header(uint32_t p, uint32_t m) noexcept : prefix(p), mask(m) {}

    bool is_leaf() const noexcept { return mask == 0; }
};

using node_ptr = std::shared_ptr<const node_header>;

template<typename PAYLOAD>
struct leaf_node : node_header {
    PAYLOAD payload;

    leaf_node(uint32_t key, PAYLOAD p)
        : node_header(key, 0), payload(std::move(p)) {}
};

struct branch_node : node_header {
    node_ptr left;
    node_ptr right;

    branch_node(uint32_t p, uint32_t m, node_ptr l, node_ptr r) noexcept
        : node_header(p, m), left(std::move(l)), right(std::move(r)) {}
};

template<typename PAYLOAD>
inline const leaf_node<PAYLOAD>* as_leaf(const node_header* n) noexcept {
    assert(n && n->is_leaf());
    return static_cast<const leaf_node<PAYLOAD>*>(n);
}

inline const branch_node* as_branch(const node_header* n) noexcept {
    assert(n && !n->is_leaf());
    return static_cast<const branch_node*>(n);
}

// ==========================================================================
// Payload traits
//
// weight(): number of entries a leaf payload stands for. One for the integer
// map; the chain length for collision buckets (specialized there).
// ==========================================================================

template<typename PAYLOAD>
struct payload_traits {
    static size_t weight(const PAYLOAD&) noexcept { return 1; }
};

// ==========================================================================
// Result types
// ==========================================================================

struct insert_result_t {
    node_ptr       node;
    std::ptrdiff_t delta;    // change in entry count
};

struct erase_result_t {
    node_ptr       node;     // null when the subtree became empty
    std::ptrdiff_t delta;
};

// Outcome of shrinking a leaf payload during erase.
//   changed == false            : key absent, leaf kept by identity
//   changed && !payload         : leaf dropped
//   changed &&  payload         : leaf replaced
template<typename PAYLOAD>
struct shrink_result_t {
    bool                   changed;
    std::optional<PAYLOAD> payload;
};

// Outcome of combining two leaf payloads with the same key in a merge.
template<typename PAYLOAD>
struct combine_result_t {
    enum class source : uint8_t { left, right, fresh, none };
    source                 from;
    std::optional<PAYLOAD> payload;   // set only for fresh

    static combine_result_t take_left()  { return {source::left, std::nullopt}; }
    static combine_result_t take_right() { return {source::right, std::nullopt}; }
    static combine_result_t drop()       { return {source::none, std::nullopt}; }
    static combine_result_t make(PAYLOAD p) { return {source::fresh, std::move(p)}; }
};

} // namespace pattrie

#endif // PATTRIE_SUPPORT_HPP
