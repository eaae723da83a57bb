#include "pattrie.hpp"
#include "pattrie_hash_set.hpp"
#include "lru_cache.hpp"

#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <map>
#include <unordered_map>
#include <vector>
#include <random>
#include <numeric>
#include <algorithm>
#include <string>

static double now_ms() {
    using clk = std::chrono::steady_clock;
    static auto t0 = clk::now();
    return std::chrono::duration<double, std::milli>(clk::now() - t0).count();
}

template<typename T>
static void do_not_optimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}

static size_t rss_bytes() {
    FILE* f = std::fopen("/proc/self/statm", "r");
    if (!f) return 0;
    unsigned long pages = 0;
    if (std::fscanf(f, "%*lu %lu", &pages) != 1) pages = 0;
    std::fclose(f);
    return pages * 4096UL;
}

struct Result {
    const char* name;
    double insert_ms;
    double read_ms;
    double erase_ms;
    size_t memory_bytes;
};

static void print_header() {
    std::printf("%-20s %12s %12s %12s %12s %12s %12s %12s\n",
                "Container", "Insert(ms)", "Read(ms)", "Erase(ms)", "Memory(KB)",
                "Ins rel", "Read rel", "Erase rel");
    std::printf("%-20s %12s %12s %12s %12s %12s %12s %12s\n",
                "--------------------", "----------", "----------", "----------",
                "----------", "----------", "----------", "----------");
}

static void print_row(const Result& r, const Result& base) {
    double ins_rel   = r.insert_ms / base.insert_ms;
    double read_rel  = r.read_ms   / base.read_ms;
    double erase_rel = base.erase_ms > 0 ? r.erase_ms / base.erase_ms : 0;
    std::printf("%-20s %12.2f %12.2f %12.2f %12.1f %11.2fx %11.2fx %11.2fx\n",
                r.name, r.insert_ms, r.read_ms, r.erase_ms,
                r.memory_bytes / 1024.0, ins_rel, read_rel, erase_rel);
}

using LookupRounds = std::vector<std::vector<uint32_t>>;

static Result bench_int_map(const std::vector<uint32_t>& keys,
                            const LookupRounds& rounds) {
    Result res{"pattrie::int_map", 0, 0, 0, 0};
    size_t rss0 = rss_bytes();
    pattrie::int_map<uint32_t, uint32_t> m;

    double t0 = now_ms();
    for (auto k : keys) m = m.insert(k, k);
    res.insert_ms = now_ms() - t0;

    if (m.size() != keys.size())
        std::fprintf(stderr, "int_map: size mismatch %zu vs %zu\n", m.size(), keys.size());

    size_t rss1 = rss_bytes();
    res.memory_bytes = (rss1 > rss0) ? (rss1 - rss0) : 0;

    uint64_t checksum = 0;
    double t1 = now_ms();
    for (auto& lk : rounds) {
        for (auto k : lk) {
            auto* v = m.find_value(k);
            checksum += v ? *v : 0;
        }
    }
    res.read_ms = (now_ms() - t1) / static_cast<int>(rounds.size());
    do_not_optimize(checksum);

    auto st = m.debug_stats();
    std::printf("int_map: %zu leaves, %zu branches, max depth %zu\n",
                st.leaves, st.branches, st.max_depth);

    double t2 = now_ms();
    for (auto k : rounds[0]) m = m.erase(k);
    res.erase_ms = now_ms() - t2;
    if (!m.empty())
        std::fprintf(stderr, "int_map: not empty after erase, %zu remaining\n", m.size());
    return res;
}

static Result bench_hash_set(const std::vector<uint32_t>& keys,
                             const LookupRounds& rounds) {
    Result res{"pattrie::hash_set", 0, 0, 0, 0};
    size_t rss0 = rss_bytes();
    pattrie::hash_set<uint32_t> s;

    double t0 = now_ms();
    for (auto k : keys) s = s.insert(k);
    res.insert_ms = now_ms() - t0;

    size_t rss1 = rss_bytes();
    res.memory_bytes = (rss1 > rss0) ? (rss1 - rss0) : 0;

    uint64_t checksum = 0;
    double t1 = now_ms();
    for (auto& lk : rounds)
        for (auto k : lk) checksum += s.contains(k);
    res.read_ms = (now_ms() - t1) / static_cast<int>(rounds.size());
    do_not_optimize(checksum);

    double t2 = now_ms();
    for (auto k : rounds[0]) s = s.erase(k);
    res.erase_ms = now_ms() - t2;
    return res;
}

static Result bench_stdmap(const std::vector<uint32_t>& keys,
                           const LookupRounds& rounds) {
    Result res{"std::map", 0, 0, 0, 0};
    size_t rss0 = rss_bytes();
    std::map<uint32_t, uint32_t> m;

    double t0 = now_ms();
    for (auto k : keys) m.emplace(k, k);
    res.insert_ms = now_ms() - t0;

    size_t rss1 = rss_bytes();
    res.memory_bytes = (rss1 > rss0) ? (rss1 - rss0) : (m.size() * 48);

    uint64_t checksum = 0;
    double t1 = now_ms();
    for (auto& lk : rounds) {
        for (auto k : lk) {
            auto it = m.find(k);
            checksum += (it != m.end()) ? it->second : 0;
        }
    }
    res.read_ms = (now_ms() - t1) / static_cast<int>(rounds.size());
    do_not_optimize(checksum);

    double t2 = now_ms();
    for (auto k : rounds[0]) m.erase(k);
    res.erase_ms = now_ms() - t2;
    return res;
}

static Result bench_unorderedmap(const std::vector<uint32_t>& keys,
                                 const LookupRounds& rounds) {
    Result res{"std::unordered_map", 0, 0, 0, 0};
    size_t rss0 = rss_bytes();
    std::unordered_map<uint32_t, uint32_t> m;
    m.reserve(keys.size());

    double t0 = now_ms();
    for (auto k : keys) m.emplace(k, k);
    res.insert_ms = now_ms() - t0;

    size_t rss1 = rss_bytes();
    res.memory_bytes = (rss1 > rss0) ? (rss1 - rss0) : (m.size() * 32 + m.bucket_count() * 8);

    uint64_t checksum = 0;
    double t1 = now_ms();
    for (auto& lk : rounds) {
        for (auto k : lk) {
            auto it = m.find(k);
            checksum += (it != m.end()) ? it->second : 0;
        }
    }
    res.read_ms = (now_ms() - t1) / static_cast<int>(rounds.size());
    do_not_optimize(checksum);

    double t2 = now_ms();
    for (auto k : rounds[0]) m.erase(k);
    res.erase_ms = now_ms() - t2;
    return res;
}

// Half-capacity cache: every insert past the midpoint evicts.
static void bench_lru(const std::vector<uint32_t>& keys) {
    uint32_t cap = static_cast<uint32_t>(std::max<size_t>(keys.size() / 2, 1));
    pattrie::lru_cache<uint32_t, uint32_t> c(cap);

    double t0 = now_ms();
    for (auto k : keys) c = c.insert(k, k);
    double ins = now_ms() - t0;

    size_t hits = 0;
    double t1 = now_ms();
    for (auto k : keys) {
        auto [v, next] = c.try_find(k);
        if (v) ++hits;
        c = std::move(next);
    }
    double look = now_ms() - t1;

    std::printf("\nlru_cache (capacity %u): insert %.2f ms, try_find %.2f ms, %zu hits\n",
                cap, ins, look, hits);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <N> [pattern] [read_iters]\n", argv[0]);
        return 1;
    }

    size_t n = std::strtoull(argv[1], nullptr, 10);
    if (n == 0) return 1;

    std::string pattern = (argc >= 3) ? argv[2] : "random";
    int read_iters = 0;
    if (argc >= 4) read_iters = std::atoi(argv[3]);
    if (read_iters <= 0) {
        if      (n <= 1000)    read_iters = 5000;
        else if (n <= 10000)   read_iters = 500;
        else if (n <= 100000)  read_iters = 50;
        else if (n <= 1000000) read_iters = 5;
        else                   read_iters = 1;
    }

    std::vector<uint32_t> keys(n);
    std::mt19937 rng(42);

    if (pattern == "sequential") {
        std::iota(keys.begin(), keys.end(), 0u);
    } else if (pattern == "dense16") {
        for (size_t i = 0; i < n; ++i)
            keys[i] = 0x1234'0000u + static_cast<uint32_t>(rng() % (n * 2));
    } else {
        for (size_t i = 0; i < n; ++i) keys[i] = rng();
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    n = keys.size();
    std::shuffle(keys.begin(), keys.end(), rng);

    LookupRounds rounds(read_iters);
    for (int i = 0; i < read_iters; ++i) {
        rounds[i] = keys;
        std::shuffle(rounds[i].begin(), rounds[i].end(), rng);
    }

    std::printf("=== pattrie benchmark ===\nN = %zu unique keys, pattern = %s, read_iters = %d\n\n",
                n, pattern.c_str(), read_iters);

    Result r_trie = bench_int_map(keys, rounds);
    Result r_set  = bench_hash_set(keys, rounds);
    Result r_map  = bench_stdmap(keys, rounds);
    Result r_umap = bench_unorderedmap(keys, rounds);

    std::printf("\n");
    print_header();
    print_row(r_trie, r_trie);
    print_row(r_set,  r_trie);
    print_row(r_map,  r_trie);
    print_row(r_umap, r_trie);

    bench_lru(keys);
    return 0;
}
