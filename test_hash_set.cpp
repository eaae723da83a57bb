#include "pattrie_hash_set.hpp"
#include "pattrie_hash_map.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <random>
#include <set>
#include <map>

using namespace pattrie;

// Few distinct hashes so most leaves hold collision buckets.
struct mod_hash {
    size_t operator()(int v) const { return static_cast<size_t>(v) % 5; }
};

using coll_set = hash_set<int, mod_hash>;

template<typename S>
static std::set<int> as_std(const S& s) {
    std::set<int> out;
    s.for_each([&](int v) { out.insert(v); });
    return out;
}

void test_basic_insert_contains() {
    std::cout << "test_basic_insert_contains... ";

    hash_set<std::string> s;
    assert(s.empty());
    assert(s.size() == 0);

    auto s1 = s.insert("red").insert("green").insert("blue");
    assert(s1.size() == 3);
    assert(s1.contains("red"));
    assert(s1.contains("blue"));
    assert(!s1.contains("cyan"));
    assert(s.empty());

    // Adding a present element returns the same root
    auto s2 = s1.insert("green");
    assert(s2.same_root(s1));
    assert(s2.size() == 3);

    assert(s1.check_invariants());

    auto one = hash_set<std::string>::singleton("x");
    assert(one.size() == 1);
    assert(one.contains("x"));

    std::cout << "PASSED\n";
}

void test_collisions() {
    std::cout << "test_collisions... ";

    coll_set s;
    for (int i = 0; i < 100; ++i) s = s.insert(i);
    assert(s.size() == 100);
    for (int i = 0; i < 100; ++i) assert(s.contains(i));
    assert(!s.contains(100));
    assert(s.check_invariants());

    auto st = s.debug_stats();
    assert(st.leaves == 5);
    assert(st.collision_leaves == 5);
    assert(st.total_entries == 100);

    // Idempotent insert inside a bucket
    assert(s.insert(42).same_root(s));

    std::cout << "PASSED\n";
}

void test_erase() {
    std::cout << "test_erase... ";

    coll_set s;
    for (int i = 0; i < 50; ++i) s = s.insert(i);

    auto s2 = s.erase(10);
    assert(s2.size() == 49);
    assert(!s2.contains(10));
    assert(s2.contains(15));
    assert(s.contains(10));
    assert(s2.check_invariants());

    // Absent element: same root
    assert(s2.erase(10).same_root(s2));
    assert(s2.erase(1000).same_root(s2));

    // Empty a whole bucket: hash 0 holds 0,5,...,45
    auto s3 = s;
    for (int i = 0; i < 50; i += 5) s3 = s3.erase(i);
    assert(s3.size() == 40);
    assert(s3.debug_stats().leaves == 4);
    assert(s3.check_invariants());

    for (int i = 0; i < 50; ++i) s3 = s3.erase(i);
    assert(s3.empty());

    std::cout << "PASSED\n";
}

void test_bulk_and_errors() {
    std::cout << "test_bulk_and_errors... ";

    const int data[] = {3, 1, 4, 1, 5, 9, 2, 6};
    auto s = hash_set<int>::of_array(data, 8);
    assert(s.size() == 7);

    std::vector<int> v = {7, 8, 7};
    auto r = hash_set<int>::of_range(v.begin(), v.end());
    assert(r.size() == 2);

    bool threw = false;
    try {
        (void)hash_set<int>::of_array(nullptr, 2);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(hash_set<int>::of_array(nullptr, 0).empty());

    threw = false;
    try {
        (void)hash_set<int>().first();
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)s.find([](int x) { return x > 100; });
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_queries() {
    std::cout << "test_queries... ";

    coll_set s;
    for (int i = 1; i <= 20; ++i) s = s.insert(i);

    // Ascending hash, then ascending value within a bucket
    std::vector<int> expected;
    for (int h = 0; h < 5; ++h)
        for (int i = 1; i <= 20; ++i)
            if (i % 5 == h) expected.push_back(i);
    assert(s.to_vector() == expected);

    assert(s.first() == 5);
    assert(s.last() == 19);

    assert(s.try_find([](int x) { return x % 7 == 0; }) == std::optional<int>(7));
    assert(!s.try_find([](int x) { return x > 20; }));
    assert(s.find([](int x) { return x > 18; }) == 20);
    assert(s.exists([](int x) { return x == 13; }));
    assert(!s.exists([](int x) { return x == 0; }));
    assert(s.forall([](int x) { return x >= 1 && x <= 20; }));
    assert(!s.forall([](int x) { return x < 20; }));

    int sum = s.fold(0, [](int acc, int x) { return acc + x; });
    assert(sum == 210);

    std::vector<int> back = s.fold_back(std::vector<int>(), [](int x, std::vector<int> acc) {
        acc.push_back(x);
        return acc;
    });
    assert(std::vector<int>(back.rbegin(), back.rend()) == expected);

    std::cout << "PASSED\n";
}

void test_set_algebra() {
    std::cout << "test_set_algebra... ";

    std::mt19937 rng(777);
    std::uniform_int_distribution<int> dist(0, 400);

    for (int round = 0; round < 20; ++round) {
        coll_set a;
        coll_set b;
        std::set<int> ra;
        std::set<int> rb;
        for (int i = 0; i < 120; ++i) {
            int x = dist(rng);
            a = a.insert(x);
            ra.insert(x);
            int y = dist(rng);
            b = b.insert(y);
            rb.insert(y);
        }

        std::set<int> ru = ra;
        ru.insert(rb.begin(), rb.end());
        std::set<int> ri;
        std::set<int> rd;
        for (int x : ra) {
            if (rb.count(x)) ri.insert(x);
            else rd.insert(x);
        }

        auto u = a.union_with(b);
        auto i = a.intersect_with(b);
        auto d = a.difference_with(b);

        assert(as_std(u) == ru && u.size() == ru.size() && u.check_invariants());
        assert(as_std(i) == ri && i.size() == ri.size() && i.check_invariants());
        assert(as_std(d) == rd && d.size() == rd.size() && d.check_invariants());

        assert(i.is_subset_of(a) && i.is_subset_of(b));
        assert(a.is_subset_of(u) && u.is_superset_of(b));
    }

    std::cout << "PASSED\n";
}

void test_set_algebra_identity() {
    std::cout << "test_set_algebra_identity... ";

    hash_set<int> a;
    for (int i = 0; i < 64; ++i) a = a.insert(i);
    auto sub = a.erase(3).erase(40);
    hash_set<int> empty;

    assert(a.union_with(a).same_root(a));
    assert(a.union_with(sub).same_root(a));
    assert(a.union_with(empty).same_root(a));
    assert(empty.union_with(a).same_root(a));

    assert(a.intersect_with(a).same_root(a));
    assert(a.intersect_with(empty).empty());

    assert(a.difference_with(a).empty());
    assert(a.difference_with(empty).same_root(a));

    auto d = a.difference_with(sub);
    assert(d.size() == 2);
    assert(d.contains(3) && d.contains(40));

    std::cout << "PASSED\n";
}

void test_subset_relations() {
    std::cout << "test_subset_relations... ";

    auto a = coll_set().insert(1).insert(2).insert(3);
    auto b = a.insert(4);

    assert(a.is_subset_of(b));
    assert(a.is_proper_subset_of(b));
    assert(a.is_subset_of(a));
    assert(!a.is_proper_subset_of(a));
    assert(b.is_superset_of(a));
    assert(b.is_proper_superset_of(a));
    assert(!a.is_superset_of(b));
    assert(coll_set().is_subset_of(a));

    auto c = a.insert(9);
    assert(!c.is_subset_of(b));
    assert(!b.is_subset_of(c));

    assert(a == coll_set().insert(3).insert(2).insert(1));
    assert(!(a == b));

    std::cout << "PASSED\n";
}

void test_many() {
    std::cout << "test_many... ";

    std::vector<hash_set<int>> sets;
    for (int k = 2; k <= 4; ++k) {
        hash_set<int> s;
        for (int i = 0; i <= 24; i += k) s = s.insert(i);
        sets.push_back(s);
    }

    auto u = hash_set<int>::union_many(sets.begin(), sets.end());
    auto i = hash_set<int>::intersect_many(sets.begin(), sets.end());

    // multiples of 2, 3 or 4 in [0, 24]
    std::set<int> ru;
    for (int x = 0; x <= 24; ++x)
        if (x % 2 == 0 || x % 3 == 0) ru.insert(x);
    assert(as_std(u) == ru);
    assert(as_std(i) == std::set<int>({0, 12, 24}));

    std::vector<hash_set<int>> none;
    assert(hash_set<int>::union_many(none.begin(), none.end()).empty());
    assert(hash_set<int>::intersect_many(none.begin(), none.end()).empty());

    std::cout << "PASSED\n";
}

void test_hash_map() {
    std::cout << "test_hash_map... ";

    struct str_len_hash {
        size_t operator()(const std::string& s) const { return s.size(); }
    };
    using map_t = hash_map<std::string, int, str_len_hash>;

    map_t m;
    assert(m.empty());
    m = m.insert("ab", 1).insert("cd", 2).insert("xyz", 3).insert("ef", 4);
    assert(m.size() == 4);
    assert(m.at("cd") == 2);
    assert(m.try_find("xyz") == std::optional<int>(3));
    assert(!m.try_find("q"));
    assert(m.find_value("zz") == nullptr);
    assert(m.contains("ef"));
    assert(m.check_invariants());
    assert(m.debug_stats().collision_leaves == 1);

    // Replace keeps the size
    auto m2 = m.insert("cd", 20);
    assert(m2.size() == 4);
    assert(m2.at("cd") == 20);
    assert(m.at("cd") == 2);

    auto m3 = m2.erase("ab");
    assert(m3.size() == 3);
    assert(!m3.contains("ab"));
    assert(m3.erase("nope").same_root(m3));
    assert(m3.check_invariants());

    bool threw = false;
    try {
        (void)m3.at("ab");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    int total = m2.fold(0, [](int acc, const std::string&, int v) { return acc + v; });
    assert(total == 1 + 20 + 3 + 4);

    std::vector<std::pair<std::string, int>> pairs = m2.to_vector();
    std::map<std::string, int> got(pairs.begin(), pairs.end());
    assert(got == (std::map<std::string, int>{{"ab", 1}, {"cd", 20}, {"ef", 4}, {"xyz", 3}}));

    auto m4 = map_t::of_range(pairs.begin(), pairs.end());
    assert(m4.size() == 4);
    assert(m4.at("xyz") == 3);

    std::cout << "PASSED\n";
}

void test_stress() {
    std::cout << "test_stress... ";

    hash_set<uint64_t> s;
    std::set<uint64_t> ref;
    std::mt19937_64 rng(4242);

    for (int i = 0; i < 20000; ++i) {
        uint64_t x = rng() % 30000;
        if (rng() % 3 == 0) {
            s = s.erase(x);
            ref.erase(x);
        } else {
            s = s.insert(x);
            ref.insert(x);
        }
    }

    assert(s.size() == ref.size());
    for (uint64_t x : ref) assert(s.contains(x));
    assert(s.check_invariants());

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== pattrie hash_set / hash_map tests ===\n\n";

    test_basic_insert_contains();
    test_collisions();
    test_erase();
    test_bulk_and_errors();
    test_queries();
    test_set_algebra();
    test_set_algebra_identity();
    test_subset_relations();
    test_many();
    test_hash_map();
    test_stress();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
