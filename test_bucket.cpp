#include "pattrie_bucket.hpp"
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

int fails = 0;
void check(bool c, const char* msg, int line) {
    if (!c) { std::printf("  FAIL line %d: %s\n", line, msg); ++fails; }
}
#define CHECK(c) check((c), #c, __LINE__)

using BKO = pattrie::bucket_ops<int, std::less<int>, std::equal_to<int>>;
using bucket = pattrie::bucket_ptr<int>;

static bucket of(std::initializer_list<int> vals) {
    bucket b;
    for (int v : vals) b = BKO::add(b, v);
    return b;
}

static std::vector<int> values(const bucket& b) {
    std::vector<int> out;
    BKO::for_each(b.get(), [&](int v) { out.push_back(v); });
    return out;
}

void test_add() {
    std::printf("add...\n");
    bucket b = of({5, 1, 3});
    CHECK(values(b) == std::vector<int>({1, 3, 5}));
    CHECK(BKO::count(b) == 3);

    // Present element: same chain
    CHECK(BKO::add(b, 3) == b);

    // Same object already in the chain
    CHECK(BKO::add(b, b->value) == b);

    // Insert at the tail shares nothing; at the head shares the whole chain
    bucket head = BKO::add(b, 0);
    CHECK(head->next == b);
    CHECK(values(head) == std::vector<int>({0, 1, 3, 5}));

    // Insert in the middle shares the tail after the insertion point
    bucket mid = BKO::add(b, 4);
    CHECK(values(mid) == std::vector<int>({1, 3, 4, 5}));
    CHECK(mid->next->next->next == b->next->next);

    // Input chain unchanged
    CHECK(values(b) == std::vector<int>({1, 3, 5}));
}

void test_find_contains() {
    std::printf("find / contains...\n");
    bucket b = of({2, 4, 6});
    CHECK(BKO::contains(b, 4));
    CHECK(!BKO::contains(b, 5));
    CHECK(!BKO::contains(b, 7));
    CHECK(!BKO::contains(bucket(), 1));
    const int* p = BKO::find(b, 6);
    CHECK(p && *p == 6);
    CHECK(BKO::find(b, 1) == nullptr);
}

void test_remove() {
    std::printf("remove...\n");
    bucket b = of({1, 2, 3});

    CHECK(BKO::remove(b, 9) == b);
    CHECK(BKO::remove(b, 0) == b);

    bucket r = BKO::remove(b, 2);
    CHECK(values(r) == std::vector<int>({1, 3}));
    CHECK(r->next == b->next->next);

    bucket one = of({7});
    CHECK(BKO::remove(one, 7) == nullptr);
    CHECK(BKO::remove(bucket(), 7) == nullptr);
}

struct entry_less {
    bool operator()(const std::pair<int, std::string>& a,
                    const std::pair<int, std::string>& b) const { return a.first < b.first; }
};
struct entry_equal {
    bool operator()(const std::pair<int, std::string>& a,
                    const std::pair<int, std::string>& b) const { return a.first == b.first; }
};

void test_upsert() {
    std::printf("upsert...\n");
    using EO = pattrie::bucket_ops<std::pair<int, std::string>, entry_less, entry_equal>;
    auto b = EO::upsert(nullptr, {2, "two"});
    b = EO::upsert(b, {1, "one"});
    b = EO::upsert(b, {3, "three"});
    auto b2 = EO::upsert(b, {2, "TWO"});

    CHECK(EO::count(b2) == 3);
    CHECK(EO::find(b2, std::make_pair(2, std::string()))->second == "TWO");
    CHECK(EO::find(b, std::make_pair(2, std::string()))->second == "two");
    // Tail after the replaced cell is shared
    CHECK(b2->next->next == b->next->next);
}

void test_merges() {
    std::printf("merges...\n");
    bucket a = of({1, 3, 5, 7});
    bucket b = of({3, 4, 5});
    bucket sub = of({3, 7});

    CHECK(values(BKO::union_of(a, b)) == std::vector<int>({1, 3, 4, 5, 7}));
    CHECK(BKO::union_of(a, sub) == a);
    CHECK(BKO::union_of(sub, a) == a);
    CHECK(BKO::union_of(a, nullptr) == a);
    CHECK(BKO::union_of(nullptr, b) == b);

    CHECK(values(BKO::intersect_of(a, b)) == std::vector<int>({3, 5}));
    CHECK(BKO::intersect_of(a, sub) == sub);
    CHECK(BKO::intersect_of(a, of({2, 4})) == nullptr);
    CHECK(BKO::intersect_of(a, a) == a);

    CHECK(values(BKO::difference_of(a, b)) == std::vector<int>({1, 7}));
    CHECK(BKO::difference_of(a, of({2, 4})) == a);
    CHECK(BKO::difference_of(sub, a) == nullptr);
    CHECK(BKO::difference_of(a, a) == nullptr);
    CHECK(BKO::difference_of(a, nullptr) == a);
}

void test_traversal() {
    std::printf("traversal...\n");
    bucket b = of({4, 2, 8, 6});

    std::vector<int> back;
    BKO::for_each_back(b.get(), [&](int v) { back.push_back(v); });
    CHECK(back == std::vector<int>({8, 6, 4, 2}));

    std::string f = BKO::fold(b.get(), std::string(), [](std::string s, int v) {
        return s + std::to_string(v);
    });
    CHECK(f == "2468");
    std::string fb = BKO::fold_back(b.get(), std::string(), [](int v, std::string s) {
        return s + std::to_string(v);
    });
    CHECK(fb == "8642");

    CHECK(*BKO::first(b.get()) == 2);
    CHECK(*BKO::last(b.get()) == 8);
    CHECK(BKO::first(nullptr) == nullptr);
    CHECK(BKO::last(nullptr) == nullptr);

    CHECK(pattrie::payload_traits<bucket>::weight(b) == 4);
}

void test_check() {
    std::printf("check...\n");
    auto any = [](int) { return true; };
    CHECK(BKO::check(of({1, 2, 3}), any));
    CHECK(!BKO::check(bucket(), any));

    // Hand-built chains bypassing add
    bucket unsorted = BKO::make(3, BKO::make(1));
    CHECK(!BKO::check(unsorted, any));
    bucket dup = BKO::make(1, BKO::make(1));
    CHECK(!BKO::check(dup, any));

    CHECK(!BKO::check(of({1, 2}), [](int v) { return v < 2; }));
}

int main() {
    test_add();
    test_find_contains();
    test_remove();
    test_upsert();
    test_merges();
    test_traversal();
    test_check();

    std::printf("\nBucket tests: %s (%d fails)\n", fails ? "FAIL" : "PASS", fails);
    return fails ? 1 : 0;
}
