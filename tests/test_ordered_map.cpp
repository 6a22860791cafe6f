/// @file test_ordered_map.cpp
/// @brief Unit tests for ordmap::OrderedMap: insertion, erase, lookup,
///        traversal and copy-on-write versions.

#include <ordmap/ordmap.hpp>

#include <gtest/gtest.h>

#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace ordmap;

using StringMap = OrderedMap<std::string, std::string>;
using CountMap = OrderedMap<std::string, int>;

namespace {

template <typename Map>
std::vector<typename Map::key_type> keys_of(const Map& m) {
    std::vector<typename Map::key_type> out;
    m.for_each([&out](const typename Map::key_type& k, const typename Map::mapped_type&) {
        out.push_back(k);
    });
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction and zero form
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, ZeroFormIsEmpty) {
    CountMap m;
    EXPECT_EQ(m.size(), 0u);
    EXPECT_TRUE(m.empty());
    EXPECT_FALSE(m.contains("a"));
    EXPECT_EQ(m.get("a"), 0);
    EXPECT_EQ(m.find("a"), nullptr);
    EXPECT_EQ(m.use_count(), 0);
    EXPECT_TRUE(m.keys().empty());
    EXPECT_TRUE(m.values().empty());
    EXPECT_EQ(m.begin(), m.end());
}

TEST(OrderedMap, ZeroFormFirstInsert) {
    CountMap m;
    auto n = m.set("a", 1);
    EXPECT_EQ(n.size(), 1u);
    EXPECT_EQ(n.get("a"), 1);
    EXPECT_EQ(m.size(), 0u);
}

TEST(OrderedMap, MakeAllocatesStorage) {
    auto m = CountMap::make();
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.use_count(), 1);
    EXPECT_EQ(m, CountMap());
}

TEST(OrderedMap, InitializerList) {
    CountMap m{{"z", 26}, {"a", 1}, {"m", 13}};
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"z", "a", "m"}));
}

TEST(OrderedMap, InitializerListDuplicateThrows) {
    EXPECT_THROW((CountMap{{"a", 1}, {"a", 2}}), KeyAlreadyExists);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Insertion
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, ThreeItemScenario) {
    auto m = StringMap()
                 .set("first item", "a")
                 .set("this is the second item", "b")
                 .set("3rd item", "c");
    ASSERT_EQ(m.size(), 3u);

    std::vector<std::pair<std::string, std::string>> seen;
    m.for_each([&seen](const std::string& k, const std::string& v) { seen.emplace_back(k, v); });
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], (std::pair<std::string, std::string>{"first item", "a"}));
    EXPECT_EQ(seen[1], (std::pair<std::string, std::string>{"this is the second item", "b"}));
    EXPECT_EQ(seen[2], (std::pair<std::string, std::string>{"3rd item", "c"}));

    auto u = m.unordered();
    EXPECT_EQ(u.size(), 3u);
    EXPECT_EQ(u.at("first item"), "a");
    EXPECT_EQ(u.at("this is the second item"), "b");
    EXPECT_EQ(u.at("3rd item"), "c");

    auto after = m.erase("this is the second item");
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(keys_of(after), (std::vector<std::string>{"first item", "3rd item"}));
    EXPECT_EQ(after.get("first item"), "a");
    EXPECT_EQ(after.get("3rd item"), "c");
}

TEST(OrderedMap, OrderFollowsInsertionNotKeyContent) {
    std::vector<std::string> keys = {"delta", "alpha", "charlie", "", "bravo", "10", "9"};
    CountMap m;
    int i = 0;
    for (const auto& k : keys) m = std::move(m).set(k, i++);
    EXPECT_EQ(keys_of(m), keys);
    EXPECT_EQ(m.keys(), keys);
    EXPECT_EQ(m.values(), (std::vector<int>{0, 1, 2, 3, 4, 5, 6}));
}

TEST(OrderedMap, DuplicateSetThrowsAndLeavesMapUnchanged) {
    auto m = CountMap().set("a", 1).set("b", 2);
    try {
        (void)m.set("a", 99);
        FAIL() << "expected KeyAlreadyExists";
    } catch (const KeyAlreadyExists& e) {
        EXPECT_EQ(e.key(), "a");
        EXPECT_EQ(e.code(), errc::key_already_exists);
        EXPECT_STREQ(e.what(), "key \"a\" already exists");
    }
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m.get("a"), 1);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));
}

TEST(OrderedMap, DuplicateSetOnRvalueLeavesContentsIntact) {
    auto m = CountMap().set("a", 1);
    EXPECT_THROW((void)std::move(m).set("a", 2), KeyAlreadyExists);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.get("a"), 1);
}

TEST(OrderedMap, DuplicateKeyRenderedForIntegerKeys) {
    auto m = OrderedMap<int, std::string>().set(42, "x");
    try {
        (void)m.set(42, "y");
        FAIL() << "expected KeyAlreadyExists";
    } catch (const KeyAlreadyExists& e) {
        EXPECT_EQ(e.key(), "42");
    }
}

TEST(OrderedMap, TrySetSuccess) {
    auto [m, ec] = CountMap().try_set("a", 1);
    EXPECT_FALSE(ec);
    EXPECT_EQ(m.get("a"), 1);
}

TEST(OrderedMap, TrySetCollision) {
    auto base = CountMap().set("a", 1);
    auto res = base.try_set("a", 2);
    EXPECT_FALSE(res);
    EXPECT_EQ(res.ec, errc::key_already_exists);
    EXPECT_EQ(res.value.get("a"), 1);
    EXPECT_EQ(res.value.size(), 1u);
}

TEST(OrderedMap, TrySetCollisionOnRvalueKeepsContents) {
    auto m = CountMap().set("a", 1).set("b", 2);
    auto res = std::move(m).try_set("b", 20);
    EXPECT_EQ(res.ec, errc::key_already_exists);
    EXPECT_EQ(res.value.size(), 2u);
    EXPECT_EQ(res.value.get("b"), 2);
    EXPECT_EQ(keys_of(res.value), (std::vector<std::string>{"a", "b"}));
}

TEST(OrderedMap, MustSetInserts) {
    auto m = CountMap().must_set("a", 1).must_set("b", 2);
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m.get("b"), 2);
}

TEST(OrderedMapDeathTest, MustSetDuplicateAborts) {
    auto m = CountMap().set("a", 1);
    EXPECT_DEATH((void)m.must_set("a", 2), "key \"a\" already exists");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Erase
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, EraseFirst) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3).erase("a");
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(m.index_of("b"), 0u);
    EXPECT_EQ(m.index_of("c"), 1u);
}

TEST(OrderedMap, EraseLast) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3).erase("c");
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(m.contains("c"));
}

TEST(OrderedMap, EraseMiddleRenumbersTail) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3).set("d", 4).erase("b");
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(m.index_of("a"), 0u);
    EXPECT_EQ(m.index_of("c"), 1u);
    EXPECT_EQ(m.index_of("d"), 2u);
    EXPECT_EQ(m.get("c"), 3);
    EXPECT_EQ(m.get("d"), 4);
    EXPECT_EQ(m.values(), (std::vector<int>{1, 3, 4}));
}

TEST(OrderedMap, EraseOnlyEntry) {
    auto m = CountMap().set("a", 1).erase("a");
    EXPECT_TRUE(m.empty());
    EXPECT_FALSE(m.contains("a"));
    EXPECT_EQ(m.begin(), m.end());
}

TEST(OrderedMap, EraseOnEmptyAndZeroForm) {
    CountMap zero;
    auto a = zero.erase("x");
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a.use_count(), 0);

    auto b = CountMap::make().erase("x");
    EXPECT_TRUE(b.empty());
}

TEST(OrderedMap, EraseAbsentIsNoOp) {
    auto m = CountMap().set("a", 1).set("b", 2);
    auto n = m.erase("zzz");
    EXPECT_EQ(n, m);
    EXPECT_EQ(n.size(), 2u);
}

TEST(OrderedMap, EraseIsIdempotent) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3);
    auto once = m.erase("b");
    auto twice = once.erase("b");
    EXPECT_EQ(once, twice);
}

TEST(OrderedMap, ReinsertAfterEraseAppends) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3).erase("a").set("a", 10);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(m.get("a"), 10);
}

TEST(OrderedMap, EraseEverythingOneByOne) {
    CountMap m;
    for (int i = 0; i < 50; ++i) m = std::move(m).set("k" + std::to_string(i), i);
    for (int i = 0; i < 50; i += 2) m = std::move(m).erase("k" + std::to_string(i));
    ASSERT_EQ(m.size(), 25u);
    size_t pos = 0;
    m.for_each([&pos, &m](const std::string& k, int v) {
        EXPECT_EQ(v % 2, 1);
        EXPECT_EQ(m.index_of(k), pos);
        ++pos;
    });
    for (int i = 1; i < 50; i += 2) m = std::move(m).erase("k" + std::to_string(i));
    EXPECT_TRUE(m.empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, GetAbsentReturnsDefault) {
    auto m = StringMap().set("a", "x");
    EXPECT_EQ(m.get("missing"), "");
    EXPECT_FALSE(m.contains("missing"));
}

TEST(OrderedMap, FindAndAt) {
    auto m = CountMap().set("a", 1);
    ASSERT_NE(m.find("a"), nullptr);
    EXPECT_EQ(*m.find("a"), 1);
    EXPECT_EQ(m.at("a"), 1);

    try {
        (void)m.at("b");
        FAIL() << "expected OutOfRangeError";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.code(), errc::key_not_found);
    }
}

TEST(OrderedMap, IndexOfAbsent) {
    auto m = CountMap().set("a", 1);
    EXPECT_FALSE(m.index_of("b").has_value());
    EXPECT_FALSE(CountMap().index_of("a").has_value());
}

TEST(OrderedMap, CustomHashAndEquality) {
    struct CaseFoldHash {
        size_t operator()(const std::string& s) const {
            std::string lower;
            for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return std::hash<std::string>{}(lower);
        }
    };
    struct CaseFoldEqual {
        bool operator()(const std::string& a, const std::string& b) const {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i]))) return false;
            }
            return true;
        }
    };
    using FoldMap = OrderedMap<std::string, int, CaseFoldHash, CaseFoldEqual>;
    auto m = FoldMap().set("Key", 1);
    EXPECT_TRUE(m.contains("KEY"));
    EXPECT_THROW((void)m.set("key", 2), KeyAlreadyExists);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Traversal
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, ForEachStopsOnError) {
    auto m = CountMap().set("a", 1).set("b", 2).set("c", 3);
    std::vector<std::string> visited;
    auto ec = m.for_each([&visited](const std::string& k, int) -> std::error_code {
        visited.push_back(k);
        if (k == "b") return std::make_error_code(std::errc::operation_canceled);
        return {};
    });
    EXPECT_EQ(ec, std::errc::operation_canceled);
    EXPECT_EQ(visited, (std::vector<std::string>{"a", "b"}));
}

TEST(OrderedMap, ForEachReturnsOrdmapCodeVerbatim) {
    auto m = CountMap().set("a", 1);
    auto ec = m.for_each([](const std::string&, int) -> std::error_code {
        return make_error_code(errc::type_mismatch);
    });
    EXPECT_EQ(ec, errc::type_mismatch);
}

TEST(OrderedMap, ForEachSuccessReturnsEmptyCode) {
    auto m = CountMap().set("a", 1).set("b", 2);
    int sum = 0;
    auto ec = m.for_each([&sum](const std::string&, int v) -> std::error_code {
        sum += v;
        return {};
    });
    EXPECT_FALSE(ec);
    EXPECT_EQ(sum, 3);
}

TEST(OrderedMap, ForEachPropagatesExceptions) {
    auto m = CountMap().set("a", 1).set("b", 2);
    int calls = 0;
    EXPECT_THROW(m.for_each([&calls](const std::string&, int) {
        ++calls;
        throw std::runtime_error("stop");
    }), std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST(OrderedMap, ForEachOnZeroForm) {
    CountMap m;
    int calls = 0;
    auto ec = m.for_each([&calls](const std::string&, int) { ++calls; });
    EXPECT_FALSE(ec);
    EXPECT_EQ(calls, 0);
}

TEST(OrderedMap, ForEachSurvivesReassignmentInVisitor) {
    auto m = CountMap().set("a", 1).set("b", 2);
    std::vector<std::string> visited;
    m.for_each([&](const std::string& k, int) {
        visited.push_back(k);
        m = CountMap();
    });
    EXPECT_EQ(visited, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(m.empty());
}

TEST(OrderedMap, UnorderedOnEmpty) {
    EXPECT_TRUE(CountMap().unordered().empty());
}

TEST(OrderedMap, RangeForInInsertionOrder) {
    auto m = CountMap().set("x", 1).set("y", 2).set("z", 3);
    std::vector<std::string> ks;
    int sum = 0;
    for (auto [k, v] : m) {
        ks.push_back(k);
        sum += v;
    }
    EXPECT_EQ(ks, (std::vector<std::string>{"x", "y", "z"}));
    EXPECT_EQ(sum, 6);
    EXPECT_EQ(std::distance(m.begin(), m.end()), 3);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Copy-on-write versions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, SetDoesNotTouchSource) {
    auto a = CountMap().set("a", 1);
    auto b = a.set("b", 2);
    EXPECT_EQ(a.size(), 1u);
    EXPECT_FALSE(a.contains("b"));
    EXPECT_EQ(b.size(), 2u);
}

TEST(OrderedMap, EraseDoesNotTouchSource) {
    auto a = CountMap().set("a", 1).set("b", 2);
    auto b = a.erase("a");
    EXPECT_EQ(keys_of(a), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(keys_of(b), (std::vector<std::string>{"b"}));
}

TEST(OrderedMap, CopiesShareStorageUntilMutation) {
    auto a = CountMap().set("a", 1);
    EXPECT_EQ(a.use_count(), 1);

    auto b = a;
    EXPECT_EQ(a.use_count(), 2);
    EXPECT_EQ(b.use_count(), 2);

    auto c = b.set("c", 3);
    EXPECT_EQ(c.use_count(), 1);
    EXPECT_EQ(a.use_count(), 2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(OrderedMap, RvalueSetOnSharedBlockCopies) {
    auto a = CountMap().set("a", 1);
    auto b = a;
    auto c = std::move(b).set("b", 2);
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_EQ(a.use_count(), 1);
}

TEST(OrderedMap, IteratorOutlivesLaterVersions) {
    auto a = CountMap().set("a", 1).set("b", 2);
    auto it = a.begin();
    auto b = a.erase("a").set("z", 26);
    EXPECT_EQ((*it).first, "a");
    ++it;
    EXPECT_EQ((*it).first, "b");
    EXPECT_EQ(keys_of(b), (std::vector<std::string>{"b", "z"}));
}

TEST(OrderedMap, IteratorKeepsStorageAfterMapReassigned) {
    auto m = CountMap().set("a", 1).set("b", 2);
    auto it = m.begin();
    const auto last = m.end();
    m = std::move(m).erase("a");
    m = CountMap();
    EXPECT_TRUE(m.empty());
    EXPECT_EQ((*it).first, "a");
    EXPECT_EQ((*it).second, 1);
    ++it;
    EXPECT_EQ((*it).first, "b");
    ++it;
    EXPECT_TRUE(it == last);
}

TEST(OrderedMap, IteratorFromTemporary) {
    auto it = CountMap().set("x", 7).begin();
    EXPECT_EQ((*it).first, "x");
    EXPECT_EQ((*it).second, 7);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Comparison
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, EqualityIsOrderSensitive) {
    auto ab = CountMap().set("a", 1).set("b", 2);
    auto ba = CountMap().set("b", 2).set("a", 1);
    EXPECT_NE(ab, ba);
    EXPECT_EQ(ab, CountMap().set("a", 1).set("b", 2));
    EXPECT_NE(ab, CountMap().set("a", 1).set("b", 3));
}

TEST(OrderedMap, ZeroFormEqualsEmpty) {
    EXPECT_EQ(CountMap(), CountMap::make());
    EXPECT_EQ(CountMap(), CountMap().set("a", 1).erase("a"));
}
