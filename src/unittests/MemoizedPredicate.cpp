#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <seqmatch/Accumulators.hpp>
#include <seqmatch/MemoizedPredicate.hpp>

namespace seqmatch::unittests {

TEST_CASE("MemoizedPredicate caches by rendered operands", "[MemoizedPredicate]")
{
    int calls = 0;
    MemoizedPredicate<std::string, std::string> pred([&calls](std::string const& d, std::string const& s) {
        ++calls;
        return d == s;
    });

    CHECK(pred("a", "a"));
    CHECK(pred("a", "a"));
    CHECK(!pred("a", "b"));
    CHECK(calls == 2);
    CHECK(pred.hits() == 1);
    CHECK(pred.misses() == 2);
    CHECK(pred.size() == 2);

    auto copy = pred;
    CHECK(!copy("a", "b"));
    CHECK(calls == 2);
    CHECK(pred.hits() == 2);

    pred.clear();
    CHECK(copy.size() == 0);
    CHECK(pred("a", "a"));
    CHECK(calls == 3);
}

TEST_CASE("MemoizedPredicate uses the given rendering", "[MemoizedPredicate]")
{
    int calls = 0;
    auto parity = [](int n) { return std::string(n % 2 ? "odd" : "even"); };

    MemoizedPredicate<int, int> pred([&calls](int d, int s) { ++calls; return d % 2 == s % 2; },
                                     parity, parity);

    CHECK(pred(1, 3));
    CHECK(pred(5, 7));
    CHECK(!pred(2, 9));
    CHECK(calls == 2);
}

TEST_CASE("MemoizedPredicate does not cache failures", "[MemoizedPredicate]")
{
    int calls = 0;
    MemoizedPredicate<std::string, std::string> pred([&calls](std::string const&, std::string const&) -> bool {
        ++calls;
        throw std::runtime_error("unavailable");
    });

    CHECK_THROWS_AS(pred("a", "a"), std::runtime_error);
    CHECK_THROWS_AS(pred("a", "a"), std::runtime_error);
    CHECK(calls == 2);
    CHECK(pred.size() == 0);
}

TEST_CASE("MemoizedPredicate drives a traversal", "[MemoizedPredicate]")
{
    using Item = QuantifiedItem<std::string>;

    std::vector<Item> const dest = { Item("X", Quantifier::zeroOrMore()), Item("X", Quantifier::zeroOrMore()), Item("Y") };
    std::vector<Item> const src = { Item("x"), Item("x"), Item("x"), Item("z") };

    int calls = 0;
    MemoizedPredicate<std::string, std::string> pred([&calls](std::string const& d, std::string const& s) {
        ++calls;
        return d.size() == 1 && s.size() == 1 && d[0] - 'A' + 'a' == s[0];
    });

    CHECK(!matchSequence(dest, src, pred));
    CHECK(calls == static_cast<int>(pred.misses()));
    CHECK(pred.hits() > 0);
    CHECK(pred.size() <= 4);
}

} // namespace seqmatch::unittests
