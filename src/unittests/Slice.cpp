#include <catch2/catch.hpp>

#include <vector>

#include <seqmatch/Slice.hpp>

namespace seqmatch::unittests {

TEST_CASE("Slice views contiguous elements", "[Slice]")
{
    int arr[] = { 1, 2, 3, 4 };
    Slice<int> s = arr;
    CHECK(s.card() == 4);
    CHECK(s.front() == 1);
    CHECK(s.back() == 4);

    s[1] = 20;
    CHECK(arr[1] == 20);

    auto mid = s(1, 3);
    CHECK(mid.card() == 2);
    CHECK(mid[0] == 20);
    CHECK(mid[1] == 3);

    mid.popFront();
    mid.popBack();
    CHECK(mid.empty());
    CHECK(!mid);
}

TEST_CASE("Slice over a vector", "[Slice]")
{
    std::vector<int> const v = { 5, 6, 7 };
    Slice<int const> s = v;
    CHECK(s.data() == v.data());
    CHECK(s.size() == v.size());

    int sum = 0;
    for ( auto e : s )
        sum += e;
    CHECK(sum == 18);

    Slice<int const> empty;
    CHECK(empty.empty());
    CHECK(begin(empty) == end(empty));
}

} // namespace seqmatch::unittests
