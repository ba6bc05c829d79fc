#include <catch2/catch.hpp>

#include <seqmatch/Box.hpp>

namespace seqmatch::unittests {

namespace {
    struct Base
    {
        virtual ~Base() = default;
        virtual int value() const { return 1; }
    };

    struct Derived : Base
    {
        explicit Derived(int* deaths) : deaths(deaths) {}
        ~Derived() override { ++*deaths; }
        int value() const override { return 2; }

        int* deaths;
    };
}

TEST_CASE("Box<int>", "[Box]")
{
    Box<int> b;
    CHECK(!b);
    CHECK(b.get() == nullptr);
    CHECK(b == Box<int>());

    b = mk<int>(42);
    CHECK(b);
    CHECK(*b == 42);

    b.reset(new int(23));
    CHECK(*b == 23);

    auto bb = std::move(b);
    CHECK(!b);
    CHECK(bb);
    CHECK(*bb == 23);

    bb = nullptr;
    CHECK(!bb);
}

TEST_CASE("Box converts to its base", "[Box]")
{
    int deaths = 0;
    {
        Box<Base> b = mk<Derived>(&deaths);
        CHECK(b->value() == 2);

        b = mk<Derived>(&deaths);
        CHECK(deaths == 1);
    }
    CHECK(deaths == 2);
}

} // namespace seqmatch::unittests
