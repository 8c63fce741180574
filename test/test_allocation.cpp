#include <doctest/doctest.h>

#include <surety/ledger/allocation.hpp>

#include <limits>
#include <numeric>

using namespace surety;
using namespace surety::ledger;

TEST_SUITE("Weighted allocation") {

    TEST_CASE("Even weights split evenly") {
        auto shares = distributeByWeight(4000, {1, 1});
        REQUIRE(shares.size() == 2);
        CHECK(shares[0] == 2000);
        CHECK(shares[1] == 2000);
    }

    TEST_CASE("Shares always sum to the amount") {
        auto shares = distributeByWeight(1000, {1, 1, 1});
        CHECK(std::accumulate(shares.begin(), shares.end(), Money(0)) == 1000);
        // Remainder cent goes to the earliest link
        CHECK(shares[0] == 334);
        CHECK(shares[1] == 333);
        CHECK(shares[2] == 333);
    }

    TEST_CASE("Weights act as multipliers") {
        auto shares = distributeByWeight(900, {2, 1});
        CHECK(shares[0] == 600);
        CHECK(shares[1] == 300);
    }

    TEST_CASE("Amounts smaller than the link count") {
        auto shares = distributeByWeight(1, {1, 1, 1});
        CHECK(std::accumulate(shares.begin(), shares.end(), Money(0)) == 1);
        CHECK(shares[0] == 1);
    }

    TEST_CASE("Degenerate inputs") {
        CHECK(distributeByWeight(100, {}).empty());
        auto zero = distributeByWeight(0, {1, 2});
        CHECK(zero[0] == 0);
        CHECK(zero[1] == 0);
    }

    TEST_CASE("Large amounts do not overflow") {
        Money big = 4000000000000000000;
        auto shares = distributeByWeight(big, {1000, 3000});
        CHECK(shares[0] + shares[1] == big);
        CHECK(shares[0] == 1000000000000000000);
    }

    TEST_CASE("Near-maximum weights split exactly") {
        constexpr dp::i32 top = std::numeric_limits<dp::i32>::max();
        Money amount = 1000000000000007;
        auto shares = distributeByWeight(amount, {top, top, top});
        REQUIRE(shares.size() == 3);
        CHECK(shares[0] == 333333333333336);
        CHECK(shares[1] == 333333333333336);
        CHECK(shares[2] == 333333333333335);

        auto uneven = distributeByWeight(amount, {top, top - 1, 1});
        CHECK(std::accumulate(uneven.begin(), uneven.end(), Money(0)) == amount);
        CHECK(uneven[0] == 500000000000003);
        CHECK(uneven[1] == 499999999767173);
        CHECK(uneven[2] == 232831);
    }

    TEST_CASE("Exact multiply-divide") {
        dp::u64 rem = 0;
        CHECK(mulDivRem(7, 5, 9, rem) == 3);
        CHECK(rem == 8);
        dp::u64 d = 3ull * 2147483647ull;
        CHECK(mulDivRem(d - 1, 2147483647ull, d, rem) == 2147483646ull);
        CHECK(rem == 2ull * 2147483647ull);
    }
}
