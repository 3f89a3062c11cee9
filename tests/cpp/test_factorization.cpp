#include <catch2/catch.hpp>
#include "fractran/factorization.hpp"
#include <stdexcept>

using namespace fractran;

// ============================================================================
// factorize
// ============================================================================

TEST_CASE("factorize small values", "[factorization]") {
    SECTION("one is the empty product") {
        auto f = factorize(1);
        REQUIRE(f.empty());
        REQUIRE(f.to_string() == "1");
        REQUIRE(f.value() == 1);
    }

    SECTION("zero yields an empty factorization without throwing") {
        auto f = factorize(0);
        REQUIRE(f.empty());
    }

    SECTION("prime") {
        auto f = factorize(13);
        REQUIRE(f.size() == 1);
        REQUIRE(f.exponent(13) == 1);
    }

    SECTION("composite") {
        auto f = factorize(360);  // 2^3 * 3^2 * 5
        REQUIRE(f.size() == 3);
        REQUIRE(f.exponent(2) == 3);
        REQUIRE(f.exponent(3) == 2);
        REQUIRE(f.exponent(5) == 1);
        REQUIRE(f.exponent(7) == 0);
        REQUIRE(f.contains(5));
        REQUIRE_FALSE(f.contains(7));
    }
}

TEST_CASE("factorize rendering is ascending", "[factorization]") {
    REQUIRE(factorize(360).to_string() == "2^3 * 3^2 * 5^1");
    REQUIRE(factorize(825).to_string() == "3^1 * 5^2 * 11^1");
    REQUIRE(factorize(2).to_string() == "2^1");
}

TEST_CASE("factorize reconstructs the input", "[factorization]") {
    for (long n = 1; n <= 2000; ++n) {
        REQUIRE(factorize(n).value() == n);
    }
}

TEST_CASE("factorize keeps one large residual prime", "[factorization]") {
    // 1000003 は素数。√n までの試し割りで残る因数
    Integer n = Integer(2) * 1000003;
    auto f = factorize(n);
    REQUIRE(f.size() == 2);
    REQUIRE(f.exponent(2) == 1);
    REQUIRE(f.exponent(1000003) == 1);
    REQUIRE(f.to_string() == "2^1 * 1000003^1");
}

TEST_CASE("factorize beyond 64 bits", "[factorization]") {
    Integer n;
    mpz_ui_pow_ui(n.get_mpz_t(), 2, 100);
    n *= 243;  // 3^5

    auto f = factorize(n);
    REQUIRE(f.size() == 2);
    REQUIRE(f.exponent(2) == 100);
    REQUIRE(f.exponent(3) == 5);
    REQUIRE(f.value() == n);
}

TEST_CASE("factorize rejects negative values", "[factorization]") {
    REQUIRE_THROWS_AS(factorize(-12), std::invalid_argument);
}

TEST_CASE("PrimeFactorization drops zero exponents", "[factorization]") {
    PrimeFactorization f(PrimeFactorization::map_type{{2, 0}, {3, 2}});
    REQUIRE(f.size() == 1);
    REQUIRE(f == factorize(9));
    REQUIRE(f != factorize(27));
}
