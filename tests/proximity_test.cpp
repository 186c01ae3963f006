#include <cmath>

#include "doctest.h"

#include "proximity/proximity.hpp"

TEST_CASE("Gaussian proximity") {
    SUBCASE("Identical values score 1") {
        CHECK(Proximity::gaussian_score(2.5, 2.5, 0.5) == 1.0);
        CHECK(Proximity::rt_score(0.0, 0.0) == 1.0);
        CHECK(Proximity::lmax_score(272.0, 272.0) == 1.0);
    }
    SUBCASE("One sigma away") {
        CHECK(Proximity::gaussian_score(1.0, 1.5, 0.5) ==
              doctest::Approx(std::exp(-0.5)));
        CHECK(Proximity::lmax_score(250.0, 265.0) ==
              doctest::Approx(std::exp(-0.5)));
    }
    SUBCASE("Symmetric") {
        CHECK(Proximity::rt_score(2.4, 3.6) == Proximity::rt_score(3.6, 2.4));
    }
    SUBCASE("Strictly decreasing with the distance") {
        double previous = Proximity::rt_score(5.0, 5.0);
        for (size_t i = 1; i <= 10; ++i) {
            double current = Proximity::rt_score(5.0, 5.0 + 0.2 * i);
            CHECK(current < previous);
            CHECK(current > 0.0);
            previous = current;
        }
        CHECK(Proximity::rt_score(0.0, 100.0) == doctest::Approx(0.0));
    }
    SUBCASE("Missing values or invalid widths score 0") {
        CHECK(Proximity::rt_score(std::nullopt, 2.0) == 0.0);
        CHECK(Proximity::rt_score(2.0, std::nullopt) == 0.0);
        CHECK(Proximity::lmax_score(std::nullopt, std::nullopt) == 0.0);
        CHECK(Proximity::gaussian_score(2.0, 2.0, 0.0) == 0.0);
        CHECK(Proximity::gaussian_score(2.0, 2.0, -1.0) == 0.0);
    }
}
