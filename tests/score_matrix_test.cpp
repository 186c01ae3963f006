#include <cmath>
#include <limits>

#include "doctest.h"

#include "proximity/proximity.hpp"
#include "score_matrix/score_matrix.hpp"
#include "test_utils.hpp"
#include "utils/errors.hpp"

namespace {
// A mixed set of records where every channel is missing somewhere.
std::vector<Records::PredictedRecord> mock_predicted_records() {
    return {
        TestUtils::mock_predicted(
            "A", TestUtils::mock_spectrum({100.0, 150.0}, {10.0, 3.0}), 2.0,
            260.0),
        TestUtils::mock_predicted("B", std::nullopt, 3.5, 300.0),
        TestUtils::mock_predicted(
            "C", TestUtils::mock_spectrum({120.0}, {1.0}), std::nullopt,
            std::nullopt),
        TestUtils::mock_predicted("D", std::nullopt, 7.2, std::nullopt),
        TestUtils::mock_predicted("E", std::nullopt, std::nullopt,
                                  std::nullopt),
    };
}
std::vector<Records::ObservedRecord> mock_observed_records() {
    return {
        TestUtils::mock_observed(
            TestUtils::mock_spectrum({100.004, 150.0, 180.0},
                                     {9.0, 4.0, 1.0}),
            2.1, 262.0, 0),
        TestUtils::mock_observed(std::nullopt, 3.4, 310.0, 1),
        TestUtils::mock_observed(TestUtils::mock_spectrum({120.001}, {5.0}),
                                 7.0, std::nullopt, 2),
        TestUtils::mock_observed(std::nullopt, std::nullopt, 255.0, 3),
    };
}
}  // namespace

TEST_CASE("ScoreMatrix::parse_channel") {
    CHECK(ScoreMatrix::parse_channel("ms") == ScoreMatrix::MS);
    CHECK(ScoreMatrix::parse_channel("RT") == ScoreMatrix::RT);
    CHECK(ScoreMatrix::parse_channel("lambda_max") == ScoreMatrix::LMAX);
    CHECK_FALSE(ScoreMatrix::parse_channel("uv"));
}

TEST_CASE("ScoreMatrix::validate") {
    ScoreMatrix::Parameters parameters;
    CHECK_NOTHROW(ScoreMatrix::validate(parameters));
    CHECK(parameters.weights.ms == 0.5);
    CHECK(parameters.weights.rt == 0.3);
    CHECK(parameters.weights.lmax == 0.2);
    CHECK(parameters.tolerance.mz == 0.01);
    CHECK_FALSE(parameters.tolerance.ppm);

    SUBCASE("Negative weight") {
        ScoreMatrix::set_weight(parameters.weights, ScoreMatrix::RT, -0.1);
        CHECK(ScoreMatrix::weight(parameters.weights, ScoreMatrix::RT) ==
              -0.1);
        CHECK_THROWS_AS(ScoreMatrix::validate(parameters),
                        PeakMatch::InvalidConfiguration);
    }
    SUBCASE("NaN weight") {
        parameters.weights.lmax = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(ScoreMatrix::validate(parameters),
                        PeakMatch::InvalidConfiguration);
    }
    SUBCASE("Zero weights are accepted") {
        parameters.weights = {0.0, 0.0, 0.0};
        CHECK_NOTHROW(ScoreMatrix::validate(parameters));
    }
    SUBCASE("Non-positive sigma") {
        parameters.rt_sigma = 0.0;
        CHECK_THROWS_AS(ScoreMatrix::validate(parameters),
                        PeakMatch::InvalidConfiguration);
        parameters.rt_sigma = 0.5;
        parameters.lmax_sigma = -15.0;
        CHECK_THROWS_AS(ScoreMatrix::validate(parameters),
                        PeakMatch::InvalidConfiguration);
    }
    SUBCASE("Both mass tolerances") {
        parameters.tolerance.ppm = 10.0;
        CHECK_THROWS_AS(ScoreMatrix::validate(parameters),
                        PeakMatch::InvalidConfiguration);
    }
}

TEST_CASE("ScoreMatrix::score_pair") {
    ScoreMatrix::Parameters parameters;
    SUBCASE("Weights are renormalized over the evaluated channels") {
        auto predicted = TestUtils::mock_predicted_rt("A", 2.0);
        auto observed = TestUtils::mock_observed(
            TestUtils::mock_spectrum({100.0}, {1.0}), 2.5, 260.0);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) ==
              doctest::Approx(std::exp(-0.5)));
    }
    SUBCASE("Two channels") {
        auto predicted = TestUtils::mock_predicted(
            "A", std::nullopt, 2.0, 260.0);
        auto observed =
            TestUtils::mock_observed(std::nullopt, 2.0, 275.0);
        double expected = (0.3 * 1.0 + 0.2 * std::exp(-0.5)) / 0.5;
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) ==
              doctest::Approx(expected));
    }
    SUBCASE("All channels agree") {
        auto spectrum = TestUtils::mock_spectrum({100.0, 200.0}, {1.0, 2.0});
        auto predicted =
            TestUtils::mock_predicted("A", spectrum, 2.0, 260.0);
        auto observed = TestUtils::mock_observed(spectrum, 2.0, 260.0);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) ==
              doctest::Approx(1.0));
    }
    SUBCASE("Extreme intensities keep the cell finite") {
        auto spectrum =
            TestUtils::mock_spectrum({100.0, 200.0}, {1e200, 2e200});
        auto predicted =
            TestUtils::mock_predicted("A", spectrum, std::nullopt, std::nullopt);
        auto observed =
            TestUtils::mock_observed(spectrum, std::nullopt, std::nullopt);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) ==
              doctest::Approx(1.0));
        auto matrix = ScoreMatrix::build_serial({predicted}, {observed},
                                                parameters);
        CHECK(std::isfinite(matrix(0, 0)));
    }
    SUBCASE("Empty spectra don't take part") {
        auto predicted = TestUtils::mock_predicted(
            "A", TestUtils::mock_spectrum({}, {}), 2.0, std::nullopt);
        auto observed = TestUtils::mock_observed(
            TestUtils::mock_spectrum({100.0}, {1.0}), 2.0, std::nullopt);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) ==
              doctest::Approx(1.0));
    }
    SUBCASE("No shared channels") {
        auto predicted = TestUtils::mock_predicted("A", std::nullopt,
                                                   std::nullopt, 260.0);
        auto observed = TestUtils::mock_observed_rt(2.0);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) == 0.0);
    }
    SUBCASE("Only zero weighted channels") {
        parameters.weights = {0.0, 0.0, 1.0};
        auto predicted = TestUtils::mock_predicted_rt("A", 2.0);
        auto observed = TestUtils::mock_observed_rt(2.0);
        CHECK(ScoreMatrix::score_pair(predicted, observed, parameters) == 0.0);
    }
}

TEST_CASE("ScoreMatrix::build_serial") {
    ScoreMatrix::Parameters parameters;
    auto predicted = mock_predicted_records();
    auto observed = mock_observed_records();

    SUBCASE("Dimensions and range") {
        auto matrix =
            ScoreMatrix::build_serial(predicted, observed, parameters);
        REQUIRE(matrix.rows() == 5);
        REQUIRE(matrix.cols() == 4);
        for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
            for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
                CHECK(matrix(i, j) >= 0.0);
                CHECK(matrix(i, j) <= 1.0);
                CHECK(matrix(i, j) ==
                      ScoreMatrix::score_pair(predicted[i], observed[j],
                                              parameters));
            }
        }
        // A record without any data never scores.
        CHECK(matrix.row(4).isZero());
        // The best candidate for A is the first observed record.
        Eigen::Index best = 0;
        matrix.row(0).maxCoeff(&best);
        CHECK(best == 0);
    }
    SUBCASE("Empty inputs") {
        auto matrix = ScoreMatrix::build_serial({}, observed, parameters);
        CHECK(matrix.rows() == 0);
        CHECK(matrix.cols() == 4);
        matrix = ScoreMatrix::build_serial(predicted, {}, parameters);
        CHECK(matrix.rows() == 5);
        CHECK(matrix.cols() == 0);
    }
    SUBCASE("Invalid configuration fails before scoring") {
        parameters.weights.ms = -1.0;
        CHECK_THROWS_AS(
            ScoreMatrix::build_serial(predicted, observed, parameters),
            PeakMatch::InvalidConfiguration);
        CHECK_THROWS_AS(ScoreMatrix::build_serial({}, {}, parameters),
                        PeakMatch::InvalidConfiguration);
    }
    SUBCASE("Malformed records") {
        observed[3].spectrum = TestUtils::mock_spectrum({1.0, 2.0}, {1.0});
        CHECK_THROWS_AS(
            ScoreMatrix::build_serial(predicted, observed, parameters),
            PeakMatch::MalformedRecord);
    }
}

TEST_CASE("ScoreMatrix::build_parallel") {
    ScoreMatrix::Parameters parameters;
    auto predicted = mock_predicted_records();
    auto observed = mock_observed_records();
    // Grow the input so that every thread gets more than one row.
    for (size_t k = 0; k < 20; ++k) {
        predicted.push_back(TestUtils::mock_predicted_rt("R", 0.5 * k));
        observed.push_back(TestUtils::mock_observed_rt(0.45 * k));
    }
    auto serial = ScoreMatrix::build_serial(predicted, observed, parameters);
    for (size_t max_threads : {1, 2, 3, 8, 64}) {
        auto parallel = ScoreMatrix::build_parallel(predicted, observed,
                                                    parameters, max_threads);
        CHECK(parallel == serial);
    }
    SUBCASE("Errors are raised on the calling thread") {
        predicted[7].rt = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(ScoreMatrix::build_parallel(predicted, observed,
                                                    parameters, 4),
                        PeakMatch::MalformedRecord);
    }
}

TEST_CASE("Retention time only scenario") {
    ScoreMatrix::Parameters parameters;
    parameters.weights = {0.0, 1.0, 0.0};
    parameters.rt_sigma = 0.5;
    std::vector<Records::PredictedRecord> predicted = {
        TestUtils::mock_predicted_rt("A", 2.4),
        TestUtils::mock_predicted_rt("B", 3.6),
        TestUtils::mock_predicted_rt("C", 5.6),
    };
    std::vector<Records::ObservedRecord> observed = {
        TestUtils::mock_observed_rt(2.41),
        TestUtils::mock_observed_rt(5.58),
        TestUtils::mock_observed_rt(3.59),
    };
    auto matrix = ScoreMatrix::build_serial(predicted, observed, parameters);
    CHECK(matrix(0, 0) > 0.95);
    CHECK(matrix(1, 2) > 0.95);
    CHECK(matrix(2, 1) > 0.95);
    CHECK(matrix(0, 0) ==
          doctest::Approx(Proximity::rt_score(2.4, 2.41, 0.5)));
    CHECK(matrix(0, 1) < 0.01);
}
