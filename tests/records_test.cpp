#include <limits>
#include <sstream>

#include "doctest.h"

#include "records/records.hpp"
#include "records/records_files.hpp"
#include "test_utils.hpp"
#include "utils/errors.hpp"

TEST_CASE("Records::has_spectrum") {
    CHECK_FALSE(Records::has_spectrum(std::nullopt));
    CHECK_FALSE(Records::has_spectrum(Records::Spectrum{}));
    CHECK(Records::has_spectrum(TestUtils::mock_spectrum({100.0}, {1.0})));
}

TEST_CASE("Records::validate") {
    SUBCASE("Well formed records are accepted") {
        std::vector<Records::PredictedRecord> predicted = {
            TestUtils::mock_predicted(
                "CCO", TestUtils::mock_spectrum({46.0, 47.0}, {10.0, 1.0}),
                2.4, 272.0),
            TestUtils::mock_predicted("CCN", std::nullopt, std::nullopt,
                                      std::nullopt),
        };
        std::vector<Records::ObservedRecord> observed = {
            TestUtils::mock_observed(TestUtils::mock_spectrum({}, {}), 1.0,
                                     std::nullopt, 0),
        };
        CHECK_NOTHROW(Records::validate(predicted, observed));
    }
    SUBCASE("Mismatched spectrum lengths") {
        std::vector<Records::PredictedRecord> predicted = {};
        std::vector<Records::ObservedRecord> observed = {
            TestUtils::mock_observed(std::nullopt, 1.0, std::nullopt),
            TestUtils::mock_observed(
                TestUtils::mock_spectrum({100.0, 101.0}, {5.0}), 1.0,
                std::nullopt),
        };
        CHECK_THROWS_AS(Records::validate(predicted, observed),
                        PeakMatch::MalformedRecord);
        CHECK_THROWS_WITH(Records::validate(predicted, observed),
                          "observed record 1: spectrum has 2 mz values but 1 "
                          "intensity values");
    }
    SUBCASE("Non finite values") {
        auto nan = std::numeric_limits<double>::quiet_NaN();
        auto inf = std::numeric_limits<double>::infinity();
        CHECK_THROWS_AS(
            Records::validate(TestUtils::mock_predicted_rt("CCO", nan), 0),
            PeakMatch::MalformedRecord);
        CHECK_THROWS_AS(
            Records::validate(
                TestUtils::mock_observed(std::nullopt, std::nullopt, inf), 0),
            PeakMatch::MalformedRecord);
        CHECK_THROWS_AS(
            Records::validate(TestUtils::mock_spectrum({100.0, nan},
                                                       {1.0, 1.0}),
                              "spectrum"),
            PeakMatch::MalformedRecord);
    }
    SUBCASE("MalformedRecord is an invalid_argument") {
        auto record = TestUtils::mock_predicted(
            "CCO", TestUtils::mock_spectrum({1.0}, {}), std::nullopt,
            std::nullopt);
        CHECK_THROWS_AS(Records::validate(record, 0), std::invalid_argument);
    }
}

TEST_CASE("Records::Files::Tsv") {
    SUBCASE("Predicted records") {
        std::stringstream stream;
        stream << "# predicted compounds\n"
               << "label\trt\tlmax\tmz\tintensity\n"
               << "CCO\t2.40\t272\t46.04,47.05\t100,5\n"
               << "\n"
               << "c1ccccc1\tNA\t254.5\t\t\n"
               << "CCN\t3.1\t\tNA\tNA\n";
        std::vector<Records::PredictedRecord> records;
        REQUIRE(Records::Files::Tsv::read_predicted(stream, &records));
        REQUIRE(records.size() == 3);
        CHECK(records[0].label == "CCO");
        CHECK(records[0].rt == 2.4);
        CHECK(records[0].lmax == 272.0);
        REQUIRE(records[0].spectrum);
        CHECK(records[0].spectrum->mz == std::vector<double>{46.04, 47.05});
        CHECK(records[0].spectrum->intensity ==
              std::vector<double>{100.0, 5.0});
        CHECK(records[1].label == "c1ccccc1");
        CHECK_FALSE(records[1].rt);
        CHECK(records[1].lmax == 254.5);
        CHECK_FALSE(records[1].spectrum);
        CHECK(records[2].rt == 3.1);
        CHECK_FALSE(records[2].lmax);
        CHECK_FALSE(records[2].spectrum);
    }
    SUBCASE("Observed records with columns in any order") {
        std::stringstream stream;
        stream << "PEAK_ID\tintensity\tmz\tRT\textra\n"
               << "7\t80\t46.05\t2.41\tignored\n"
               << "NA\t\t\t5.58\t\n";
        std::vector<Records::ObservedRecord> records;
        REQUIRE(Records::Files::Tsv::read_observed(stream, &records));
        REQUIRE(records.size() == 2);
        CHECK(records[0].peak_id == 7);
        CHECK(records[0].rt == 2.41);
        REQUIRE(records[0].spectrum);
        CHECK(records[0].spectrum->mz == std::vector<double>{46.05});
        CHECK(records[0].spectrum->intensity == std::vector<double>{80.0});
        CHECK_FALSE(records[1].peak_id);
        CHECK_FALSE(records[1].spectrum);
        CHECK_FALSE(records[1].lmax);
    }
    SUBCASE("Half a spectrum is kept for validation") {
        std::stringstream stream;
        stream << "label\tmz\n"
               << "CCO\t46.04,47.05\n";
        std::vector<Records::PredictedRecord> records;
        REQUIRE(Records::Files::Tsv::read_predicted(stream, &records));
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].spectrum);
        CHECK(records[0].spectrum->intensity.empty());
        CHECK_THROWS_AS(Records::validate(records[0], 0),
                        PeakMatch::MalformedRecord);
    }
    SUBCASE("Malformed cells") {
        std::vector<Records::ObservedRecord> records;
        std::stringstream bad_number("rt\n2.4x\n");
        CHECK_FALSE(Records::Files::Tsv::read_observed(bad_number, &records));
        std::stringstream bad_list("mz\tintensity\n1.0,,2.0\t1,2,3\n");
        CHECK_FALSE(Records::Files::Tsv::read_observed(bad_list, &records));
        std::stringstream bad_id("peak_id\n-3\n");
        CHECK_FALSE(Records::Files::Tsv::read_observed(bad_id, &records));
        std::stringstream overflow_id("peak_id\n99999999999999999999\n");
        CHECK_FALSE(Records::Files::Tsv::read_observed(overflow_id, &records));
    }
    SUBCASE("Largest peak_id") {
        std::stringstream stream("peak_id\n18446744073709551615\n");
        std::vector<Records::ObservedRecord> records;
        REQUIRE(Records::Files::Tsv::read_observed(stream, &records));
        REQUIRE(records.size() == 1);
        CHECK(records[0].peak_id == std::numeric_limits<uint64_t>::max());
    }
    SUBCASE("Non ASCII labels and headers") {
        std::stringstream stream;
        stream << "LABEL\trt\t\xc3\xa9tiquette\n"
               << "\xce\xb2-carotene \xc2\xb0\t4.2\tx\n";
        std::vector<Records::PredictedRecord> records;
        REQUIRE(Records::Files::Tsv::read_predicted(stream, &records));
        REQUIRE(records.size() == 1);
        CHECK(records[0].label == "\xce\xb2-carotene \xc2\xb0");
        CHECK(records[0].rt == 4.2);
    }
    SUBCASE("Missing header") {
        std::stringstream stream("# nothing here\n\n");
        std::vector<Records::PredictedRecord> records;
        CHECK_FALSE(Records::Files::Tsv::read_predicted(stream, &records));
    }
}
