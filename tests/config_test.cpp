#include <sstream>
#include <stdexcept>

#include "config/config.hpp"
#include "doctest.h"

TEST_CASE("Config::parse_json") {
    SUBCASE("Parameters and weights") {
        std::stringstream stream;
        stream << "# peakmatch configuration\n"
               << "{\n"
               << "    \"peakmatch\": {\n"
               << "        \"parameters\": {\"rt_sigma\": 0.8, \"ppm\": 10},\n"
               << "        \"weights\": {\"ms\": 0.6, \"lmax\": 0}\n"
               << "    }\n"
               << "}\n";
        auto options = Config::parse_json(stream);
        CHECK(options.size() == 4);
        CHECK(options["-rt_sigma"] == "0.8");
        CHECK(options["-ppm"] == "10");
        CHECK(options["-w_ms"] == "0.6");
        CHECK(options["-w_lmax"] == "0");
    }
    SUBCASE("Only weights") {
        std::stringstream stream(
            "{\"peakmatch\": {\"weights\": {\"rt\": 1}}}");
        auto options = Config::parse_json(stream);
        CHECK(options.size() == 1);
        CHECK(options["-w_rt"] == "1");
    }
    SUBCASE("Missing section") {
        std::stringstream stream("{\"pastaq\": {\"parameters\": {}}}");
        CHECK_THROWS_AS(Config::parse_json(stream), std::invalid_argument);
    }
    SUBCASE("Missing value") {
        std::stringstream stream(
            "{\"peakmatch\": {\"parameters\": {\"rt_sigma\": }}}");
        CHECK_THROWS_AS(Config::parse_json(stream), std::invalid_argument);
    }
}

TEST_CASE("Config::merge") {
    SUBCASE("Command line flags take precedence") {
        Config::Options options = {{"-rt_sigma", "1.5"}};
        Config::merge(options, {{"-rt_sigma", "0.8"}, {"-w_ms", "0.6"}});
        CHECK(options.size() == 2);
        CHECK(options["-rt_sigma"] == "1.5");
        CHECK(options["-w_ms"] == "0.6");
    }
    SUBCASE("Absolute tolerance on the command line replaces ppm") {
        Config::Options options = {{"-mz_tol", "0.02"}};
        Config::merge(options, {{"-ppm", "10"}, {"-lmax_sigma", "20"}});
        CHECK(options["-mz_tol"] == "0.02");
        CHECK(options.find("-ppm") == options.end());
        CHECK(options["-lmax_sigma"] == "20");
    }
    SUBCASE("ppm on the command line replaces the absolute tolerance") {
        Config::Options options = {{"-ppm", "5"}};
        Config::merge(options, {{"-mz_tol", "0.01"}});
        CHECK(options.size() == 1);
        CHECK(options["-ppm"] == "5");
    }
    SUBCASE("Tolerance from the config file when none is given") {
        Config::Options options = {{"-solver", "greedy"}};
        Config::merge(options, {{"-ppm", "10"}});
        CHECK(options["-ppm"] == "10");
        CHECK(options["-solver"] == "greedy");
    }
}
