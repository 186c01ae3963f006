#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <regex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "assignment/assignment.hpp"
#include "assignment/assignment_serialize.hpp"
#include "config/config.hpp"
#include "reconcile/reconcile.hpp"
#include "records/records_files.hpp"
#include "score_matrix/score_matrix.hpp"
#include "utils/compression.hpp"

// Type aliases.
using options_map = Config::Options;

void print_usage() {
    std::cout << "USAGE: peakmatch-cli [-help] [options] <predicted.tsv> "
                 "<observed.tsv>"
              << std::endl;
}

// Helper functions to check if the given string contains a number.
bool is_unsigned_int(std::string& s) {
    std::regex int_regex("^([[:digit:]]+)$");
    return std::regex_search(s, int_regex);
}
bool is_number(std::string& s) {
    std::regex double_regex(
        "^[+-]?([[:digit:]]+[\\.]?[[:digit:]]*)([eE][+-]?[[:digit:]]+)?$");
    return std::regex_search(s, double_regex);
}

void print_parameters_summary(const ScoreMatrix::Parameters& parameters,
                              Assignment::Strategy strategy) {
    std::cout << "The following parameters were set:" << std::endl;
    std::cout << "WEIGHTS:" << std::endl;
    std::cout << "ms:" << parameters.weights.ms << std::endl;
    std::cout << "rt:" << parameters.weights.rt << std::endl;
    std::cout << "lmax:" << parameters.weights.lmax << std::endl;
    std::cout << "MASS TOLERANCE:" << std::endl;
    if (parameters.tolerance.ppm) {
        std::cout << "ppm:" << parameters.tolerance.ppm.value() << std::endl;
    }
    if (parameters.tolerance.mz) {
        std::cout << "mz:" << parameters.tolerance.mz.value() << std::endl;
    }
    std::cout << "PROXIMITY:" << std::endl;
    std::cout << "rt_sigma:" << parameters.rt_sigma << std::endl;
    std::cout << "lmax_sigma:" << parameters.lmax_sigma << std::endl;
    std::cout << "SOLVER:" << std::endl;
    std::cout << Assignment::to_string(strategy) << std::endl;
}

void print_result(const Reconcile::Result& result) {
    std::cout << "ASSIGNMENT:" << std::endl;
    std::cout << "label\tpredicted\tobserved\tpeak_id\tscore" << std::endl;
    for (const auto& match : result.matches) {
        std::cout << match.predicted.label << "\t" << match.predicted_index
                  << "\t" << match.observed_index << "\t";
        if (match.observed.peak_id) {
            std::cout << match.observed.peak_id.value();
        } else {
            std::cout << "NA";
        }
        std::cout << "\t" << std::fixed << std::setprecision(4) << match.score
                  << std::defaultfloat << std::endl;
    }
    std::cout << "Unmatched predicted records: "
              << result.unmatched_predicted.size() << std::endl;
    std::cout << "Unmatched observed records: "
              << result.unmatched_observed.size() << std::endl;
    std::cout << "Total score: " << result.total_score << std::endl;
    if (result.degraded) {
        std::cout << "warning: the assignment was computed with the greedy "
                     "solver and may not be optimal"
                  << std::endl;
    }
}

int main(int argc, char* argv[]) {
    // Flag format is map where the key is the flag name and contains a tuple
    // with the description and if it takes extra parameters or not:
    // <description, takes_parameters>
    const std::map<std::string, std::pair<std::string, bool>> accepted_flags = {
        // Proximity.
        {"-rt_sigma", {"The width of the retention time kernel", true}},
        {"-lmax_sigma", {"The width of the absorption maximum kernel", true}},
        // Mass tolerance.
        {"-mz_tol", {"The absolute mass tolerance in Da", true}},
        {"-ppm", {"The relative mass tolerance in parts per million", true}},
        // Weights.
        {"-w_ms", {"The weight of the spectral similarity", true}},
        {"-w_rt", {"The weight of the retention time proximity", true}},
        {"-w_lmax", {"The weight of the absorption maximum proximity", true}},
        // Solver.
        {"-solver", {"The assignment strategy (exact or greedy)", true}},
        // Command parameters.
        {"-out_dir", {"The output directory", true}},
        {"-help", {"Display available options", false}},
        {"-config", {"Specify the configuration file", true}},
        {"-parallel", {"Enable parallel processing", false}},
        {"-n_threads",
         {"Specify the maximum number of threads that will be used for the "
          "calculations",
          true}},
    };

    if (argc == 1) {
        print_usage();
        return -1;
    }

    // Parse arguments and extract options and file names.
    options_map options;
    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        auto arg = argv[i];
        if (arg[0] == '-') {
            if (accepted_flags.find(arg) == accepted_flags.end()) {
                std::cout << "unknown option: " << arg << std::endl;
                print_usage();
                return -1;
            }

            auto flag = accepted_flags.at(arg);
            if (flag.second) {
                if (i + 1 >= argc || argv[i + 1][0] == '-') {
                    std::cout << "no parameters specified for " << arg
                              << std::endl;
                    print_usage();
                    return -1;
                }
                ++i;
                options[arg] = argv[i];
            } else {
                options[arg] = "";
            }
        } else {
            files.emplace_back(arg);
        }
    }

    if (options.find("-help") != options.end()) {
        print_usage();
        // Find maximum option length to adjust text padding.
        size_t padding = 0;
        for (const auto& e : accepted_flags) {
            if (e.first.size() > padding) {
                padding = e.first.size();
            }
        }

        // Print options with a 4 space padding between flag name and
        // description.
        std::cout << "OPTIONS:" << std::endl;
        for (const auto& e : accepted_flags) {
            std::cout << e.first;
            // If the option requires an argument we have to specify it,
            // otherwise we add padding.
            if (e.second.second) {
                std::cout << " <arg>";
            } else {
                std::cout << "      ";
            }
            for (size_t i = 0; i < (padding - e.first.size()) + 4; ++i) {
                std::cout << " ";
            }
            std::cout << e.second.first << std::endl;
        }
        return 0;
    }

    if (files.size() != 2) {
        std::cout << "error: expected a predicted and an observed record file"
                  << std::endl;
        print_usage();
        return -1;
    }

    // If config file is provided, read it and parse it. The parameters
    // specified as command line arguments will override the config file.
    if (options.find("-config") != options.end()) {
        std::filesystem::path config_path = options["-config"];
        if (!std::filesystem::exists(config_path)) {
            std::cout << "error: couldn't find config file " << config_path
                      << std::endl;
            print_usage();
            return -1;
        }
        if (config_path.extension() != ".json") {
            std::cout << "error: invalid format for config file " << config_path
                      << std::endl;
            print_usage();
            return -1;
        }
        std::ifstream stream(config_path);
        if (!stream) {
            std::cout << "error: could not open config file " << config_path
                      << std::endl;
            return -1;
        }
        try {
            Config::merge(options, Config::parse_json(stream));
        } catch (const std::invalid_argument& e) {
            std::cout << "error: " << e.what() << std::endl;
            return -1;
        }
    }

    // Parse the options to build the ScoreMatrix::Parameters struct. Every
    // numeric option is checked for format here, the valid ranges are
    // enforced by ScoreMatrix::validate.
    ScoreMatrix::Parameters parameters;
    const std::vector<std::string> numeric_options = {
        "-rt_sigma", "-lmax_sigma", "-mz_tol", "-ppm",
        "-w_ms",     "-w_rt",       "-w_lmax",
    };
    for (const auto& name : numeric_options) {
        if (options.find(name) == options.end()) {
            continue;
        }
        if (!is_number(options[name])) {
            std::cout << "error: " << name.substr(1) << " has to be a number"
                      << std::endl;
            print_usage();
            return -1;
        }
    }
    if (options.find("-rt_sigma") != options.end()) {
        parameters.rt_sigma = std::stod(options["-rt_sigma"]);
    }
    if (options.find("-lmax_sigma") != options.end()) {
        parameters.lmax_sigma = std::stod(options["-lmax_sigma"]);
    }
    if (options.find("-mz_tol") != options.end() ||
        options.find("-ppm") != options.end()) {
        // Setting both tolerances is rejected on validation.
        parameters.tolerance = Spectral::Tolerance{};
        if (options.find("-mz_tol") != options.end()) {
            parameters.tolerance.mz = std::stod(options["-mz_tol"]);
        }
        if (options.find("-ppm") != options.end()) {
            parameters.tolerance.ppm = std::stod(options["-ppm"]);
        }
    }
    for (const auto& channel_name : {"ms", "rt", "lmax"}) {
        auto name = std::string("-w_") + channel_name;
        if (options.find(name) == options.end()) {
            continue;
        }
        auto channel = ScoreMatrix::parse_channel(channel_name);
        ScoreMatrix::set_weight(parameters.weights, channel.value(),
                                std::stod(options[name]));
    }

    // Get the assignment strategy.
    auto strategy = Assignment::EXACT;
    if (options.find("-solver") != options.end()) {
        auto parsed = Assignment::parse_strategy(options["-solver"]);
        if (!parsed) {
            std::cout << "error: unknown solver " << options["-solver"]
                      << std::endl;
            print_usage();
            return -1;
        }
        strategy = parsed.value();
    }

    // Set up the output directory and check if it exists.
    if (options.find("-out_dir") == options.end()) {
        options["-out_dir"] = ".";
    }
    if (!std::filesystem::exists(options["-out_dir"])) {
        std::cout << "error: couldn't find output directory \""
                  << options["-out_dir"] << "\"" << std::endl;
        print_usage();
        return -1;
    }

    // Set up maximum concurrency.
    size_t max_threads = 1;
    if ((options.find("-parallel") != options.end()) &&
        (options["-parallel"] == "true" || options["-parallel"] == "")) {
        max_threads = std::thread::hardware_concurrency();
        if (!max_threads) {
            std::cout
                << "error: this system does not support parallel processing"
                << std::endl;
            return -1;
        }
        if (options.find("-n_threads") != options.end()) {
            auto n_threads = options["-n_threads"];
            if (!is_unsigned_int(n_threads) || std::stoul(n_threads) == 0) {
                std::cout << "error: "
                          << "n_threads"
                          << " has to be a positive integer" << std::endl;
                print_usage();
                return -1;
            }
            max_threads = std::stoul(n_threads);
        }
    }

    // Load the records.
    for (const auto& file_name : files) {
        if (!std::filesystem::exists(file_name)) {
            std::cout << "error: couldn't find file " << file_name
                      << std::endl;
            print_usage();
            return -1;
        }
    }
    std::vector<Records::PredictedRecord> predicted;
    std::vector<Records::ObservedRecord> observed;
    {
        std::cout << "Reading predicted records..." << std::endl;
        std::ifstream stream(files[0]);
        if (!stream || !Records::Files::Tsv::read_predicted(stream, &predicted)) {
            std::cout << "error: could not read predicted records from "
                      << files[0] << std::endl;
            return -1;
        }
    }
    {
        std::cout << "Reading observed records..." << std::endl;
        std::ifstream stream(files[1]);
        if (!stream || !Records::Files::Tsv::read_observed(stream, &observed)) {
            std::cout << "error: could not read observed records from "
                      << files[1] << std::endl;
            return -1;
        }
    }
    std::cout << "Loaded " << predicted.size() << " predicted and "
              << observed.size() << " observed records" << std::endl;

    print_parameters_summary(parameters, strategy);

    // Execute the program here.
    Reconcile::Result result;
    try {
        auto solver = Assignment::make_solver(strategy);
        std::cout << "Reconciling records..." << std::endl;
        result = Reconcile::reconcile(predicted, observed, parameters, *solver,
                                      max_threads);
    } catch (const std::invalid_argument& e) {
        std::cout << "error: " << e.what() << std::endl;
        return -1;
    }
    print_result(result);

    std::filesystem::path out_dir = options["-out_dir"];
    auto outfile_name = out_dir / "assignment.bpm";
    std::cout << "Saving assignment into " << outfile_name << "..."
              << std::endl;
    Assignment::Result assignment = {};
    assignment.total_score = result.total_score;
    assignment.degraded = result.degraded;
    assignment.score_matrix = result.score_matrix;
    for (const auto& match : result.matches) {
        assignment.matches.push_back(
            {match.predicted_index, match.observed_index, match.score});
    }
    Compression::DeflateStream outfile_stream;
    outfile_stream.open(outfile_name.string());
    if (!outfile_stream) {
        std::cout << "error: could not open file " << outfile_name
                  << " for writing" << std::endl;
        return -1;
    }
    if (!Assignment::Serialize::write_result(outfile_stream, assignment)) {
        std::cout << "error: the assignment could not be saved properly"
                  << std::endl;
        return -1;
    }

    return 0;
}
