#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "config/config.hpp"

namespace {
// Helper function to trim the whitespace surrounding a string.
void trim_space(std::string &s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

// Extract the key/value pairs of the flat JSON object with the given name and
// store them in the options map with the given prefix.
void parse_json_object(const std::string &content, const std::string &name,
                       const std::string &prefix, Config::Options &options) {
    auto pos = content.find("\"" + name + "\"");
    if (pos == std::string::npos) {
        return;
    }
    auto begin = content.find("{", pos);
    auto end = begin == std::string::npos ? begin : content.find("}", begin);
    if (end == std::string::npos) {
        throw std::invalid_argument("malformed \"" + name +
                                    "\" object on the config file");
    }
    ++begin;

    auto object = content.substr(begin, end - begin);
    for (auto &ch : object) {
        if (ch == ',' || ch == ':' || ch == '"') {
            ch = ' ';
        }
    }
    std::stringstream ss(object);
    while (ss.good()) {
        std::string key;
        std::string value;
        ss >> key;
        ss >> value;
        if (key.empty()) {
            continue;
        }
        if (value.empty()) {
            throw std::invalid_argument("missing value for \"" + key +
                                        "\" on the config file");
        }
        options[prefix + key] = value;
    }
}

const std::vector<std::string> mass_tolerance_flags = {"-mz_tol", "-ppm"};
}  // namespace

Config::Options Config::parse_json(std::istream &stream) {
    std::string line;
    std::string content;
    while (std::getline(stream, line)) {
        trim_space(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        content += line + " ";
    }

    std::regex peakmatch_regex(
        "\"peakmatch\"[[:space:]]*:[[:space:]]*\\{(.*)\\}");
    std::smatch matches;
    std::regex_search(content, matches, peakmatch_regex);
    if (matches.size() != 2 || matches[1].str().empty()) {
        throw std::invalid_argument(
            "could not find \"peakmatch\" on the config file");
    }
    content = matches[1];

    Options options;
    parse_json_object(content, "parameters", "-", options);
    parse_json_object(content, "weights", "-w_", options);
    return options;
}

void Config::merge(Options &options, const Options &config) {
    bool tolerance_given = false;
    for (const auto &flag : mass_tolerance_flags) {
        if (options.find(flag) != options.end()) {
            tolerance_given = true;
        }
    }
    for (const auto &[key, value] : config) {
        if (tolerance_given &&
            std::find(mass_tolerance_flags.begin(), mass_tolerance_flags.end(),
                      key) != mass_tolerance_flags.end()) {
            continue;
        }
        options.insert({key, value});
    }
}
