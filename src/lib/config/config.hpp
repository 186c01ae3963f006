#ifndef CONFIG_CONFIG_HPP
#define CONFIG_CONFIG_HPP

#include <iostream>
#include <map>
#include <string>

// In this namespace we can find the functions to read the JSON configuration
// file of peakmatch-cli and to combine it with the command line flags.
namespace Config {

// Option values keyed by their command line flag name, i.e. "-rt_sigma".
using Options = std::map<std::string, std::string>;

// Parse the "peakmatch" section of a JSON configuration file:
//
//     {
//         "peakmatch": {
//             "parameters": {"rt_sigma": 0.5, "mz_tol": 0.01, ...},
//             "weights": {"ms": 0.5, "rt": 0.3, "lmax": 0.2}
//         }
//     }
//
// The keys of "parameters" are returned as "-<key>" and the keys of "weights"
// as "-w_<key>". Lines starting with '#' are ignored. This is a very
// simplistic parser that doesn't validate the JSON file, and nested objects
// other than "parameters" and "weights" are not supported. Throws
// std::invalid_argument if the section is missing or malformed.
Options parse_json(std::istream &stream);

// Add the options read from the configuration file to the ones given on the
// command line. Command line flags take precedence. The absolute and relative
// mass tolerances are alternatives: if either of them is given on the command
// line, both are dropped from the configuration file.
void merge(Options &options, const Options &config);

}  // namespace Config

#endif /* CONFIG_CONFIG_HPP */
