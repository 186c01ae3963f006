#ifndef UTILS_ERRORS_HPP
#define UTILS_ERRORS_HPP

#include <stdexcept>
#include <string>

// Exceptions raised by the library when the caller hands over something that
// can't be scored. Both derive from std::invalid_argument.
namespace PeakMatch {

// Negative weights, non-positive sigmas or an ambiguous mass tolerance.
struct InvalidConfiguration : public std::invalid_argument {
    explicit InvalidConfiguration(const std::string &what)
        : std::invalid_argument(what) {}
};

// Structurally broken input records, i.e. spectra where the number of masses
// and intensities differ.
struct MalformedRecord : public std::invalid_argument {
    explicit MalformedRecord(const std::string &what)
        : std::invalid_argument(what) {}
};

}  // namespace PeakMatch

#endif /* UTILS_ERRORS_HPP */
