#ifndef SPECTRAL_SPECTRAL_HPP
#define SPECTRAL_SPECTRAL_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "records/records.hpp"

// In this namespace we can find the functions to compare two centroided mass
// spectra.
namespace Spectral {

// The mass tolerance used to align two spectra. Exactly one of the two members
// must be set: an absolute window in Da or a relative window in parts per
// million of the predicted mass.
struct Tolerance {
    std::optional<double> mz;
    std::optional<double> ppm;
};

constexpr double DEFAULT_MZ_TOLERANCE = 0.01;

inline Tolerance absolute_tolerance(double mz) { return {mz, std::nullopt}; }
inline Tolerance ppm_tolerance(double ppm) { return {std::nullopt, ppm}; }

// Throws PeakMatch::InvalidConfiguration if both or neither of the tolerance
// kinds are set, or if the set value is negative or not a number.
void validate(const Tolerance &tolerance);

// The absolute window in Da around the given mass.
double tolerance_at(const Tolerance &tolerance, double mz);

// A pair of aligned peaks. The indexes refer to the positions in the original
// (unfiltered) spectra.
struct PeakPair {
    size_t predicted_index;
    size_t observed_index;
};

// Greedy one to one alignment of two spectra. Peaks with non-positive
// intensity are ignored. The predicted peaks are visited in ascending mass
// order and each one takes the nearest observed peak that has not been used
// yet, if it falls within the tolerance. On equidistant candidates the heavier
// observed peak wins. Peaks left without a partner are not part of the
// result.
//
// NOTE: Since the alignment is greedy and the ppm window is computed from the
// predicted mass, swapping the arguments is only guaranteed to produce the
// mirrored alignment when the peaks within tolerance of each other are not
// contended. With crowded spectra the result is an approximation of a
// symmetric alignment.
std::vector<PeakPair> align_peaks(const Records::Spectrum &predicted,
                                  const Records::Spectrum &observed,
                                  const Tolerance &tolerance);

// Cosine similarity of the aligned intensity vectors, clamped to [0, 1]. When
// `normalize` is false the raw aligned intensities are multiplied instead of
// the unit vectors, which is only meaningful for pre-scaled spectra. Returns 0
// if either spectrum is empty after removing non-positive intensities or if no
// peaks align. Throws PeakMatch::MalformedRecord if any of the spectra have
// mismatched mz/intensity arrays.
double cosine_similarity(const Records::Spectrum &predicted,
                         const Records::Spectrum &observed,
                         const Tolerance &tolerance, bool normalize = true);

}  // namespace Spectral

#endif /* SPECTRAL_SPECTRAL_HPP */
