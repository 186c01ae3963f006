#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "spectral/spectral.hpp"
#include "utils/errors.hpp"
#include "utils/search.hpp"

void Spectral::validate(const Tolerance &tolerance) {
    if (tolerance.mz && tolerance.ppm) {
        throw PeakMatch::InvalidConfiguration(
            "mass tolerance can be given in Da or in ppm, but not both");
    }
    if (!tolerance.mz && !tolerance.ppm) {
        throw PeakMatch::InvalidConfiguration(
            "no mass tolerance was given (Da or ppm)");
    }
    double value = tolerance.mz ? tolerance.mz.value() : tolerance.ppm.value();
    if (!(value >= 0) || std::isinf(value)) {
        std::ostringstream error_stream;
        error_stream << "invalid mass tolerance: " << value;
        throw PeakMatch::InvalidConfiguration(error_stream.str());
    }
}

double Spectral::tolerance_at(const Tolerance &tolerance, double mz) {
    if (tolerance.ppm) {
        return tolerance.ppm.value() * std::abs(mz) / 1e6;
    }
    return tolerance.mz.value_or(0.0);
}

std::vector<Spectral::PeakPair> Spectral::align_peaks(
    const Records::Spectrum &predicted, const Records::Spectrum &observed,
    const Tolerance &tolerance) {
    Records::validate(predicted, "predicted spectrum");
    Records::validate(observed, "observed spectrum");
    validate(tolerance);

    // Index both spectra by mass, dropping non-positive intensities.
    auto index_spectrum = [](const Records::Spectrum &spectrum) {
        std::vector<Search::KeySort<double>> index;
        index.reserve(spectrum.mz.size());
        for (size_t i = 0; i < spectrum.mz.size(); ++i) {
            if (spectrum.intensity[i] > 0) {
                index.push_back({i, spectrum.mz[i]});
            }
        }
        std::stable_sort(index.begin(), index.end(),
                         [](const auto &a, const auto &b) -> bool {
                             return a.sorting_key < b.sorting_key;
                         });
        return index;
    };
    auto predicted_index = index_spectrum(predicted);
    auto observed_index = index_spectrum(observed);

    std::vector<PeakPair> pairs;
    if (predicted_index.empty() || observed_index.empty()) {
        return pairs;
    }

    auto used = std::vector<bool>(observed_index.size(), false);
    for (const auto &peak : predicted_index) {
        double mz = peak.sorting_key;
        double tol = tolerance_at(tolerance, mz);
        size_t k = Search::lower_bound(observed_index, mz);

        // The nearest unused neighbour at or above the current mass.
        std::optional<size_t> above;
        for (size_t j = k; j < observed_index.size(); ++j) {
            if (observed_index[j].sorting_key - mz > tol) {
                break;
            }
            if (!used[j]) {
                above = j;
                break;
            }
        }
        // The nearest unused neighbour below the current mass.
        std::optional<size_t> below;
        for (size_t j = k; j > 0; --j) {
            if (mz - observed_index[j - 1].sorting_key > tol) {
                break;
            }
            if (!used[j - 1]) {
                below = j - 1;
                break;
            }
        }

        std::optional<size_t> best;
        double best_delta = std::numeric_limits<double>::infinity();
        for (const auto &candidate : {above, below}) {
            if (!candidate) {
                continue;
            }
            double delta =
                std::abs(observed_index[candidate.value()].sorting_key - mz);
            if (delta <= tol && delta < best_delta) {
                best_delta = delta;
                best = candidate;
            }
        }
        if (best) {
            used[best.value()] = true;
            pairs.push_back({peak.index, observed_index[best.value()].index});
        }
    }
    return pairs;
}

double Spectral::cosine_similarity(const Records::Spectrum &predicted,
                                   const Records::Spectrum &observed,
                                   const Tolerance &tolerance, bool normalize) {
    auto pairs = align_peaks(predicted, observed, tolerance);
    if (pairs.empty()) {
        return 0.0;
    }

    if (!normalize) {
        double dot = 0.0;
        for (const auto &pair : pairs) {
            dot += predicted.intensity[pair.predicted_index] *
                   observed.intensity[pair.observed_index];
        }
        return std::clamp(dot, 0.0, 1.0);
    }

    // The intensities of each side are scaled by their maximum so that the
    // sums can't overflow or underflow to zero.
    double max_a = 0.0;
    double max_b = 0.0;
    for (const auto &pair : pairs) {
        max_a = std::max(max_a, predicted.intensity[pair.predicted_index]);
        max_b = std::max(max_b, observed.intensity[pair.observed_index]);
    }
    if (max_a <= 0 || max_b <= 0) {
        return 0.0;
    }
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (const auto &pair : pairs) {
        double a = predicted.intensity[pair.predicted_index] / max_a;
        double b = observed.intensity[pair.observed_index] / max_b;
        dot += a * b;
        norm_a += a * a;
        norm_b += b * b;
    }
    dot /= std::sqrt(norm_a) * std::sqrt(norm_b);
    return std::clamp(dot, 0.0, 1.0);
}
