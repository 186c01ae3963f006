#ifndef SCOREMATRIX_SCOREMATRIX_HPP
#define SCOREMATRIX_SCOREMATRIX_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Eigen/Core"

#include "proximity/proximity.hpp"
#include "records/records.hpp"
#include "spectral/spectral.hpp"

// In this namespace we can find the functions to build the aggregate
// similarity matrix between predicted and observed records.
namespace ScoreMatrix {

// Dense matrix with one row per predicted record and one column per observed
// record. Every cell is a similarity in [0, 1].
using Matrix = Eigen::MatrixXd;

// The similarity channels that can contribute to a cell.
enum Channel : uint8_t { MS = 0, RT = 1, LMAX = 2 };

// Parse the channel names used on configuration files ("ms", "rt", "lmax").
std::optional<Channel> parse_channel(std::string name);

// Non-negative weight for each channel. The weights don't need to add up to 1,
// since each cell is normalized by the weights of the channels that were
// actually evaluated for that pair.
struct Weights {
    double ms = 0.5;
    double rt = 0.3;
    double lmax = 0.2;
};

double weight(const Weights &weights, Channel channel);
void set_weight(Weights &weights, Channel channel, double value);

// The parameters used to build the score matrix.
//
// - weights: The relative weight of each channel.
// - tolerance: The mass tolerance for spectral alignment (Da XOR ppm).
// - rt_sigma: Width of the retention time kernel.
// - lmax_sigma: Width of the absorption maximum kernel.
// - normalize_spectra: Use unit intensity vectors for the spectral channel.
struct Parameters {
    Weights weights;
    Spectral::Tolerance tolerance =
        Spectral::absolute_tolerance(Spectral::DEFAULT_MZ_TOLERANCE);
    double rt_sigma = Proximity::DEFAULT_RT_SIGMA;
    double lmax_sigma = Proximity::DEFAULT_LMAX_SIGMA;
    bool normalize_spectra = true;
};

// Throws PeakMatch::InvalidConfiguration for negative weights, non-positive
// sigmas or an invalid mass tolerance.
void validate(const Parameters &parameters);

// The aggregate score for a single pair. Each channel is only evaluated if the
// data is present on both records, and the weighted sum is divided by the sum
// of the weights of the evaluated channels. If no channel could be evaluated
// (or all the evaluated channels have weight 0) the score is 0. The records
// and parameters are assumed to be validated.
double score_pair(const Records::PredictedRecord &predicted,
                  const Records::ObservedRecord &observed,
                  const Parameters &parameters);

// Build the score matrix in serial. The parameters and every record are
// validated before computing the first cell, so a configuration error never
// results in a partially built matrix.
Matrix build_serial(const std::vector<Records::PredictedRecord> &predicted,
                    const std::vector<Records::ObservedRecord> &observed,
                    const Parameters &parameters);

// Build the score matrix in parallel. The rows are distributed between at
// most max_threads threads, each writing to a disjoint set of cells. The
// result is identical to build_serial.
Matrix build_parallel(const std::vector<Records::PredictedRecord> &predicted,
                      const std::vector<Records::ObservedRecord> &observed,
                      const Parameters &parameters, size_t max_threads);

}  // namespace ScoreMatrix

#endif /* SCOREMATRIX_SCOREMATRIX_HPP */
