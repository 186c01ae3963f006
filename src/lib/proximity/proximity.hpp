#ifndef PROXIMITY_PROXIMITY_HPP
#define PROXIMITY_PROXIMITY_HPP

#include <optional>

// Gaussian kernel transformation of a scalar distance into a similarity. The
// same kernel is used for the retention time and absorption maximum channels,
// each with its own width.
namespace Proximity {

// Default widths for the scalar channels. The retention time width is given in
// minutes and the absorption maximum width in nanometers.
constexpr double DEFAULT_RT_SIGMA = 0.5;
constexpr double DEFAULT_LMAX_SIGMA = 15.0;

// Returns exp(-0.5 * ((a - b) / sigma)^2). The score is 1 when both values are
// equal and decays monotonically towards 0 as they drift apart. If either
// value is missing or sigma is not strictly positive the score is 0.
double gaussian_score(std::optional<double> a, std::optional<double> b,
                      double sigma);

// Convenience wrappers for the scalar channels.
double rt_score(std::optional<double> rt_a, std::optional<double> rt_b,
                double sigma = DEFAULT_RT_SIGMA);
double lmax_score(std::optional<double> lmax_a, std::optional<double> lmax_b,
                  double sigma = DEFAULT_LMAX_SIGMA);

}  // namespace Proximity

#endif /* PROXIMITY_PROXIMITY_HPP */
