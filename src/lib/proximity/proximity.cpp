#include <cmath>

#include "proximity/proximity.hpp"

double Proximity::gaussian_score(std::optional<double> a,
                                 std::optional<double> b, double sigma) {
    if (!a || !b || !(sigma > 0)) {
        return 0.0;
    }
    double x = (a.value() - b.value()) / sigma;
    return std::exp(-0.5 * x * x);
}

double Proximity::rt_score(std::optional<double> rt_a,
                           std::optional<double> rt_b, double sigma) {
    return gaussian_score(rt_a, rt_b, sigma);
}

double Proximity::lmax_score(std::optional<double> lmax_a,
                             std::optional<double> lmax_b, double sigma) {
    return gaussian_score(lmax_a, lmax_b, sigma);
}
