#include <cctype>
#include <cmath>
#include <exception>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "score_matrix/score_matrix.hpp"
#include "utils/errors.hpp"

std::optional<ScoreMatrix::Channel> ScoreMatrix::parse_channel(
    std::string name) {
    for (auto &ch : name) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (name == "ms") {
        return ScoreMatrix::MS;
    }
    if (name == "rt") {
        return ScoreMatrix::RT;
    }
    if (name == "lmax" || name == "lambda_max") {
        return ScoreMatrix::LMAX;
    }
    return std::nullopt;
}

double ScoreMatrix::weight(const Weights &weights, Channel channel) {
    switch (channel) {
        case ScoreMatrix::MS:
            return weights.ms;
        case ScoreMatrix::RT:
            return weights.rt;
        case ScoreMatrix::LMAX:
            return weights.lmax;
    }
    return 0.0;
}

void ScoreMatrix::set_weight(Weights &weights, Channel channel, double value) {
    switch (channel) {
        case ScoreMatrix::MS:
            weights.ms = value;
            break;
        case ScoreMatrix::RT:
            weights.rt = value;
            break;
        case ScoreMatrix::LMAX:
            weights.lmax = value;
            break;
    }
}

void ScoreMatrix::validate(const Parameters &parameters) {
    const std::pair<const char *, double> weights[] = {
        {"ms", parameters.weights.ms},
        {"rt", parameters.weights.rt},
        {"lmax", parameters.weights.lmax},
    };
    for (const auto &[name, value] : weights) {
        if (!(value >= 0) || std::isinf(value)) {
            std::ostringstream error_stream;
            error_stream << "invalid weight for channel " << name << ": "
                         << value;
            throw PeakMatch::InvalidConfiguration(error_stream.str());
        }
    }
    if (!(parameters.rt_sigma > 0)) {
        std::ostringstream error_stream;
        error_stream << "rt_sigma has to be positive (rt_sigma: "
                     << parameters.rt_sigma << ")";
        throw PeakMatch::InvalidConfiguration(error_stream.str());
    }
    if (!(parameters.lmax_sigma > 0)) {
        std::ostringstream error_stream;
        error_stream << "lmax_sigma has to be positive (lmax_sigma: "
                     << parameters.lmax_sigma << ")";
        throw PeakMatch::InvalidConfiguration(error_stream.str());
    }
    Spectral::validate(parameters.tolerance);
}

double ScoreMatrix::score_pair(const Records::PredictedRecord &predicted,
                               const Records::ObservedRecord &observed,
                               const Parameters &parameters) {
    double weighted_sum = 0.0;
    double weight_total = 0.0;
    if (Records::has_spectrum(predicted.spectrum) &&
        Records::has_spectrum(observed.spectrum)) {
        double score = Spectral::cosine_similarity(
            predicted.spectrum.value(), observed.spectrum.value(),
            parameters.tolerance, parameters.normalize_spectra);
        weighted_sum += parameters.weights.ms * score;
        weight_total += parameters.weights.ms;
    }
    if (predicted.rt && observed.rt) {
        double score = Proximity::rt_score(predicted.rt, observed.rt,
                                           parameters.rt_sigma);
        weighted_sum += parameters.weights.rt * score;
        weight_total += parameters.weights.rt;
    }
    if (predicted.lmax && observed.lmax) {
        double score = Proximity::lmax_score(predicted.lmax, observed.lmax,
                                             parameters.lmax_sigma);
        weighted_sum += parameters.weights.lmax * score;
        weight_total += parameters.weights.lmax;
    }
    if (weight_total > 0) {
        return weighted_sum / weight_total;
    }
    return 0.0;
}

ScoreMatrix::Matrix ScoreMatrix::build_serial(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const Parameters &parameters) {
    ScoreMatrix::validate(parameters);
    Records::validate(predicted, observed);

    Matrix matrix = Matrix::Zero(predicted.size(), observed.size());
    for (size_t i = 0; i < predicted.size(); ++i) {
        for (size_t j = 0; j < observed.size(); ++j) {
            matrix(i, j) = score_pair(predicted[i], observed[j], parameters);
        }
    }
    return matrix;
}

ScoreMatrix::Matrix ScoreMatrix::build_parallel(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const Parameters &parameters, size_t max_threads) {
    ScoreMatrix::validate(parameters);
    Records::validate(predicted, observed);

    Matrix matrix = Matrix::Zero(predicted.size(), observed.size());
    if (predicted.empty() || observed.empty()) {
        return matrix;
    }

    // The number of groups/threads is set to the maximum possible concurrency.
    size_t num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0 || num_threads > max_threads) {
        num_threads = max_threads;
    }
    if (num_threads > predicted.size()) {
        num_threads = predicted.size();
    }
    if (num_threads == 0) {
        num_threads = 1;
    }

    // Split the rows into different groups for concurrency.
    std::vector<std::vector<size_t>> groups(num_threads);
    for (size_t i = 0; i < predicted.size(); ++i) {
        groups[i % num_threads].push_back(i);
    }

    std::vector<std::thread> threads(num_threads);
    std::vector<std::exception_ptr> errors(num_threads);
    auto join_all = [&threads]() {
        for (auto &thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };
    try {
        for (size_t k = 0; k < num_threads; ++k) {
            threads[k] = std::thread([&groups, &errors, &matrix, &predicted,
                                      &observed, &parameters, k]() {
                try {
                    for (const auto &i : groups[k]) {
                        for (size_t j = 0; j < observed.size(); ++j) {
                            matrix(i, j) = score_pair(predicted[i],
                                                      observed[j], parameters);
                        }
                    }
                } catch (...) {
                    errors[k] = std::current_exception();
                }
            });
        }
    } catch (const std::system_error &) {
        // The threads that did start still reference the local state.
        join_all();
        throw;
    }

    // Wait for the threads to finish.
    join_all();
    for (const auto &error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return matrix;
}
