#include <sstream>
#include <stdexcept>

#include "reconcile/reconcile.hpp"

Reconcile::Result Reconcile::assemble(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const Assignment::Result &assignment) {
    if (static_cast<size_t>(assignment.score_matrix.rows()) !=
            predicted.size() ||
        static_cast<size_t>(assignment.score_matrix.cols()) !=
            observed.size()) {
        std::ostringstream error_stream;
        error_stream << "the assignment was computed for a "
                     << assignment.score_matrix.rows() << "x"
                     << assignment.score_matrix.cols()
                     << " score matrix but there are " << predicted.size()
                     << " predicted and " << observed.size()
                     << " observed records";
        throw std::invalid_argument(error_stream.str());
    }

    Result result = {};
    result.total_score = assignment.total_score;
    result.degraded = assignment.degraded;
    result.score_matrix = assignment.score_matrix;

    auto predicted_used = std::vector<bool>(predicted.size(), false);
    auto observed_used = std::vector<bool>(observed.size(), false);
    for (const auto &match : assignment.matches) {
        if (match.predicted_index >= predicted.size() ||
            match.observed_index >= observed.size() ||
            predicted_used[match.predicted_index] ||
            observed_used[match.observed_index]) {
            std::ostringstream error_stream;
            error_stream << "invalid match (" << match.predicted_index << ", "
                         << match.observed_index << ") on the assignment";
            throw std::invalid_argument(error_stream.str());
        }
        result.matches.push_back({match.predicted_index, match.observed_index,
                                  match.score,
                                  predicted[match.predicted_index],
                                  observed[match.observed_index]});
        predicted_used[match.predicted_index] = true;
        observed_used[match.observed_index] = true;
    }
    for (size_t i = 0; i < predicted_used.size(); ++i) {
        if (!predicted_used[i]) {
            result.unmatched_predicted.push_back(i);
        }
    }
    for (size_t j = 0; j < observed_used.size(); ++j) {
        if (!observed_used[j]) {
            result.unmatched_observed.push_back(j);
        }
    }
    return result;
}

Reconcile::Result Reconcile::reconcile(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const ScoreMatrix::Parameters &parameters,
    const Assignment::Solver &solver, size_t max_threads) {
    ScoreMatrix::Matrix score_matrix;
    if (max_threads > 1) {
        score_matrix = ScoreMatrix::build_parallel(predicted, observed,
                                                   parameters, max_threads);
    } else {
        score_matrix =
            ScoreMatrix::build_serial(predicted, observed, parameters);
    }
    auto assignment = solver.solve(score_matrix);
    return assemble(predicted, observed, assignment);
}

std::vector<std::optional<std::string>> Reconcile::annotate_observed(
    const Result &result, size_t n_observed) {
    std::vector<std::optional<std::string>> labels(n_observed);
    for (const auto &match : result.matches) {
        if (match.observed_index >= n_observed) {
            continue;
        }
        labels[match.observed_index] = match.predicted.label;
    }
    return labels;
}
