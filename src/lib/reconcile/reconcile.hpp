#ifndef RECONCILE_RECONCILE_HPP
#define RECONCILE_RECONCILE_HPP

#include <optional>
#include <string>
#include <vector>

#include "assignment/assignment.hpp"
#include "records/records.hpp"
#include "score_matrix/score_matrix.hpp"

// In this namespace we can find the functions that run the complete
// reconciliation between predicted and observed records and join the
// assignment back to the input records.
namespace Reconcile {

// A predicted record paired with the observed record it was assigned to.
struct Match {
    uint64_t predicted_index;
    uint64_t observed_index;
    double score;
    Records::PredictedRecord predicted;
    Records::ObservedRecord observed;
};

// The unmatched indices are sorted and refer to the input vectors. Records
// without a partner are kept for inspection and are not an error.
struct Result {
    std::vector<Match> matches;
    std::vector<uint64_t> unmatched_predicted;
    std::vector<uint64_t> unmatched_observed;
    double total_score;
    bool degraded;
    ScoreMatrix::Matrix score_matrix;
};

// Join an assignment with the records that were used to build its score
// matrix.
Result assemble(const std::vector<Records::PredictedRecord> &predicted,
                const std::vector<Records::ObservedRecord> &observed,
                const Assignment::Result &assignment);

// Build the score matrix, solve the assignment with the given solver and
// assemble the result. If max_threads is larger than 1 the score matrix is
// built in parallel. Throws PeakMatch::InvalidConfiguration or
// PeakMatch::MalformedRecord before any work is done if the inputs are not
// valid.
Result reconcile(const std::vector<Records::PredictedRecord> &predicted,
                 const std::vector<Records::ObservedRecord> &observed,
                 const ScoreMatrix::Parameters &parameters,
                 const Assignment::Solver &solver, size_t max_threads = 1);

// Returns for each observed record the label of the predicted record it was
// matched to, or nullopt if it was left unmatched.
std::vector<std::optional<std::string>> annotate_observed(
    const Result &result, size_t n_observed);

}  // namespace Reconcile

#endif /* RECONCILE_RECONCILE_HPP */
