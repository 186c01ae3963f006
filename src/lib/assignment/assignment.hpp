#ifndef ASSIGNMENT_ASSIGNMENT_HPP
#define ASSIGNMENT_ASSIGNMENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "score_matrix/score_matrix.hpp"

// In this namespace we can find the solvers for the one to one assignment of
// predicted records (rows) to observed records (columns) that maximizes the
// total similarity of a score matrix.
namespace Assignment {

struct Match {
    uint64_t predicted_index;
    uint64_t observed_index;
    double score;
};

// The matches are sorted by predicted_index and no index appears twice on
// either side. The total score is the sum of the matched cells. If the result
// was obtained with a heuristic solver `degraded` is set, meaning the total
// score is not guaranteed to be the maximum achievable. The score matrix is
// kept for auditability.
struct Result {
    std::vector<Match> matches;
    double total_score;
    bool degraded;
    ScoreMatrix::Matrix score_matrix;
};

enum Strategy : uint8_t { EXACT = 0, GREEDY = 1 };

// Parse the strategy names used on configuration files ("exact"/"hungarian",
// "greedy").
std::optional<Strategy> parse_strategy(std::string name);
std::string to_string(Strategy strategy);

// Interface shared by the assignment strategies so that they can be swapped
// at runtime.
class Solver {
   public:
    virtual ~Solver() = default;
    virtual Result solve(const ScoreMatrix::Matrix &score_matrix) const = 0;
    virtual Strategy strategy() const = 0;
};

// Optimal assignment with the Kuhn-Munkres (Hungarian) algorithm on the cost
// matrix `1 - score`. Produces exactly min(P, O) matches, some of which may
// have a score of 0 if there is nothing better left to pair. Runs in
// O(min(P,O)^2 * max(P,O)).
class HungarianSolver : public Solver {
   public:
    Result solve(const ScoreMatrix::Matrix &score_matrix) const override;
    Strategy strategy() const override { return EXACT; }
};

// Degraded greedy assignment: the largest eligible cell is picked until no
// positive cell remains, and its row and column are removed from further
// consideration. Ties are broken by the lowest row and then the lowest column
// index. This is not optimal in general and the results are marked as
// degraded.
class GreedySolver : public Solver {
   public:
    Result solve(const ScoreMatrix::Matrix &score_matrix) const override;
    Strategy strategy() const override { return GREEDY; }
};

std::unique_ptr<Solver> make_solver(Strategy strategy);

// Minimum cost assignment for a rectangular cost matrix. Returns, for each
// row, the assigned column or nullopt if the row was left unassigned (only
// possible when there are more rows than columns).
std::vector<std::optional<size_t>> min_cost_assignment(
    const Eigen::MatrixXd &cost);

}  // namespace Assignment

#endif /* ASSIGNMENT_ASSIGNMENT_HPP */
