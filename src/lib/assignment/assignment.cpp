#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include "assignment/assignment.hpp"

namespace {
void check_finite(const ScoreMatrix::Matrix &score_matrix) {
    if (!score_matrix.allFinite()) {
        throw std::invalid_argument(
            "the score matrix contains non finite values");
    }
}

void sort_matches(std::vector<Assignment::Match> &matches) {
    std::sort(matches.begin(), matches.end(),
              [](const Assignment::Match &a,
                 const Assignment::Match &b) -> bool {
                  return a.predicted_index < b.predicted_index;
              });
}
}  // namespace

std::optional<Assignment::Strategy> Assignment::parse_strategy(
    std::string name) {
    for (auto &ch : name) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (name == "exact" || name == "hungarian") {
        return Assignment::EXACT;
    }
    if (name == "greedy") {
        return Assignment::GREEDY;
    }
    return std::nullopt;
}

std::string Assignment::to_string(Strategy strategy) {
    switch (strategy) {
        case Assignment::EXACT:
            return "exact";
        case Assignment::GREEDY:
            return "greedy";
    }
    return "unknown";
}

std::unique_ptr<Assignment::Solver> Assignment::make_solver(
    Strategy strategy) {
    switch (strategy) {
        case Assignment::EXACT:
            return std::make_unique<HungarianSolver>();
        case Assignment::GREEDY:
            return std::make_unique<GreedySolver>();
    }
    throw std::invalid_argument("unknown assignment strategy");
}

// Shortest augmenting path formulation of the Hungarian algorithm with row
// and column potentials. The matrix is transposed if needed so that the number
// of rows n is never larger than the number of columns m. Indexes in the
// working arrays are 1-based, column 0 is a virtual column used as the root of
// each augmenting path.
std::vector<std::optional<size_t>> Assignment::min_cost_assignment(
    const Eigen::MatrixXd &cost) {
    bool transposed = cost.rows() > cost.cols();
    Eigen::MatrixXd a = cost;
    if (transposed) {
        a.transposeInPlace();
    }
    size_t n = a.rows();
    size_t m = a.cols();
    std::vector<std::optional<size_t>> row_assignment(cost.rows());
    if (n == 0 || m == 0) {
        return row_assignment;
    }

    const double inf = std::numeric_limits<double>::infinity();
    std::vector<double> u(n + 1, 0.0);
    std::vector<double> v(m + 1, 0.0);
    // p[j]: row matched to column j (0 if none). way[j]: previous column on the
    // augmenting path.
    std::vector<size_t> p(m + 1, 0);
    std::vector<size_t> way(m + 1, 0);
    for (size_t i = 1; i <= n; ++i) {
        p[0] = i;
        size_t j0 = 0;
        std::vector<double> minv(m + 1, inf);
        std::vector<bool> used(m + 1, false);
        do {
            used[j0] = true;
            size_t i0 = p[j0];
            double delta = inf;
            size_t j1 = 0;
            for (size_t j = 1; j <= m; ++j) {
                if (used[j]) {
                    continue;
                }
                double cur = a(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (size_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // Flip the matching along the augmenting path.
        do {
            size_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    for (size_t j = 1; j <= m; ++j) {
        if (p[j] == 0) {
            continue;
        }
        size_t row = p[j] - 1;
        size_t col = j - 1;
        if (transposed) {
            row_assignment[col] = row;
        } else {
            row_assignment[row] = col;
        }
    }
    return row_assignment;
}

Assignment::Result Assignment::HungarianSolver::solve(
    const ScoreMatrix::Matrix &score_matrix) const {
    check_finite(score_matrix);
    Result result = {};
    result.degraded = false;
    result.total_score = 0.0;
    result.score_matrix = score_matrix;
    if (score_matrix.size() == 0) {
        return result;
    }

    // The assignment is solved as a minimization problem.
    Eigen::MatrixXd cost = 1.0 - score_matrix.array();
    auto row_assignment = min_cost_assignment(cost);
    for (size_t i = 0; i < row_assignment.size(); ++i) {
        if (!row_assignment[i]) {
            continue;
        }
        size_t j = row_assignment[i].value();
        double score = score_matrix(i, j);
        result.matches.push_back({i, j, score});
        result.total_score += score;
    }
    sort_matches(result.matches);
    return result;
}

Assignment::Result Assignment::GreedySolver::solve(
    const ScoreMatrix::Matrix &score_matrix) const {
    check_finite(score_matrix);
    Result result = {};
    result.degraded = true;
    result.total_score = 0.0;
    result.score_matrix = score_matrix;

    size_t n_rows = score_matrix.rows();
    size_t n_cols = score_matrix.cols();
    // Rows and columns are marked as not eligible once matched instead of
    // overwriting the matrix values.
    auto eligible_rows = std::vector<bool>(n_rows, true);
    auto eligible_cols = std::vector<bool>(n_cols, true);
    while (true) {
        std::optional<std::pair<size_t, size_t>> best;
        double best_score = 0.0;
        for (size_t i = 0; i < n_rows; ++i) {
            if (!eligible_rows[i]) {
                continue;
            }
            for (size_t j = 0; j < n_cols; ++j) {
                if (!eligible_cols[j]) {
                    continue;
                }
                // Strict comparison in row-major order keeps the first cell
                // found among equal values.
                if (!best || score_matrix(i, j) > best_score) {
                    best = {i, j};
                    best_score = score_matrix(i, j);
                }
            }
        }
        if (!best || best_score <= 0) {
            break;
        }
        auto [i, j] = best.value();
        result.matches.push_back({i, j, best_score});
        result.total_score += best_score;
        eligible_rows[i] = false;
        eligible_cols[j] = false;
    }
    sort_matches(result.matches);
    return result;
}
