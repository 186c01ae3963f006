#include "assignment/assignment_serialize.hpp"
#include "utils/serialization.hpp"

bool Assignment::Serialize::read_match(std::istream &stream,
                                       Assignment::Match *match) {
    Serialization::read_uint64(stream, &match->predicted_index);
    Serialization::read_uint64(stream, &match->observed_index);
    Serialization::read_double(stream, &match->score);
    return stream.good();
}

bool Assignment::Serialize::write_match(std::ostream &stream,
                                        const Assignment::Match &match) {
    Serialization::write_uint64(stream, match.predicted_index);
    Serialization::write_uint64(stream, match.observed_index);
    Serialization::write_double(stream, match.score);
    return stream.good();
}

bool Assignment::Serialize::read_score_matrix(std::istream &stream,
                                              ScoreMatrix::Matrix *matrix) {
    uint64_t n_rows = 0;
    uint64_t n_cols = 0;
    if (!Serialization::read_uint64(stream, &n_rows) ||
        !Serialization::read_uint64(stream, &n_cols)) {
        return false;
    }
    matrix->resize(n_rows, n_cols);
    for (size_t i = 0; i < n_rows; ++i) {
        for (size_t j = 0; j < n_cols; ++j) {
            if (!Serialization::read_double(stream, &(*matrix)(i, j))) {
                return false;
            }
        }
    }
    return stream.good();
}

bool Assignment::Serialize::write_score_matrix(
    std::ostream &stream, const ScoreMatrix::Matrix &matrix) {
    Serialization::write_uint64(stream, matrix.rows());
    Serialization::write_uint64(stream, matrix.cols());
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            Serialization::write_double(stream, matrix(i, j));
        }
    }
    return stream.good();
}

bool Assignment::Serialize::read_result(std::istream &stream,
                                        Assignment::Result *result) {
    Serialization::read_vector<Assignment::Match>(stream, &result->matches,
                                                  read_match);
    Serialization::read_double(stream, &result->total_score);
    uint8_t degraded = 0;
    Serialization::read_uint8(stream, &degraded);
    result->degraded = degraded != 0;
    read_score_matrix(stream, &result->score_matrix);
    return stream.good();
}

bool Assignment::Serialize::write_result(std::ostream &stream,
                                         const Assignment::Result &result) {
    Serialization::write_vector<Assignment::Match>(stream, result.matches,
                                                   write_match);
    Serialization::write_double(stream, result.total_score);
    Serialization::write_uint8(stream, result.degraded ? 1 : 0);
    write_score_matrix(stream, result.score_matrix);
    return stream.good();
}
