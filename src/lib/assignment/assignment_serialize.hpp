#ifndef ASSIGNMENT_ASSIGNMENTSERIALIZE_HPP
#define ASSIGNMENT_ASSIGNMENTSERIALIZE_HPP

#include <iostream>

#include "assignment/assignment.hpp"

// This namespace groups the functions used to serialize Assignment data
// structures into a binary stream.
namespace Assignment::Serialize {

bool read_match(std::istream &stream, Assignment::Match *match);
bool write_match(std::ostream &stream, const Assignment::Match &match);

// The score matrix is stored as the number of rows and columns (uint64)
// followed by the values in row major order.
bool read_score_matrix(std::istream &stream, ScoreMatrix::Matrix *matrix);
bool write_score_matrix(std::ostream &stream,
                        const ScoreMatrix::Matrix &matrix);

bool read_result(std::istream &stream, Assignment::Result *result);
bool write_result(std::ostream &stream, const Assignment::Result &result);

}  // namespace Assignment::Serialize

#endif /* ASSIGNMENT_ASSIGNMENTSERIALIZE_HPP */
