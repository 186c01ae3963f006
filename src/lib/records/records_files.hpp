#ifndef RECORDS_RECORDSFILES_HPP
#define RECORDS_RECORDSFILES_HPP

#include <iostream>
#include <vector>

#include "records/records.hpp"

// Tab separated record tables as produced by the prediction and peak
// extraction collaborators. The first non comment line is a header naming the
// columns, which can appear in any order:
//
//     label   rt    lmax   mz                 intensity        peak_id
//     CCO     2.40  272    149.3,150.3        100,12           NA
//
// Empty cells or `NA` are treated as absent values. The mz and intensity cells
// hold comma separated lists. Lines starting with `#` are ignored. Unknown
// columns are ignored, and the columns that don't apply to a given record type
// (label for observed records, peak_id for predicted records) are skipped.
namespace Records::Files::Tsv {

// Read all records from the given stream. Returns false if the header is
// missing or any of the cells can't be parsed.
bool read_predicted(std::istream &stream,
                    std::vector<Records::PredictedRecord> *records);
bool read_observed(std::istream &stream,
                   std::vector<Records::ObservedRecord> *records);

}  // namespace Records::Files::Tsv

#endif /* RECORDS_RECORDSFILES_HPP */
