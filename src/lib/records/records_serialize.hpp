#ifndef RECORDS_RECORDSSERIALIZE_HPP
#define RECORDS_RECORDSSERIALIZE_HPP

#include <iostream>
#include <vector>

#include "records/records.hpp"

// This namespace groups the functions used to serialize Records data
// structures into a binary stream.
namespace Records::Serialize {

// Read/Write a single spectrum to/from the given binary stream. The optional
// variants store a presence byte before the spectrum.
bool read_spectrum(std::istream &stream, Records::Spectrum *spectrum);
bool write_spectrum(std::ostream &stream, const Records::Spectrum &spectrum);
bool read_optional_spectrum(std::istream &stream,
                            std::optional<Records::Spectrum> *spectrum);
bool write_optional_spectrum(std::ostream &stream,
                             const std::optional<Records::Spectrum> &spectrum);

bool read_predicted_record(std::istream &stream,
                           Records::PredictedRecord *record);
bool write_predicted_record(std::ostream &stream,
                            const Records::PredictedRecord &record);
bool read_observed_record(std::istream &stream,
                          Records::ObservedRecord *record);
bool write_observed_record(std::ostream &stream,
                           const Records::ObservedRecord &record);

// Read/Write all records to/from the given binary stream.
bool read_predicted_records(std::istream &stream,
                            std::vector<Records::PredictedRecord> *records);
bool write_predicted_records(
    std::ostream &stream, const std::vector<Records::PredictedRecord> &records);
bool read_observed_records(std::istream &stream,
                           std::vector<Records::ObservedRecord> *records);
bool write_observed_records(
    std::ostream &stream, const std::vector<Records::ObservedRecord> &records);

}  // namespace Records::Serialize

#endif /* RECORDS_RECORDSSERIALIZE_HPP */
