#ifndef RECORDS_RECORDS_HPP
#define RECORDS_RECORDS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// In this namespace we can find the compound signatures that are reconciled
// against each other. Predicted records come from reaction/property prediction
// and observed records from chromatographic peak extraction. Every channel is
// optional, absence is never encoded as a sentinel value.
namespace Records {

// A centroided mass spectrum stored as parallel arrays.
struct Spectrum {
    std::vector<double> mz;
    std::vector<double> intensity;
};

struct PredictedRecord {
    // Identity of the predicted compound, i.e. a SMILES string.
    std::string label;
    std::optional<Spectrum> spectrum;
    // Predicted retention time (min).
    std::optional<double> rt;
    // Predicted absorption maximum (nm).
    std::optional<double> lmax;
};

struct ObservedRecord {
    std::optional<Spectrum> spectrum;
    // Apex retention time of the peak (min).
    std::optional<double> rt;
    // Absorption maximum extracted from the peak spectrum (nm).
    std::optional<double> lmax;
    // Identifier of the peak region this record was extracted from.
    std::optional<uint64_t> peak_id;
};

// A spectrum takes part in scoring only if it is present and has at least one
// point.
bool has_spectrum(const std::optional<Spectrum> &spectrum);

// Check the structural integrity of a spectrum and the scalar channels. Throws
// PeakMatch::MalformedRecord if the mz and intensity arrays differ in length
// or any of the present values is not finite. The `what` argument is used
// to build the error message.
void validate(const Spectrum &spectrum, const std::string &what);
void validate(const std::optional<Spectrum> &spectrum, const std::string &what);
void validate(const PredictedRecord &record, size_t index);
void validate(const ObservedRecord &record, size_t index);
void validate(const std::vector<PredictedRecord> &predicted,
              const std::vector<ObservedRecord> &observed);

}  // namespace Records

#endif /* RECORDS_RECORDS_HPP */
