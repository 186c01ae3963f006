#include <cmath>
#include <sstream>

#include "records/records.hpp"
#include "utils/errors.hpp"

namespace {
void validate_scalar(const std::optional<double> &value, const char *channel,
                     const std::string &what) {
    if (value && !std::isfinite(value.value())) {
        std::ostringstream error_stream;
        error_stream << what << ": " << channel << " is not a finite number";
        throw PeakMatch::MalformedRecord(error_stream.str());
    }
}

std::string record_name(const char *kind, size_t index) {
    std::ostringstream name;
    name << kind << " record " << index;
    return name.str();
}
}  // namespace

bool Records::has_spectrum(const std::optional<Spectrum> &spectrum) {
    return spectrum && !spectrum->mz.empty() && !spectrum->intensity.empty();
}

void Records::validate(const Spectrum &spectrum, const std::string &what) {
    if (spectrum.mz.size() != spectrum.intensity.size()) {
        std::ostringstream error_stream;
        error_stream << what << ": spectrum has " << spectrum.mz.size()
                     << " mz values but " << spectrum.intensity.size()
                     << " intensity values";
        throw PeakMatch::MalformedRecord(error_stream.str());
    }
    for (size_t i = 0; i < spectrum.mz.size(); ++i) {
        if (!std::isfinite(spectrum.mz[i]) ||
            !std::isfinite(spectrum.intensity[i])) {
            std::ostringstream error_stream;
            error_stream << what << ": spectrum point " << i
                         << " is not a finite number";
            throw PeakMatch::MalformedRecord(error_stream.str());
        }
    }
}

void Records::validate(const std::optional<Spectrum> &spectrum,
                       const std::string &what) {
    if (spectrum) {
        validate(spectrum.value(), what);
    }
}

void Records::validate(const PredictedRecord &record, size_t index) {
    auto what = record_name("predicted", index);
    validate(record.spectrum, what);
    validate_scalar(record.rt, "rt", what);
    validate_scalar(record.lmax, "lmax", what);
}

void Records::validate(const ObservedRecord &record, size_t index) {
    auto what = record_name("observed", index);
    validate(record.spectrum, what);
    validate_scalar(record.rt, "rt", what);
    validate_scalar(record.lmax, "lmax", what);
}

void Records::validate(const std::vector<PredictedRecord> &predicted,
                       const std::vector<ObservedRecord> &observed) {
    for (size_t i = 0; i < predicted.size(); ++i) {
        validate(predicted[i], i);
    }
    for (size_t j = 0; j < observed.size(); ++j) {
        validate(observed[j], j);
    }
}
