#include "records/records_serialize.hpp"
#include "utils/serialization.hpp"

namespace {
bool read_doubles(std::istream &stream, std::vector<double> *values) {
    return Serialization::read_vector<double>(stream, values,
                                              Serialization::read_double);
}
bool write_doubles(std::ostream &stream, const std::vector<double> &values) {
    return Serialization::write_vector<double>(
        stream, values, [](std::ostream &s, const double &value) {
            return Serialization::write_double(s, value);
        });
}
}  // namespace

bool Records::Serialize::read_spectrum(std::istream &stream,
                                       Records::Spectrum *spectrum) {
    read_doubles(stream, &spectrum->mz);
    read_doubles(stream, &spectrum->intensity);
    return stream.good();
}

bool Records::Serialize::write_spectrum(std::ostream &stream,
                                        const Records::Spectrum &spectrum) {
    write_doubles(stream, spectrum.mz);
    write_doubles(stream, spectrum.intensity);
    return stream.good();
}

bool Records::Serialize::read_optional_spectrum(
    std::istream &stream, std::optional<Records::Spectrum> *spectrum) {
    uint8_t present = 0;
    if (!Serialization::read_uint8(stream, &present)) {
        return false;
    }
    if (!present) {
        *spectrum = std::nullopt;
        return stream.good();
    }
    Records::Spectrum value;
    if (!read_spectrum(stream, &value)) {
        return false;
    }
    *spectrum = std::move(value);
    return stream.good();
}

bool Records::Serialize::write_optional_spectrum(
    std::ostream &stream, const std::optional<Records::Spectrum> &spectrum) {
    Serialization::write_uint8(stream, spectrum ? 1 : 0);
    if (spectrum) {
        write_spectrum(stream, spectrum.value());
    }
    return stream.good();
}

bool Records::Serialize::read_predicted_record(
    std::istream &stream, Records::PredictedRecord *record) {
    Serialization::read_string(stream, &record->label);
    read_optional_spectrum(stream, &record->spectrum);
    Serialization::read_optional_double(stream, &record->rt);
    Serialization::read_optional_double(stream, &record->lmax);
    return stream.good();
}

bool Records::Serialize::write_predicted_record(
    std::ostream &stream, const Records::PredictedRecord &record) {
    Serialization::write_string(stream, record.label);
    write_optional_spectrum(stream, record.spectrum);
    Serialization::write_optional_double(stream, record.rt);
    Serialization::write_optional_double(stream, record.lmax);
    return stream.good();
}

bool Records::Serialize::read_observed_record(std::istream &stream,
                                              Records::ObservedRecord *record) {
    read_optional_spectrum(stream, &record->spectrum);
    Serialization::read_optional_double(stream, &record->rt);
    Serialization::read_optional_double(stream, &record->lmax);
    Serialization::read_optional_uint64(stream, &record->peak_id);
    return stream.good();
}

bool Records::Serialize::write_observed_record(
    std::ostream &stream, const Records::ObservedRecord &record) {
    write_optional_spectrum(stream, record.spectrum);
    Serialization::write_optional_double(stream, record.rt);
    Serialization::write_optional_double(stream, record.lmax);
    Serialization::write_optional_uint64(stream, record.peak_id);
    return stream.good();
}

bool Records::Serialize::read_predicted_records(
    std::istream &stream, std::vector<Records::PredictedRecord> *records) {
    return Serialization::read_vector<Records::PredictedRecord>(
        stream, records, Records::Serialize::read_predicted_record);
}

bool Records::Serialize::write_predicted_records(
    std::ostream &stream, const std::vector<Records::PredictedRecord> &records) {
    return Serialization::write_vector<Records::PredictedRecord>(
        stream, records, Records::Serialize::write_predicted_record);
}

bool Records::Serialize::read_observed_records(
    std::istream &stream, std::vector<Records::ObservedRecord> *records) {
    return Serialization::read_vector<Records::ObservedRecord>(
        stream, records, Records::Serialize::read_observed_record);
}

bool Records::Serialize::write_observed_records(
    std::ostream &stream, const std::vector<Records::ObservedRecord> &records) {
    return Serialization::write_vector<Records::ObservedRecord>(
        stream, records, Records::Serialize::write_observed_record);
}
