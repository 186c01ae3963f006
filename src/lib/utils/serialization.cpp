#include <cstring>

#include "utils/serialization.hpp"

namespace {
// Write/read an unsigned integer of N bytes one byte at a time, least
// significant byte first, so that the result does not depend on the host
// endianness.
template <typename T>
bool read_le(std::istream &stream, T *value) {
    T ret = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = 0;
        stream.read(&byte, 1);
        ret |= static_cast<T>(static_cast<uint8_t>(byte)) << (8 * i);
    }
    if (!stream.good()) {
        return false;
    }
    *value = ret;
    return true;
}
template <typename T>
bool write_le(std::ostream &stream, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = static_cast<char>((value >> (8 * i)) & 0xFF);
        stream.write(&byte, 1);
    }
    return stream.good();
}
}  // namespace

bool Serialization::read_uint8(std::istream &stream, uint8_t *value) {
    return read_le(stream, value);
}

bool Serialization::write_uint8(std::ostream &stream, uint8_t value) {
    return write_le(stream, value);
}

bool Serialization::read_uint64(std::istream &stream, uint64_t *value) {
    return read_le(stream, value);
}

bool Serialization::write_uint64(std::ostream &stream, uint64_t value) {
    return write_le(stream, value);
}

bool Serialization::read_double(std::istream &stream, double *value) {
    static_assert(sizeof(double) == sizeof(uint64_t));
    uint64_t raw = 0;
    if (!read_uint64(stream, &raw)) {
        return false;
    }
    std::memcpy(value, &raw, sizeof(double));
    return true;
}

bool Serialization::write_double(std::ostream &stream, double value) {
    uint64_t raw = 0;
    std::memcpy(&raw, &value, sizeof(double));
    return write_uint64(stream, raw);
}

bool Serialization::read_string(std::istream &stream, std::string *value) {
    uint64_t num_chars = 0;
    if (!read_uint64(stream, &num_chars)) {
        return false;
    }
    value->resize(num_chars);
    if (num_chars > 0) {
        stream.read(&(*value)[0], num_chars);
    }
    return stream.good();
}

bool Serialization::write_string(std::ostream &stream,
                                 const std::string &value) {
    write_uint64(stream, value.size());
    stream.write(value.data(), value.size());
    return stream.good();
}

bool Serialization::read_optional_double(std::istream &stream,
                                         std::optional<double> *value) {
    uint8_t present = 0;
    if (!read_uint8(stream, &present)) {
        return false;
    }
    if (!present) {
        *value = std::nullopt;
        return true;
    }
    double ret = 0;
    if (!read_double(stream, &ret)) {
        return false;
    }
    *value = ret;
    return true;
}

bool Serialization::write_optional_double(std::ostream &stream,
                                          const std::optional<double> &value) {
    write_uint8(stream, value ? 1 : 0);
    if (value) {
        write_double(stream, value.value());
    }
    return stream.good();
}

bool Serialization::read_optional_uint64(std::istream &stream,
                                         std::optional<uint64_t> *value) {
    uint8_t present = 0;
    if (!read_uint8(stream, &present)) {
        return false;
    }
    if (!present) {
        *value = std::nullopt;
        return true;
    }
    uint64_t ret = 0;
    if (!read_uint64(stream, &ret)) {
        return false;
    }
    *value = ret;
    return true;
}

bool Serialization::write_optional_uint64(
    std::ostream &stream, const std::optional<uint64_t> &value) {
    write_uint8(stream, value ? 1 : 0);
    if (value) {
        write_uint64(stream, value.value());
    }
    return stream.good();
}
