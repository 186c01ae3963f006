#ifndef UTILS_SERIALIZATION_HPP
#define UTILS_SERIALIZATION_HPP

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// This namespace contains necessary functions to serialize commonly used types
// into a binary stream using the little endian byte order.
namespace Serialization {

// Write/read a single byte to/from the stream.
bool read_uint8(std::istream &stream, uint8_t *value);
bool write_uint8(std::ostream &stream, uint8_t value);

// Write/read an uint64 to/from the stream.
bool read_uint64(std::istream &stream, uint64_t *value);
bool write_uint64(std::ostream &stream, uint64_t value);

bool read_double(std::istream &stream, double *value);
bool write_double(std::ostream &stream, double value);

// Strings are stored as the number of characters (uint64) followed by the
// characters themselves.
bool read_string(std::istream &stream, std::string *value);
bool write_string(std::ostream &stream, const std::string &value);

// Optional values are prefixed with a presence byte. When the byte is 0 no
// value follows on the stream.
bool read_optional_double(std::istream &stream, std::optional<double> *value);
bool write_optional_double(std::ostream &stream,
                           const std::optional<double> &value);
bool read_optional_uint64(std::istream &stream,
                          std::optional<uint64_t> *value);
bool write_optional_uint64(std::ostream &stream,
                           const std::optional<uint64_t> &value);

// Read/write a vector of elements prefixed by its size, using the given
// function for each element.
template <typename T>
bool read_vector(std::istream &stream, std::vector<T> *vec,
                 std::function<bool(std::istream &, T *)> read_elem) {
    uint64_t num_elements = 0;
    if (!read_uint64(stream, &num_elements)) {
        return false;
    }
    *vec = std::vector<T>(num_elements);
    for (size_t i = 0; i < num_elements; ++i) {
        if (!read_elem(stream, &(*vec)[i])) {
            return false;
        }
    }
    return stream.good();
}
template <typename T>
bool write_vector(std::ostream &stream, const std::vector<T> &vec,
                  std::function<bool(std::ostream &, const T &)> write_elem) {
    if (!write_uint64(stream, vec.size())) {
        return false;
    }
    for (const auto &elem : vec) {
        if (!write_elem(stream, elem)) {
            return false;
        }
    }
    return stream.good();
}

}  // namespace Serialization

#endif /* UTILS_SERIALIZATION_HPP */
