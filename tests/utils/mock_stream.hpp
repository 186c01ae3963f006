#ifndef TESTUTILS_MOCKSTREAM_HPP
#define TESTUTILS_MOCKSTREAM_HPP

#include <iostream>
#include <streambuf>
#include <vector>

// In-memory binary stream used to test the serialization functions without
// touching the filesystem. Written bytes are appended to the back of the
// buffer and reads consume it from the front, so that a value can be written
// and read back with the same object.
struct MockStream : public std::iostream {
    struct VectorStream : public std::streambuf {
        std::vector<char> data;
        size_t read_position = 0;

        int_type overflow(int_type ch) override {
            if (traits_type::eq_int_type(ch, traits_type::eof())) {
                return traits_type::not_eof(ch);
            }
            data.push_back(traits_type::to_char_type(ch));
            return ch;
        }
        std::streamsize xsputn(const char *s, std::streamsize n) override {
            data.insert(data.end(), s, s + n);
            return n;
        }
        int_type underflow() override {
            if (read_position >= data.size()) {
                return traits_type::eof();
            }
            return traits_type::to_int_type(data[read_position]);
        }
        int_type uflow() override {
            if (read_position >= data.size()) {
                return traits_type::eof();
            }
            return traits_type::to_int_type(data[read_position++]);
        }
    } m_vs;

    MockStream() : std::iostream(nullptr) { rdbuf(&m_vs); }
    MockStream(const std::vector<char> &bytes) : std::iostream(nullptr) {
        m_vs.data = bytes;
        rdbuf(&m_vs);
    }

    const std::vector<char> &bytes() const { return m_vs.data; }
    // Number of bytes that have not been consumed yet.
    size_t remaining() const { return m_vs.data.size() - m_vs.read_position; }
};

#endif /* TESTUTILS_MOCKSTREAM_HPP */
