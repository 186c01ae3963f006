#ifndef UTILS_COMPRESSION_HPP
#define UTILS_COMPRESSION_HPP

#include <zlib.h>
#include <cstdio>
#include <iostream>
#include <streambuf>
#include <string>
#include <vector>

// This namespace contains the zlib backed streams used to store the binary
// record and assignment files.
namespace Compression {

enum state { OK, ERROR };

// Streambuf class allows a stream to write compressed data to a file by use of
// an intermediate buffer.
class DeflateStreambuf : public std::streambuf {
    // Buffer to store information before compression.
    std::vector<char> buffer;

    // File to write compressed data to.
    FILE *out_file = nullptr;

    // Zlib stream used in compression.
    z_stream strm = {};
    bool strm_initialized = false;

   public:
    DeflateStreambuf(size_t buffer_size = 16384);
    // Destructor flushes the buffer and finishes the zlib stream before
    // closing the file.
    virtual ~DeflateStreambuf();

    // Open file and allocate Zlib state.
    int open(std::string const &filename);

   private:
    int overflow(int c) override;  // Writes byte when buffer is full.
    int sync() override;           // Flushes the buffer.
    int write_buffer(int flush);   // Compress data from buffer to file.
};

// DeflateStream uses the DeflateStreambuf to compress the data and write to a
// file.
class DeflateStream : private DeflateStreambuf, public std::ostream {
   public:
    DeflateStream(size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {}
    DeflateStream(std::string const &filename, size_t buffer_size = 16384)
        : DeflateStreambuf(buffer_size), std::ostream(this) {
        open(filename);
    }

    // Open streambuf and check for success.
    void open(std::string const &filename);
};

// Streambuf class allows a stream to read data from a file and decompress it
// using an intermediate buffer.
class InflateStreambuf : public std::streambuf {
    // Buffers for compressed file contents and decompressed data.
    std::vector<unsigned char> in_buffer;
    std::vector<char> buffer;

    // File to read compressed data from.
    FILE *in_file = nullptr;

    // Zlib stream used in decompression.
    z_stream strm = {};
    bool strm_initialized = false;
    bool stream_end = false;

   public:
    InflateStreambuf(size_t buffer_size = 16384);
    virtual ~InflateStreambuf();

    // Open file and allocate Zlib state.
    int open(std::string const &filename);

   private:
    int underflow() override;  // Read byte when buffer is empty.
    size_t read_buffer();      // Decompress data from file into the buffer.
};

// InflateStream uses the InflateStreambuf to decompress the data read from a
// file.
class InflateStream : private InflateStreambuf, public std::istream {
   public:
    InflateStream(size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {}
    InflateStream(std::string const &filename, size_t buffer_size = 16384)
        : InflateStreambuf(buffer_size), std::istream(this) {
        open(filename);
    }

    // Open streambuf and check for success.
    void open(std::string const &filename);
};

}  // namespace Compression

#endif /* UTILS_COMPRESSION_HPP */
