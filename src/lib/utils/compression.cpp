#include "utils/compression.hpp"

Compression::DeflateStreambuf::DeflateStreambuf(size_t buffer_size)
    : buffer(buffer_size) {
    setp(buffer.data(), buffer.data() + buffer.size());
}

// Flush whatever is left on the buffer and let zlib write the end of the
// compressed stream before closing the file.
Compression::DeflateStreambuf::~DeflateStreambuf() {
    if (strm_initialized && out_file) {
        sync();
        write_buffer(Z_FINISH);
    }
    if (out_file) {
        fclose(out_file);
    }
    if (strm_initialized) {
        (void)deflateEnd(&strm);
    }
}

int Compression::DeflateStreambuf::open(std::string const &filename) {
    out_file = fopen(filename.c_str(), "wb");
    if (out_file == nullptr) {
        return ERROR;
    }

    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    if (deflateInit(&strm, Z_DEFAULT_COMPRESSION) != Z_OK) {
        return ERROR;
    }
    strm_initialized = true;
    return OK;
}

int Compression::DeflateStreambuf::overflow(int c) {
    if (sync() == -1) {
        return EOF;
    }
    if (c == EOF) {
        return 0;
    }
    return sputc(static_cast<char>(c));
}

int Compression::DeflateStreambuf::sync() {
    if (!strm_initialized || out_file == nullptr) {
        return -1;
    }
    if (pptr() > pbase()) {
        int ret = write_buffer(Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }
        setp(buffer.data(), buffer.data() + buffer.size());
    }
    return 0;
}

// Compress the pending section of the buffer into the output file. Zlib may
// keep part of the compressed data in its internal state until it is called
// with Z_FINISH.
int Compression::DeflateStreambuf::write_buffer(int flush) {
    strm.avail_in = pptr() - pbase();
    strm.next_in = reinterpret_cast<unsigned char *>(pbase());

    std::vector<unsigned char> out(buffer.size());
    int ret = Z_OK;
    do {
        strm.avail_out = out.size();
        strm.next_out = out.data();
        ret = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            return ret;
        }
        size_t have = out.size() - strm.avail_out;
        if (fwrite(out.data(), 1, have, out_file) != have ||
            ferror(out_file)) {
            return Z_ERRNO;
        }
    } while (strm.avail_out == 0);
    return ret == Z_STREAM_END ? Z_OK : ret;
}

void Compression::DeflateStream::open(std::string const &filename) {
    if (DeflateStreambuf::open(filename) == ERROR) {
        setstate(std::ios::badbit);
    }
}

Compression::InflateStreambuf::InflateStreambuf(size_t buffer_size)
    : in_buffer(buffer_size), buffer(buffer_size) {
    setg(buffer.data(), buffer.data() + buffer.size(),
         buffer.data() + buffer.size());
}

Compression::InflateStreambuf::~InflateStreambuf() {
    if (in_file) {
        fclose(in_file);
    }
    if (strm_initialized) {
        (void)inflateEnd(&strm);
    }
}

int Compression::InflateStreambuf::open(std::string const &filename) {
    in_file = fopen(filename.c_str(), "rb");
    if (in_file == nullptr) {
        return ERROR;
    }

    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;
    if (inflateInit(&strm) != Z_OK) {
        return ERROR;
    }
    strm_initialized = true;
    return OK;
}

int Compression::InflateStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    size_t nread = read_buffer();
    if (nread == 0) {
        return EOF;
    }
    setg(buffer.data(), buffer.data(), buffer.data() + nread);
    return traits_type::to_int_type(*gptr());
}

// Fill the output buffer with decompressed data. The unconsumed compressed
// input stays in in_buffer between calls. Returns the number of bytes
// decompressed, 0 on EOF or error.
size_t Compression::InflateStreambuf::read_buffer() {
    if (!strm_initialized || in_file == nullptr || stream_end) {
        return 0;
    }
    strm.avail_out = buffer.size();
    strm.next_out = reinterpret_cast<unsigned char *>(buffer.data());
    while (strm.avail_out != 0) {
        if (strm.avail_in == 0) {
            strm.avail_in = fread(in_buffer.data(), 1, in_buffer.size(), in_file);
            if (ferror(in_file) || strm.avail_in == 0) {
                break;
            }
            strm.next_in = in_buffer.data();
        }
        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            stream_end = true;
            break;
        }
        if (ret != Z_OK) {
            return 0;
        }
    }
    return buffer.size() - strm.avail_out;
}

void Compression::InflateStream::open(std::string const &filename) {
    if (InflateStreambuf::open(filename) == ERROR) {
        setstate(std::ios::badbit);
    }
}
