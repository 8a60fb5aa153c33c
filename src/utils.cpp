// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <utils.hpp>
#include <zlib.h>
#include <fmt/core.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string.h>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace formpdf::internal {

namespace {

template<typename T> rvoe<T> do_file_load(FILE *f) {
    if(fseek(f, 0, SEEK_END) != 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    auto fsize = ftell(f);
    if(fsize < 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    T contents;
    contents.resize(fsize);
    if(fseek(f, 0, SEEK_SET) != 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    const size_t rc = fread(contents.data(), 1, fsize, f);
    if(rc != (size_t)fsize) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    return contents;
}

struct DeflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            auto rc = deflateEnd(zs);
            if(rc != Z_OK && rc != Z_DATA_ERROR) {
                fmt::print(stderr, "Zlib error when closing: {}\n", zs->msg ? zs->msg : "");
            }
        }
    }
};

struct InflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            inflateEnd(zs);
        }
    }
};

} // namespace

rvoe<std::vector<std::byte>> flate_compress(std::string_view data) {
    std::vector<std::byte> compressed;
    const int CHUNK = 1024 * 1024;
    std::vector<std::byte> buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    auto ret = deflateInit(&strm, Z_BEST_COMPRESSION);
    if(ret != Z_OK) {
        RETERR(CompressionFailure);
    }
    std::unique_ptr<z_stream, DeflateCloser> zcloser(&strm);
    strm.avail_in = data.size();
    strm.next_in = (Bytef *)(data.data()); // Very unsafe.

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = deflate(&strm, Z_FINISH); /* no bad return value */
        assert(ret != Z_STREAM_ERROR);  /* state not clobbered */
        int write_size = CHUNK - strm.avail_out;
        assert(write_size <= (int)buf.size());
        compressed.insert(compressed.end(), buf.begin(), buf.begin() + write_size);
    } while(strm.avail_out == 0);
    if(strm.avail_in != 0) { /* all input will be used */
        RETERR(CompressionFailure);
    }
    /* done when last data in file processed */
    if(ret != Z_STREAM_END) {
        RETERR(CompressionFailure);
    }

    return compressed;
}

rvoe<std::string> flate_decompress(std::string_view data) {
    std::string decompressed;
    const int CHUNK = 256 * 1024;
    std::string buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;

    auto ret = inflateInit(&strm);
    if(ret != Z_OK) {
        RETERR(DecompressionFailure);
    }
    std::unique_ptr<z_stream, InflateCloser> zcloser(&strm);
    strm.avail_in = data.size();
    strm.next_in = (Bytef *)(data.data());

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = inflate(&strm, Z_NO_FLUSH);
        if(ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
           ret == Z_STREAM_ERROR) {
            fmt::print(stderr, "Zlib inflate failed: {}\n", strm.msg ? strm.msg : "unknown");
            RETERR(DecompressionFailure);
        }
        const int write_size = CHUNK - strm.avail_out;
        decompressed.append(buf.data(), write_size);
        if(ret == Z_BUF_ERROR && strm.avail_in == 0) {
            // Truncated input.
            RETERR(DecompressionFailure);
        }
    } while(ret != Z_STREAM_END);

    return decompressed;
}

rvoe<std::string> load_file_as_string(const char *fname) {
    if(!std::filesystem::is_regular_file(fname)) {
        RETERR(FileDoesNotExist);
    }
    FILE *f = fopen(fname, "rb");
    if(!f) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    return load_file_as_string(f);
}

rvoe<std::string> load_file_as_string(FILE *f) { return do_file_load<std::string>(f); }

rvoe<NoReturnValue> write_file(const char *ofname, std::string_view contents) {
    std::filesystem::path tempfname(ofname);
    tempfname.replace_extension(".pdf~");
    FILE *out_file = fopen(tempfname.string().c_str(), "wb");
    if(!out_file) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, int (*)(FILE *)> fcloser(out_file, fclose);
    if(fwrite(contents.data(), 1, contents.size(), out_file) != contents.size()) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(fflush(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(
#ifdef _WIN32
        _commit(fileno(out_file))
#else
        fsync(fileno(out_file))
#endif
        != 0) {

        perror(nullptr);
        RETERR(FileWriteError);
    }
    // Close the file manually to verify it worked.
    fcloser.release();
    if(fclose(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }

    std::error_code ec;
    std::filesystem::rename(tempfname, ofname, ec);
    if(ec) {
        fmt::print(stderr, "{}\n", ec.message());
        RETERR(FileWriteError);
    }
    RETOK;
}

std::string create_trailer_id() {
    const int num_bytes = 16;
    std::string msg;
    msg.reserve(num_bytes * 2 + 2);
    msg.push_back('<');
    auto app = std::back_inserter(msg);
    for(int i = 0; i < num_bytes; ++i) {
        auto big_num = random();
        int randnum = (int)(big_num & 0xFF);
        fmt::format_to(app, "{:02X}", randnum);
    }
    msg.push_back('>');
    return msg;
}

std::span<const std::byte> str2span(std::string_view s) {
    return std::span<const std::byte>((const std::byte *)s.data(), s.size());
}

std::string_view span2sv(std::span<const std::byte> s) {
    auto *ptr = (const char *)s.data();
    return std::string_view(ptr, s.size());
}

} // namespace formpdf::internal
