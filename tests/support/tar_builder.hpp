#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <zlib.h>

namespace lfsget::testing {

// Minimal ustar writer for building fixtures in tests

struct TarSpec {
    std::string path;
    std::string data;
    char typeflag = '0';
    std::string linkname;
    std::uint32_t mode = 0644;
};

inline TarSpec tar_file(const std::string& path, const std::string& data) {
    TarSpec spec;
    spec.path = path;
    spec.data = data;
    return spec;
}

inline TarSpec tar_file(const std::string& path, const std::vector<std::uint8_t>& data) {
    return tar_file(path, std::string(data.begin(), data.end()));
}

inline TarSpec tar_dir(const std::string& path) {
    TarSpec spec;
    spec.path = path;
    spec.typeflag = '5';
    spec.mode = 0755;
    return spec;
}

inline TarSpec tar_symlink(const std::string& path, const std::string& target) {
    TarSpec spec;
    spec.path = path;
    spec.typeflag = '2';
    spec.linkname = target;
    return spec;
}

// One pax record: "<len> <key>=<value>\n", where len counts itself
inline std::string pax_record(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    std::size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) {
        ++len;
    }
    return std::to_string(len) + body;
}

namespace detail {

inline void write_octal(char* dest, std::size_t size, std::uint64_t value) {
    std::size_t digits = size - 1;
    dest[digits] = '\0';
    for (std::size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

inline void append_header(std::vector<std::uint8_t>& out, const std::string& name, char typeflag,
                          std::uint64_t size, std::uint32_t mode, const std::string& linkname) {
    char block[512];
    std::memset(block, 0, sizeof(block));

    std::strncpy(block, name.c_str(), 99);
    write_octal(block + 100, 8, mode);
    write_octal(block + 108, 8, 0);
    write_octal(block + 116, 8, 0);
    write_octal(block + 124, 12, size);
    write_octal(block + 136, 12, 0);
    block[156] = typeflag;
    std::strncpy(block + 157, linkname.c_str(), 99);
    std::memcpy(block + 257, "ustar", 5);
    block[263] = '0';
    block[264] = '0';

    std::memset(block + 148, ' ', 8);
    std::uint32_t sum = 0;
    for (unsigned char c : block) sum += c;
    char chksum[8];
    std::snprintf(chksum, sizeof(chksum), "%06o", sum);
    std::memcpy(block + 148, chksum, 6);
    block[154] = '\0';
    block[155] = ' ';

    out.insert(out.end(), block, block + sizeof(block));
}

inline void append_data(std::vector<std::uint8_t>& out, const std::string& data) {
    out.insert(out.end(), data.begin(), data.end());
    std::size_t pad = (512 - data.size() % 512) % 512;
    out.insert(out.end(), pad, 0);
}

} // namespace detail

// Paths longer than the 100-byte name field get a GNU long-name record
inline std::vector<std::uint8_t> make_tar(const std::vector<TarSpec>& entries) {
    std::vector<std::uint8_t> out;
    for (const auto& e : entries) {
        std::string name = e.path;
        if (e.typeflag == '5' && !name.empty() && name.back() != '/') name += '/';

        if (name.size() > 99 && e.typeflag != 'x' && e.typeflag != 'L') {
            std::string longname = name + '\0';
            detail::append_header(out, "././@LongLink", 'L', longname.size(), 0644, "");
            detail::append_data(out, longname);
        }

        std::uint64_t size = (e.typeflag == '5' || e.typeflag == '2') ? 0 : e.data.size();
        detail::append_header(out, name, e.typeflag, size, e.mode, e.linkname);
        if (size > 0) detail::append_data(out, e.data);
    }
    out.insert(out.end(), 1024, 0);
    return out;
}

inline std::vector<std::uint8_t> gzip(const std::vector<std::uint8_t>& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())) + 32);
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) return {};

    out.resize(strm.total_out);
    return out;
}

// gzip whose header carries an FEXTRA field sized so the whole stream is
// exactly `total` bytes. Returns empty if the data alone is too large.
inline std::vector<std::uint8_t> gzip_to_size(const std::vector<std::uint8_t>& data,
                                              std::size_t total) {
    std::size_t plain = gzip(data).size();
    if (plain == 0 || total < plain + 2 || total - plain - 2 > 0xFFFF) return {};

    std::vector<Bytef> extra(total - plain - 2, 'x');
    gz_header header;
    std::memset(&header, 0, sizeof(header));
    header.os = 3;
    header.extra = extra.data();
    header.extra_len = static_cast<uInt>(extra.size());

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }
    if (deflateSetHeader(&strm, &header) != Z_OK) {
        deflateEnd(&strm);
        return {};
    }

    std::vector<std::uint8_t> out(total + 1024);
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) return {};

    out.resize(strm.total_out);
    return out;
}

inline std::vector<std::uint8_t> make_tar_gz(const std::vector<TarSpec>& entries) {
    return gzip(make_tar(entries));
}

inline void write_bytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
}

inline std::string read_text(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline std::vector<std::uint8_t> read_bytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f),
                                     std::istreambuf_iterator<char>());
}

} // namespace lfsget::testing
