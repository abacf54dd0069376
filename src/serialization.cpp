#include "serialization.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace tsm {

namespace {

// Upper bound on a serialized element count, guards against corrupt sizes
constexpr uint64_t MAX_ELEMENTS = 1ULL << 32;

template <typename Chain>
void push_compressor(Chain& chain, Compression compression) {
    switch (compression) {
        case Compression::Gzip:
            chain.push(io::gzip_compressor());
            break;
        case Compression::Zlib:
            chain.push(io::zlib_compressor());
            break;
        case Compression::Bzip2:
            chain.push(io::bzip2_compressor());
            break;
        case Compression::Lzma:
            chain.push(io::lzma_compressor());
            break;
        case Compression::None:
            break;
    }
}

template <typename Chain>
void push_decompressor(Chain& chain, Compression compression) {
    switch (compression) {
        case Compression::Gzip:
            chain.push(io::gzip_decompressor());
            break;
        case Compression::Zlib:
            chain.push(io::zlib_decompressor());
            break;
        case Compression::Bzip2:
            chain.push(io::bzip2_decompressor());
            break;
        case Compression::Lzma:
            chain.push(io::lzma_decompressor());
            break;
        case Compression::None:
            break;
    }
}

} // namespace

// ============================================================
// BinaryWriter / BinaryReader
// ============================================================

void BinaryWriter::write_string(const std::string& s) {
    write_size(s.size());
    out_.write(s.data(), static_cast<std::streamsize>(s.size()));
}

void BinaryWriter::write_doubles(const std::vector<double>& values) {
    write_size(values.size());
    out_.write(reinterpret_cast<const char*>(values.data()),
               static_cast<std::streamsize>(values.size() * sizeof(double)));
}

void BinaryWriter::write_shape(const Shape& shape) {
    write_size(shape.size());
    for (size_t extent : shape) {
        write_size(extent);
    }
}

void BinaryWriter::write_tensor(const Tensor& tensor) {
    write_shape(tensor.shape());
    write_doubles(tensor.values());
}

void BinaryReader::check(size_t requested) {
    if (!in_ || static_cast<size_t>(in_.gcount()) != requested) {
        throw std::runtime_error("Unexpected end of stream");
    }
}

size_t BinaryReader::read_size() {
    uint64_t n = read<uint64_t>();
    if (n > MAX_ELEMENTS) {
        throw std::runtime_error("Corrupt stream: size " + std::to_string(n) + " out of range");
    }
    return static_cast<size_t>(n);
}

std::string BinaryReader::read_string() {
    size_t n = read_size();
    std::string s(n, '\0');
    if (n > 0) {
        in_.read(&s[0], static_cast<std::streamsize>(n));
        check(n);
    }
    return s;
}

std::vector<double> BinaryReader::read_doubles() {
    size_t n = read_size();
    std::vector<double> values(n);
    if (n > 0) {
        in_.read(reinterpret_cast<char*>(values.data()),
                 static_cast<std::streamsize>(n * sizeof(double)));
        check(n * sizeof(double));
    }
    return values;
}

Shape BinaryReader::read_shape() {
    size_t n = read_size();
    Shape shape(n);
    for (size_t i = 0; i < n; ++i) {
        shape[i] = read_size();
    }
    return shape;
}

Tensor BinaryReader::read_tensor() {
    Shape shape = read_shape();
    std::vector<double> values = read_doubles();
    size_t expected = shape.empty() ? 0 : 1;
    for (size_t extent : shape) {
        expected *= extent;
    }
    if (values.size() != expected) {
        throw std::runtime_error("Corrupt stream: tensor of shape " + shape_to_string(shape) +
                                 " with " + std::to_string(values.size()) + " values");
    }
    return Tensor(std::move(shape), std::move(values));
}

// ============================================================
// Files
// ============================================================

Compression compression_for(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".gz") return Compression::Gzip;
    if (ext == ".z") return Compression::Zlib;
    if (ext == ".bz2") return Compression::Bzip2;
    if (ext == ".xz" || ext == ".lzma") return Compression::Lzma;
    return Compression::None;
}

void check_writable_destination(const fs::path& path) {
    fs::path parent = path.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    if (!fs::is_directory(parent)) {
        throw PathAccessError(parent.string() + " is not a valid directory.");
    }
    if (::access(fs::absolute(parent).c_str(), W_OK) != 0) {
        throw PathAccessError(parent.string() + " is not writable.");
    }
}

void check_readable_source(const fs::path& path) {
    if (!fs::is_regular_file(path)) {
        throw PathAccessError(path.string() + " is not a valid file.");
    }
    if (::access(fs::absolute(path).c_str(), R_OK) != 0) {
        throw PathAccessError(path.string() + " is not readable.");
    }
}

void write_file(const fs::path& path,
                const std::function<void(BinaryWriter&)>& payload,
                Compression compression) {
    fs::path tmp = path;
    tmp += ".tmp-" + hash::random_token();

    try {
        io::file_sink sink(tmp.string(), std::ios::out | std::ios::binary);
        if (!sink.is_open()) {
            throw PathAccessError("Cannot open file for writing: " + tmp.string());
        }

        io::filtering_ostream out;
        push_compressor(out, compression);
        out.push(sink);

        BinaryWriter writer(out);
        payload(writer);
        out.flush();
        bool ok = writer.good();
        // Closing the chain writes the compressor trailer
        out.reset();
        if (!ok) {
            throw std::runtime_error("Failed writing " + path.string());
        }

        fs::rename(tmp, path);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

void write_file(const fs::path& path, const std::function<void(BinaryWriter&)>& payload) {
    write_file(path, payload, compression_for(path));
}

void read_file(const fs::path& path,
               const std::function<void(BinaryReader&)>& payload,
               Compression compression) {
    io::file_source source(path.string(), std::ios::in | std::ios::binary);
    if (!source.is_open()) {
        throw PathAccessError("Cannot open file for reading: " + path.string());
    }

    io::filtering_istream in;
    push_decompressor(in, compression);
    in.push(source);

    BinaryReader reader(in);
    payload(reader);
}

void read_file(const fs::path& path, const std::function<void(BinaryReader&)>& payload) {
    read_file(path, payload, compression_for(path));
}

} // namespace tsm
