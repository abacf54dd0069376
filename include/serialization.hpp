#ifndef TSM_SERIALIZATION_HPP
#define TSM_SERIALIZATION_HPP

#include "tensor.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace tsm {

/**
 * Binary writer for model files and cache entries.
 *
 * Scalars are written in native byte order, sizes as uint64_t, strings and
 * vectors as a size followed by their payload.
 */
class BinaryWriter {
public:
    explicit BinaryWriter(std::ostream& out) : out_(out) {}

    template <typename T>
    void write(const T& value) {
        static_assert(std::is_trivially_copyable<T>::value, "write() needs a trivially copyable type");
        out_.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    void write_size(size_t n) { write(static_cast<uint64_t>(n)); }
    void write_string(const std::string& s);
    void write_doubles(const std::vector<double>& values);
    void write_shape(const Shape& shape);
    void write_tensor(const Tensor& tensor);

    bool good() const { return out_.good(); }

private:
    std::ostream& out_;
};

/**
 * Counterpart of BinaryWriter. Every read throws std::runtime_error on a
 * truncated or corrupt stream.
 */
class BinaryReader {
public:
    explicit BinaryReader(std::istream& in) : in_(in) {}

    template <typename T>
    T read() {
        static_assert(std::is_trivially_copyable<T>::value, "read() needs a trivially copyable type");
        T value;
        in_.read(reinterpret_cast<char*>(&value), sizeof(T));
        check(sizeof(T));
        return value;
    }

    size_t read_size();
    std::string read_string();
    std::vector<double> read_doubles();
    Shape read_shape();
    Tensor read_tensor();

private:
    std::istream& in_;

    void check(size_t requested);
};

/**
 * Compression applied to a model file, chosen from its suffix.
 */
enum class Compression {
    None,
    Gzip,   // .gz
    Zlib,   // .z
    Bzip2,  // .bz2
    Lzma    // .xz, .lzma
};

Compression compression_for(const std::filesystem::path& path);

/**
 * Destination must sit in an existing, writable directory.
 * @throws PathAccessError
 */
void check_writable_destination(const std::filesystem::path& path);

/**
 * Source must be an existing, readable regular file.
 * @throws PathAccessError
 */
void check_readable_source(const std::filesystem::path& path);

/**
 * Write a file through the compression filter matching its suffix.
 * The payload goes to a temporary sibling first and is renamed into place,
 * so readers never observe a partial file.
 */
void write_file(const std::filesystem::path& path,
                const std::function<void(BinaryWriter&)>& payload,
                Compression compression);

void write_file(const std::filesystem::path& path,
                const std::function<void(BinaryWriter&)>& payload);

/**
 * Read a file through the decompression filter matching its suffix.
 */
void read_file(const std::filesystem::path& path,
               const std::function<void(BinaryReader&)>& payload,
               Compression compression);

void read_file(const std::filesystem::path& path,
               const std::function<void(BinaryReader&)>& payload);

} // namespace tsm

#endif // TSM_SERIALIZATION_HPP
