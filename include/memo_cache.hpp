#ifndef TSM_MEMO_CACHE_HPP
#define TSM_MEMO_CACHE_HPP

#include "logging.hpp"
#include "serialization.hpp"
#include "tensor.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tsm {

// Canonical argument encodings. Domain types add overloads in their own headers.
void encode_argument(BinaryWriter& w, const Tensor& value);
void encode_argument(BinaryWriter& w, int64_t value);
void encode_argument(BinaryWriter& w, double value);
void encode_argument(BinaryWriter& w, bool value);
void encode_argument(BinaryWriter& w, const std::string& value);

/**
 * Content address of a memoized call.
 */
struct CacheKey {
    std::string digest;    // 16 hex characters, names the entry
    std::string encoding;  // full canonical encoding, guards against digest collisions
};

/**
 * Builder for the canonical description of a call: function, receiver
 * identity, positional and keyword arguments.
 *
 * Keyword arguments are kept sorted by name, so the order in which they are
 * given does not change the key.
 */
class CallSignature {
public:
    CallSignature& function(const std::string& name);
    CallSignature& receiver(const std::string& identity);

    template <typename T>
    CallSignature& positional(const T& value) {
        positional_.push_back(encode(value));
        return *this;
    }

    template <typename T>
    CallSignature& keyword(const std::string& name, const T& value) {
        keywords_[name] = encode(value);
        return *this;
    }

    const std::string& function_name() const { return function_; }

    CacheKey key() const;

private:
    std::string function_;
    std::string receiver_;
    std::vector<std::string> positional_;
    std::map<std::string, std::string> keywords_;

    template <typename T>
    static std::string encode(const T& value) {
        std::ostringstream oss;
        BinaryWriter w(oss);
        if constexpr (std::is_same<T, bool>::value) {
            encode_argument(w, value);
        } else if constexpr (std::is_integral<T>::value) {
            encode_argument(w, static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point<T>::value) {
            encode_argument(w, static_cast<double>(value));
        } else if constexpr (std::is_convertible<T, std::string>::value) {
            encode_argument(w, std::string(value));
        } else {
            encode_argument(w, value);
        }
        return oss.str();
    }
};

/**
 * Value encoding for cached results. Specialise for every memoized type.
 */
template <typename V>
struct CacheCodec;

template <>
struct CacheCodec<Tensor> {
    static void encode(BinaryWriter& w, const Tensor& value) { w.write_tensor(value); }
    static Tensor decode(BinaryReader& r) { return r.read_tensor(); }
};

template <>
struct CacheCodec<std::vector<double>> {
    static void encode(BinaryWriter& w, const std::vector<double>& value) { w.write_doubles(value); }
    static std::vector<double> decode(BinaryReader& r) { return r.read_doubles(); }
};

/**
 * Storage behind a MemoCache. Values arrive already encoded.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual std::optional<std::string> fetch(const std::string& function, const CacheKey& key) = 0;
    virtual void store(const std::string& function, const CacheKey& key, const std::string& blob) = 0;

    // Drop the in-memory index; unless soft, also the backing store
    virtual void clear(bool soft) = 0;

    virtual bool persistent() const = 0;
    virtual std::filesystem::path location() const = 0;
};

/**
 * Process-lifetime key/value table.
 */
class TransientBackend : public CacheBackend {
public:
    std::optional<std::string> fetch(const std::string& function, const CacheKey& key) override;
    void store(const std::string& function, const CacheKey& key, const std::string& blob) override;
    void clear(bool soft) override;

    bool persistent() const override { return false; }
    std::filesystem::path location() const override { return {}; }

private:
    struct Entry {
        std::string encoding;
        std::string blob;
    };
    std::unordered_map<std::string, Entry> entries_;
};

/**
 * Directory-backed store: one file per entry at
 * <location>/<function>/<digest>.bin, plus an in-memory index mapping the
 * entries this process has already read or written to their encodings.
 * Values are always read back from disk.
 *
 * The directory is created on the first store. Several backends may point
 * at the same location; there is no locking between them.
 */
class PersistentBackend : public CacheBackend {
public:
    explicit PersistentBackend(std::filesystem::path location);

    std::optional<std::string> fetch(const std::string& function, const CacheKey& key) override;
    void store(const std::string& function, const CacheKey& key, const std::string& blob) override;
    void clear(bool soft) override;

    bool persistent() const override { return true; }
    std::filesystem::path location() const override { return location_; }

    std::filesystem::path entry_path(const std::string& function, const CacheKey& key) const;

    // Number of entries known to this backend
    size_t indexed() const;

private:
    std::filesystem::path location_;
    std::unordered_map<std::string, std::string> index_;
};

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t stores = 0;
};

/**
 * Memoization handle owned by a model.
 *
 * get_or_compute() returns the stored value for a known key without calling
 * compute; otherwise it calls compute, stores the result and returns it.
 * Nothing is stored when compute throws. There is no automatic eviction:
 * clear() is the only way entries go away.
 */
class MemoCache {
public:
    // Transient (memory only)
    MemoCache();

    static MemoCache transient();
    static MemoCache persistent(const std::filesystem::path& location);

    template <typename V, typename Compute>
    V get_or_compute(const CallSignature& signature, Compute&& compute) {
        const std::string& function = signature.function_name();
        CacheKey key = signature.key();

        if (auto blob = backend_->fetch(function, key)) {
            try {
                V value = decode<V>(*blob);
                ++stats_.hits;
                TSM_DEBUG("Cache hit {} [{}]", function, key.digest);
                return value;
            } catch (const std::exception& e) {
                TSM_WARN("Unreadable cache entry {} [{}]: {}", function, key.digest, e.what());
            }
        }

        ++stats_.misses;
        TSM_DEBUG("Cache miss {} [{}]", function, key.digest);
        V value = compute();
        backend_->store(function, key, encode<V>(value));
        ++stats_.stores;
        return value;
    }

    void clear(bool soft = false);

    bool is_persistent() const { return backend_->persistent(); }
    std::filesystem::path location() const { return backend_->location(); }
    const CacheStats& stats() const { return stats_; }

private:
    explicit MemoCache(std::shared_ptr<CacheBackend> backend);

    std::shared_ptr<CacheBackend> backend_;
    CacheStats stats_;

    template <typename V>
    static std::string encode(const V& value) {
        std::ostringstream oss;
        BinaryWriter w(oss);
        CacheCodec<V>::encode(w, value);
        return oss.str();
    }

    template <typename V>
    static V decode(const std::string& blob) {
        std::istringstream iss(blob);
        BinaryReader r(iss);
        return CacheCodec<V>::decode(r);
    }
};

} // namespace tsm

#endif // TSM_MEMO_CACHE_HPP
