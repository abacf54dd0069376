#include "memo_cache.hpp"
#include "utils.hpp"
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace tsm {

namespace {

constexpr uint32_t ENTRY_MAGIC = 0x434D5354;  // "TSMC"
constexpr uint32_t ENTRY_VERSION = 1;

// Argument type tags
constexpr char TAG_TENSOR = 'T';
constexpr char TAG_INT = 'i';
constexpr char TAG_DOUBLE = 'd';
constexpr char TAG_BOOL = 'b';
constexpr char TAG_STRING = 's';

std::string directory_name(const std::string& function) {
    std::string name = function.empty() ? std::string("anonymous") : function;
    for (char& c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '.' && c != '_' && c != '-') {
            c = '_';
        }
    }
    return name;
}

} // namespace

void encode_argument(BinaryWriter& w, const Tensor& value) {
    w.write(TAG_TENSOR);
    w.write_tensor(value);
}

void encode_argument(BinaryWriter& w, int64_t value) {
    w.write(TAG_INT);
    w.write(value);
}

void encode_argument(BinaryWriter& w, double value) {
    w.write(TAG_DOUBLE);
    w.write(value);
}

void encode_argument(BinaryWriter& w, bool value) {
    w.write(TAG_BOOL);
    w.write(static_cast<uint8_t>(value ? 1 : 0));
}

void encode_argument(BinaryWriter& w, const std::string& value) {
    w.write(TAG_STRING);
    w.write_string(value);
}

// ============================================================
// CallSignature
// ============================================================

CallSignature& CallSignature::function(const std::string& name) {
    function_ = name;
    return *this;
}

CallSignature& CallSignature::receiver(const std::string& identity) {
    receiver_ = identity;
    return *this;
}

CacheKey CallSignature::key() const {
    std::ostringstream oss;
    BinaryWriter w(oss);

    w.write_string(function_);
    w.write_string(receiver_);
    w.write_size(positional_.size());
    for (const auto& arg : positional_) {
        w.write_string(arg);
    }
    w.write_size(keywords_.size());
    for (const auto& [name, arg] : keywords_) {
        w.write_string(name);
        w.write_string(arg);
    }

    CacheKey key;
    key.encoding = oss.str();
    key.digest = hash::to_hex(hash::fnv1a(key.encoding));
    return key;
}

// ============================================================
// TransientBackend
// ============================================================

std::optional<std::string> TransientBackend::fetch(const std::string& function, const CacheKey& key) {
    auto it = entries_.find(function + "/" + key.digest);
    if (it == entries_.end() || it->second.encoding != key.encoding) {
        return std::nullopt;
    }
    return it->second.blob;
}

void TransientBackend::store(const std::string& function, const CacheKey& key, const std::string& blob) {
    entries_[function + "/" + key.digest] = Entry{key.encoding, blob};
}

void TransientBackend::clear(bool) {
    entries_.clear();
}

// ============================================================
// PersistentBackend
// ============================================================

PersistentBackend::PersistentBackend(fs::path location) : location_(std::move(location)) {
    if (location_.empty()) {
        throw std::invalid_argument("Persistent cache needs a location");
    }
}

fs::path PersistentBackend::entry_path(const std::string& function, const CacheKey& key) const {
    return location_ / directory_name(function) / (key.digest + ".bin");
}

std::optional<std::string> PersistentBackend::fetch(const std::string& function, const CacheKey& key) {
    fs::path path = entry_path(function, key);
    auto it = index_.find(path.string());
    if (it != index_.end() && it->second != key.encoding) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        index_.erase(path.string());
        return std::nullopt;
    }

    std::string encoding;
    std::string blob;
    try {
        read_file(path, [&](BinaryReader& r) {
            uint32_t magic = r.read<uint32_t>();
            uint32_t version = r.read<uint32_t>();
            if (magic != ENTRY_MAGIC || version != ENTRY_VERSION) {
                throw std::runtime_error("not a cache entry");
            }
            encoding = r.read_string();
            blob = r.read_string();
        }, Compression::None);
    } catch (const std::runtime_error& e) {
        TSM_WARN("Ignoring corrupt cache entry {}: {}", path.string(), e.what());
        index_.erase(path.string());
        return std::nullopt;
    }

    if (encoding != key.encoding) {
        TSM_WARN("Digest collision on {}", path.string());
        return std::nullopt;
    }
    index_[path.string()] = std::move(encoding);
    return blob;
}

void PersistentBackend::store(const std::string& function, const CacheKey& key, const std::string& blob) {
    fs::path path = entry_path(function, key);
    fs::create_directories(path.parent_path());

    write_file(path, [&](BinaryWriter& w) {
        w.write(ENTRY_MAGIC);
        w.write(ENTRY_VERSION);
        w.write_string(key.encoding);
        w.write_string(blob);
    }, Compression::None);

    index_[path.string()] = key.encoding;
}

size_t PersistentBackend::indexed() const {
    return index_.size();
}

void PersistentBackend::clear(bool soft) {
    index_.clear();
    if (!soft) {
        std::error_code ec;
        fs::remove_all(location_, ec);
        if (ec) {
            TSM_WARN("Could not remove cache directory {}: {}", location_.string(), ec.message());
        }
    }
}

// ============================================================
// MemoCache
// ============================================================

MemoCache::MemoCache() : backend_(std::make_shared<TransientBackend>()) {}

MemoCache::MemoCache(std::shared_ptr<CacheBackend> backend) : backend_(std::move(backend)) {}

MemoCache MemoCache::transient() {
    return MemoCache();
}

MemoCache MemoCache::persistent(const fs::path& location) {
    return MemoCache(std::make_shared<PersistentBackend>(location));
}

void MemoCache::clear(bool soft) {
    backend_->clear(soft);
    if (is_persistent()) {
        TSM_INFO("Cleared cache at {}{}", location().string(), soft ? " (index only)" : "");
    } else {
        TSM_INFO("Cleared transient cache");
    }
}

} // namespace tsm
