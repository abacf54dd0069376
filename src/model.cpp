#include "model.hpp"

namespace fs = std::filesystem;

namespace tsm {

namespace {

constexpr uint32_t MODEL_MAGIC = 0x444D5354;  // "TSMD"
constexpr uint32_t MODEL_VERSION = 1;

std::string receiver_identity(const std::string& kind, const std::string& session,
                              const std::string& fingerprint) {
    return kind + ":" + session + ":" + fingerprint;
}

} // namespace

void write_model_header(BinaryWriter& w, const std::string& kind) {
    w.write(MODEL_MAGIC);
    w.write(MODEL_VERSION);
    w.write_string(kind);
}

void read_model_header(BinaryReader& r, const std::string& kind) {
    uint32_t magic = r.read<uint32_t>();
    if (magic != MODEL_MAGIC) {
        throw TypeMismatchError("Not a model file (expected " + kind + ")");
    }
    uint32_t version = r.read<uint32_t>();
    if (version != MODEL_VERSION) {
        throw std::runtime_error("Unsupported model file version: " + std::to_string(version));
    }
    std::string stored = r.read_string();
    if (stored != kind) {
        throw TypeMismatchError("Loaded object is a " + stored + ", expected " + kind);
    }
}

// ============================================================
// CacheBinding
// ============================================================

fs::path CacheBinding::start_session(const fs::path& root, const std::string& kind,
                                     const std::string& fingerprint) {
    std::string session = hash::random_token();
    fs::path location = root / session;

    MemoCache cache = MemoCache::persistent(location);
    cache_ = std::move(cache);
    identity_ = receiver_identity(kind, session, fingerprint);
    return location;
}

void CacheBinding::save(BinaryWriter& w, const std::string& kind, const std::string& fingerprint) const {
    w.write(static_cast<uint8_t>(cache_.is_persistent() ? 1 : 0));
    w.write_string(cache_.location().string());
    if (cache_.is_persistent()) {
        w.write_string(receiver_identity(kind, hash::random_token(), fingerprint));
    } else {
        w.write_string(std::string());
    }
}

void CacheBinding::load(BinaryReader& r) {
    bool persistent = r.read<uint8_t>() != 0;
    fs::path location = r.read_string();
    std::string identity = r.read_string();

    cache_ = persistent ? MemoCache::persistent(location) : MemoCache::transient();
    identity_ = std::move(identity);
    TSM_DEBUG("Attached {} cache {}", persistent ? "persistent" : "transient", location.string());
}

} // namespace tsm
