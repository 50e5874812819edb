#include "agent/model_io.h"
#include "core/log.h"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mazerl {

namespace {

constexpr char   MAGIC[4]    = {'M', 'Z', 'Q', 'L'};
constexpr size_t HEADER_SIZE = 4 + 4 + 8 + 8;

uint64_t fnv1a(const char* data, size_t n) {
    uint64_t h = 1469598103934665603ULL;
    for (size_t i = 0; i < n; ++i) {
        h ^= static_cast<uint8_t>(data[i]);
        h *= 1099511628211ULL;
    }
    return h;
}

class BlobWriter {
public:
    template <typename T>
    void put(const T& v) {
        const char* p = reinterpret_cast<const char*>(&v);
        buf_.insert(buf_.end(), p, p + sizeof(T));
    }
    void put_state(const State& s) { put(s.x); put(s.y); put(s.heading); }

    std::vector<char>& bytes() { return buf_; }

private:
    std::vector<char> buf_;
};

class BlobReader {
public:
    BlobReader(const char* data, size_t n) : data_(data), n_(n) {}

    template <typename T>
    bool get(T& v) {
        if (pos_ + sizeof(T) > n_) return false;
        std::memcpy(&v, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }
    bool get_state(State& s) { return get(s.x) && get(s.y) && get(s.heading); }

    bool at_end() const { return pos_ == n_; }
    size_t remaining() const { return n_ - pos_; }

private:
    const char* data_;
    size_t n_;
    size_t pos_ = 0;
};

template <typename T>
void put_table(BlobWriter& w, const StateTable<T>& t) {
    w.put(static_cast<uint64_t>(t.size()));
    for (size_t id = 0; id < t.size(); ++id) {
        w.put_state(t.state_at(id));
        for (auto v : t.row_at(id)) w.put(v);
    }
}

template <typename T>
bool get_table(BlobReader& r, StateTable<T>& t) {
    uint64_t n = 0;
    if (!r.get(n)) return false;
    for (uint64_t k = 0; k < n; ++k) {
        State s;
        ActionRow<T> row;
        if (!r.get_state(s)) return false;
        for (auto& v : row) {
            if (!r.get(v)) return false;
        }
        t.row_mut(s) = row;
    }
    return true;
}

} // namespace

const char* load_status_name(LoadStatus s) {
    switch (s) {
        case LoadStatus::OK:                return "ok";
        case LoadStatus::NOT_FOUND:         return "not found";
        case LoadStatus::BAD_MAGIC:         return "bad magic";
        case LoadStatus::VERSION_MISMATCH:  return "version mismatch";
        case LoadStatus::STRATEGY_MISMATCH: return "strategy mismatch";
        case LoadStatus::TRUNCATED:         return "truncated";
        case LoadStatus::CORRUPT:           return "corrupt";
    }
    return "?";
}

std::vector<char> encode_model(const ModelBlob& blob) {
    BlobWriter payload;
    payload.put(static_cast<uint8_t>(blob.strategy.kind));
    payload.put(blob.learning_rate);
    payload.put(blob.discount);
    payload.put(blob.initial_q);
    payload.put(blob.strategy.epsilon);
    payload.put(blob.strategy.ucb_c);
    payload.put(blob.strategy.novelty_bonus);
    put_table(payload, blob.q_table);
    put_table(payload, blob.strategy.visits.table());

    payload.put(static_cast<uint64_t>(blob.history.size()));
    for (const auto& e : blob.history) {
        payload.put(e.reward);
        payload.put(e.steps);
        payload.put(static_cast<uint8_t>(e.success ? 1 : 0));
    }

    const auto& body = payload.bytes();
    BlobWriter out;
    for (char c : MAGIC) out.put(c);
    out.put(MODEL_FORMAT_VERSION);
    out.put(static_cast<uint64_t>(body.size()));
    out.put(fnv1a(body.data(), body.size()));
    out.bytes().insert(out.bytes().end(), body.begin(), body.end());
    return std::move(out.bytes());
}

LoadStatus decode_model(const std::vector<char>& bytes, ModelBlob& out) {
    if (bytes.size() < 4 || std::memcmp(bytes.data(), MAGIC, 4) != 0) {
        return LoadStatus::BAD_MAGIC;
    }
    if (bytes.size() < HEADER_SIZE) return LoadStatus::TRUNCATED;

    BlobReader header(bytes.data() + 4, HEADER_SIZE - 4);
    uint32_t version = 0;
    uint64_t payload_size = 0, checksum = 0;
    if (!header.get(version) || !header.get(payload_size) || !header.get(checksum)) {
        return LoadStatus::TRUNCATED;
    }

    if (version != MODEL_FORMAT_VERSION) return LoadStatus::VERSION_MISMATCH;
    if (bytes.size() - HEADER_SIZE < payload_size) return LoadStatus::TRUNCATED;
    if (bytes.size() - HEADER_SIZE > payload_size) return LoadStatus::CORRUPT;

    const char* body = bytes.data() + HEADER_SIZE;
    if (fnv1a(body, payload_size) != checksum) return LoadStatus::CORRUPT;

    ModelBlob tmp;
    BlobReader r(body, payload_size);
    uint8_t kind = 0;
    if (!r.get(kind)) return LoadStatus::TRUNCATED;
    if (kind > static_cast<uint8_t>(StrategyKind::CURIOSITY)) return LoadStatus::CORRUPT;
    tmp.strategy.kind = static_cast<StrategyKind>(kind);

    bool ok = r.get(tmp.learning_rate) && r.get(tmp.discount) && r.get(tmp.initial_q)
           && r.get(tmp.strategy.epsilon) && r.get(tmp.strategy.ucb_c)
           && r.get(tmp.strategy.novelty_bonus);
    if (!ok) return LoadStatus::TRUNCATED;

    tmp.q_table = StateTable<double>(tmp.initial_q);
    if (!get_table(r, tmp.q_table)) return LoadStatus::TRUNCATED;
    if (!get_table(r, tmp.strategy.visits.table())) return LoadStatus::TRUNCATED;

    uint64_t n_hist = 0;
    if (!r.get(n_hist)) return LoadStatus::TRUNCATED;
    constexpr size_t HIST_RECORD_SIZE = sizeof(double) + sizeof(uint32_t) + sizeof(uint8_t);
    if (n_hist > r.remaining() / HIST_RECORD_SIZE) return LoadStatus::TRUNCATED;
    tmp.history.reserve(static_cast<size_t>(n_hist));
    for (uint64_t k = 0; k < n_hist; ++k) {
        EpisodeRecord e;
        uint8_t success = 0;
        if (!r.get(e.reward) || !r.get(e.steps) || !r.get(success)) return LoadStatus::TRUNCATED;
        e.success = success != 0;
        tmp.history.push_back(e);
    }
    if (!r.at_end()) return LoadStatus::CORRUPT;

    out = std::move(tmp);
    return LoadStatus::OK;
}

bool write_model_file(const std::string& path, const ModelBlob& blob) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            MAZERL_LOG_ERROR("cannot create model directory %s: %s",
                             target.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    std::vector<char> bytes = encode_model(blob);
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            MAZERL_LOG_ERROR("cannot open %s for writing", tmp_path.c_str());
            return false;
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs.good()) {
            MAZERL_LOG_ERROR("write failed: %s", tmp_path.c_str());
            return false;
        }
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        MAZERL_LOG_ERROR("cannot replace %s: %s", path.c_str(), ec.message().c_str());
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

LoadStatus read_model_file(const std::string& path, ModelBlob& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return LoadStatus::NOT_FOUND;
    std::vector<char> bytes((std::istreambuf_iterator<char>(ifs)),
                            std::istreambuf_iterator<char>());
    return decode_model(bytes, out);
}

} // namespace mazerl
