#include <egress/core/codec/egress_codec.hpp>
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace Egress::Codec {

namespace {

constexpr uint32_t MAX_STRING_LEN = 16 * 1024 * 1024;
constexpr uint32_t MAX_LIST_ITEMS = 1 << 20;

// ============================================================================
// Writer
// ============================================================================

class Writer {
public:
    void u8(uint8_t v) { out_.push_back(static_cast<char>(v)); }

    void u32(uint32_t v) {
        uint32_t be = htonl(v);
        out_.append(reinterpret_cast<const char*>(&be), sizeof(be));
    }

    void i64(int64_t v) {
        uint64_t u = static_cast<uint64_t>(v);
        u32(static_cast<uint32_t>(u >> 32));
        u32(static_cast<uint32_t>(u & 0xFFFFFFFFu));
    }

    void str(const std::string& s) {
        if (s.size() > MAX_STRING_LEN)
            throw std::runtime_error("String field too large to encode");
        u32(static_cast<uint32_t>(s.size()));
        out_.append(s);
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

// ============================================================================
// Reader
// ============================================================================

class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    uint8_t u8() {
        need(1);
        return static_cast<uint8_t>(data_[pos_++]);
    }

    uint32_t u32() {
        need(4);
        uint32_t v;
        std::memcpy(&v, data_.data() + pos_, sizeof(v));
        pos_ += 4;
        return ntohl(v);
    }

    int64_t i64() {
        uint64_t hi = u32();
        uint64_t lo = u32();
        return static_cast<int64_t>((hi << 32) | lo);
    }

    std::string str() {
        uint32_t len = u32();
        if (len > MAX_STRING_LEN)
            throw std::runtime_error("String field length exceeds limit");
        need(len);
        std::string s = data_.substr(pos_, len);
        pos_ += len;
        return s;
    }

    void finish() const {
        if (pos_ != data_.size())
            throw std::runtime_error("Trailing bytes after message");
    }

private:
    void need(size_t n) const {
        if (data_.size() - pos_ < n)
            throw std::runtime_error("Message truncated");
    }

    const std::string& data_;
    size_t pos_ = 0;
};

RequestKind readKind(Reader& r) {
    uint8_t v = r.u8();
    if (v >= kRequestKindCount)
        throw std::runtime_error("Invalid request kind");
    return static_cast<RequestKind>(v);
}

EgressStatus readStatus(Reader& r) {
    uint8_t v = r.u8();
    if (v > static_cast<uint8_t>(EgressStatus::ABORTED))
        throw std::runtime_error("Invalid egress status");
    return static_cast<EgressStatus>(v);
}

ErrorCode readErrorCode(Reader& r) {
    uint8_t v = r.u8();
    if (v > static_cast<uint8_t>(ErrorCode::MALFORMED))
        throw std::runtime_error("Invalid error code");
    return static_cast<ErrorCode>(v);
}

void writeInfo(Writer& w, const EgressInfo& info) {
    w.str(info.egress_id);
    w.str(info.room_id);
    w.u8(static_cast<uint8_t>(info.kind));
    w.u8(static_cast<uint8_t>(info.status));
    w.i64(info.started_at);
    w.i64(info.ended_at);
    w.str(info.error);
}

EgressInfo readInfo(Reader& r) {
    EgressInfo info;
    info.egress_id = r.str();
    info.room_id = r.str();
    info.kind = readKind(r);
    info.status = readStatus(r);
    info.started_at = r.i64();
    info.ended_at = r.i64();
    info.error = r.str();
    return info;
}

void writeStart(Writer& w, const StartEgressRequest& req) {
    w.str(req.room_id);
    w.str(req.ws_url);
    w.u8(static_cast<uint8_t>(req.kind()));
    switch (req.kind()) {
        case RequestKind::ROOM_COMPOSITE: {
            const auto& p = std::get<RoomCompositeRequest>(req.payload);
            w.str(p.room_name);
            w.str(p.layout);
            w.str(p.filepath);
            break;
        }
        case RequestKind::WEB: {
            const auto& p = std::get<WebRequest>(req.payload);
            w.str(p.url);
            w.str(p.filepath);
            break;
        }
        case RequestKind::TRACK_COMPOSITE: {
            const auto& p = std::get<TrackCompositeRequest>(req.payload);
            w.str(p.audio_track_id);
            w.str(p.video_track_id);
            w.str(p.filepath);
            break;
        }
        case RequestKind::TRACK: {
            const auto& p = std::get<TrackRequest>(req.payload);
            w.str(p.track_id);
            w.str(p.filepath);
            break;
        }
    }
}

StartEgressRequest readStart(Reader& r) {
    StartEgressRequest req;
    req.room_id = r.str();
    req.ws_url = r.str();
    switch (readKind(r)) {
        case RequestKind::ROOM_COMPOSITE: {
            RoomCompositeRequest p;
            p.room_name = r.str();
            p.layout = r.str();
            p.filepath = r.str();
            req.payload = std::move(p);
            break;
        }
        case RequestKind::WEB: {
            WebRequest p;
            p.url = r.str();
            p.filepath = r.str();
            req.payload = std::move(p);
            break;
        }
        case RequestKind::TRACK_COMPOSITE: {
            TrackCompositeRequest p;
            p.audio_track_id = r.str();
            p.video_track_id = r.str();
            p.filepath = r.str();
            req.payload = std::move(p);
            break;
        }
        case RequestKind::TRACK: {
            TrackRequest p;
            p.track_id = r.str();
            p.filepath = r.str();
            req.payload = std::move(p);
            break;
        }
    }
    return req;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string encodeEgressInfo(const EgressInfo& info) {
    Writer w;
    writeInfo(w, info);
    return w.take();
}

EgressInfo decodeEgressInfo(const std::string& data) {
    Reader r(data);
    EgressInfo info = readInfo(r);
    r.finish();
    return info;
}

std::string encodeStartRequest(const StartEgressRequest& req) {
    Writer w;
    writeStart(w, req);
    return w.take();
}

StartEgressRequest decodeStartRequest(const std::string& data) {
    Reader r(data);
    StartEgressRequest req = readStart(r);
    r.finish();
    return req;
}

std::string encodeRequest(const RpcRequest& req) {
    Writer w;
    w.u8(static_cast<uint8_t>(req.type));
    w.str(req.request_id);
    w.str(req.reply_topic);
    switch (req.type) {
        case RpcType::START:
            writeStart(w, req.start);
            break;
        case RpcType::STOP:
            w.str(req.stop.egress_id);
            break;
        case RpcType::LIST:
            break;
    }
    return w.take();
}

RpcRequest decodeRequest(const std::string& data) {
    Reader r(data);
    RpcRequest req;
    uint8_t type = r.u8();
    if (type < static_cast<uint8_t>(RpcType::START) || type > static_cast<uint8_t>(RpcType::LIST))
        throw std::runtime_error("Invalid request type");
    req.type = static_cast<RpcType>(type);
    req.request_id = r.str();
    req.reply_topic = r.str();
    switch (req.type) {
        case RpcType::START:
            req.start = readStart(r);
            break;
        case RpcType::STOP:
            req.stop.egress_id = r.str();
            break;
        case RpcType::LIST:
            break;
    }
    r.finish();
    return req;
}

std::string encodeResponse(const RpcResponse& resp) {
    Writer w;
    w.str(resp.request_id);
    w.u8(static_cast<uint8_t>(resp.code));
    w.str(resp.error);
    w.u32(static_cast<uint32_t>(resp.items.size()));
    for (const auto& info : resp.items) {
        writeInfo(w, info);
    }
    return w.take();
}

RpcResponse decodeResponse(const std::string& data) {
    Reader r(data);
    RpcResponse resp;
    resp.request_id = r.str();
    resp.code = readErrorCode(r);
    resp.error = r.str();
    uint32_t count = r.u32();
    if (count > MAX_LIST_ITEMS)
        throw std::runtime_error("Item count exceeds limit");
    for (uint32_t i = 0; i < count; ++i) {
        resp.items.push_back(readInfo(r));
    }
    r.finish();
    return resp;
}

} // namespace Egress::Codec
