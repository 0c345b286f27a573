#include "transfer_wire.h"
#include "transfer_errors.h"

#include <cstring>

namespace wire {

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::HANDSHAKE: return "HANDSHAKE";
        case FrameType::HANDSHAKE_REPLY: return "HANDSHAKE_REPLY";
        case FrameType::STREAM_ACK: return "STREAM_ACK";
        case FrameType::VERIFY: return "VERIFY";
        case FrameType::VERIFY_REPLY: return "VERIFY_REPLY";
        case FrameType::RDMA_SETUP: return "RDMA_SETUP";
        case FrameType::RDMA_SETUP_REPLY: return "RDMA_SETUP_REPLY";
        case FrameType::RDMA_DONE: return "RDMA_DONE";
    }
    return "UNKNOWN";
}

bool is_valid_frame_type(uint8_t raw) {
    return raw >= static_cast<uint8_t>(FrameType::HANDSHAKE) &&
           raw <= static_cast<uint8_t>(FrameType::RDMA_DONE);
}

std::string encode_frame(FrameType type, std::string_view payload) {
    if (payload.size() > kMaxFrameSize) {
        throw ProtocolError("frame payload too large: " + std::to_string(payload.size()));
    }
    const uint32_t length = static_cast<uint32_t>(payload.size());

    std::string encoded;
    encoded.reserve(kFrameHeaderSize + length);
    encoded.push_back(static_cast<char>(type));
    encoded.push_back(static_cast<char>((length >> 24) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 16) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded.push_back(static_cast<char>(length & 0xFF));
    encoded.append(payload.data(), payload.size());
    return encoded;
}

void decode_header(const uint8_t* header, FrameType& type, uint32_t& length) {
    if (!is_valid_frame_type(header[0])) {
        throw ProtocolError("unknown frame type " + std::to_string(header[0]));
    }
    type = static_cast<FrameType>(header[0]);
    length = (static_cast<uint32_t>(header[1]) << 24) |
             (static_cast<uint32_t>(header[2]) << 16) |
             (static_cast<uint32_t>(header[3]) << 8) |
             static_cast<uint32_t>(header[4]);
    if (length > kMaxFrameSize) {
        throw ProtocolError("frame length too large: " + std::to_string(length));
    }
}

// ============================================================================
// PAYLOAD PRIMITIVES
// ============================================================================

void PayloadWriter::put_u8(uint8_t v) {
    m_buf.push_back(static_cast<char>(v));
}

void PayloadWriter::put_u32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        m_buf.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

void PayloadWriter::put_u64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        m_buf.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

void PayloadWriter::put_string(std::string_view s) {
    put_u32(static_cast<uint32_t>(s.size()));
    m_buf.append(s.data(), s.size());
}

void PayloadWriter::put_bytes(const uint8_t* data, size_t len) {
    m_buf.append(reinterpret_cast<const char*>(data), len);
}

void PayloadReader::need(size_t n) const {
    if (m_data.size() - m_pos < n) {
        throw ProtocolError("truncated payload: need " + std::to_string(n) + " bytes, have " +
                            std::to_string(m_data.size() - m_pos));
    }
}

uint8_t PayloadReader::get_u8() {
    need(1);
    return static_cast<uint8_t>(m_data[m_pos++]);
}

uint32_t PayloadReader::get_u32() {
    need(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | static_cast<uint8_t>(m_data[m_pos++]);
    }
    return v;
}

uint64_t PayloadReader::get_u64() {
    need(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint8_t>(m_data[m_pos++]);
    }
    return v;
}

std::string PayloadReader::get_string() {
    const uint32_t len = get_u32();
    need(len);
    std::string s(m_data.substr(m_pos, len));
    m_pos += len;
    return s;
}

void PayloadReader::get_bytes(uint8_t* out, size_t len) {
    need(len);
    std::memcpy(out, m_data.data() + m_pos, len);
    m_pos += len;
}

// ============================================================================
// MESSAGES
// ============================================================================

void Handshake::write(PayloadWriter& w) const {
    w.put_u8(version);
    w.put_u8(flags);
    w.put_string(transfer_id);
    w.put_string(filename);
    w.put_u64(total_size);
    w.put_string(hash);
    w.put_u32(stream_count);
    w.put_u32(stream_index);
    w.put_u64(range_offset);
    w.put_u64(range_length);
}

Handshake Handshake::read(PayloadReader& r) {
    Handshake h;
    h.version = r.get_u8();
    if (h.version != kProtocolVersion) {
        throw ProtocolError("unsupported protocol version " + std::to_string(h.version));
    }
    h.flags = r.get_u8();
    h.transfer_id = r.get_string();
    h.filename = r.get_string();
    h.total_size = r.get_u64();
    h.hash = r.get_string();
    h.stream_count = r.get_u32();
    h.stream_index = r.get_u32();
    h.range_offset = r.get_u64();
    h.range_length = r.get_u64();
    return h;
}

std::string Handshake::encode() const {
    PayloadWriter w;
    write(w);
    return w.data();
}

Handshake Handshake::decode(std::string_view payload) {
    PayloadReader r(payload);
    return read(r);
}

const char* handshake_status_name(HandshakeStatus status) {
    switch (status) {
        case HandshakeStatus::READY: return "ready";
        case HandshakeStatus::REJECTED: return "rejected";
        case HandshakeStatus::UNKNOWN_TRANSFER: return "unknown_transfer";
        case HandshakeStatus::ALREADY_COMPLETE: return "already_complete";
    }
    return "unknown";
}

namespace {
HandshakeStatus read_status(PayloadReader& r) {
    const uint8_t raw = r.get_u8();
    if (raw > static_cast<uint8_t>(HandshakeStatus::ALREADY_COMPLETE)) {
        throw ProtocolError("bad handshake status " + std::to_string(raw));
    }
    return static_cast<HandshakeStatus>(raw);
}
} // namespace

std::string HandshakeReply::encode() const {
    PayloadWriter w;
    w.put_u8(static_cast<uint8_t>(status));
    w.put_u64(resume_offset);
    w.put_string(message);
    return w.data();
}

HandshakeReply HandshakeReply::decode(std::string_view payload) {
    PayloadReader r(payload);
    HandshakeReply reply;
    reply.status = read_status(r);
    reply.resume_offset = r.get_u64();
    reply.message = r.get_string();
    return reply;
}

std::string StreamAck::encode() const {
    PayloadWriter w;
    w.put_u32(stream_index);
    w.put_u64(bytes);
    return w.data();
}

StreamAck StreamAck::decode(std::string_view payload) {
    PayloadReader r(payload);
    StreamAck ack;
    ack.stream_index = r.get_u32();
    ack.bytes = r.get_u64();
    return ack;
}

std::string VerifyRequest::encode() const {
    PayloadWriter w;
    w.put_string(transfer_id);
    return w.data();
}

VerifyRequest VerifyRequest::decode(std::string_view payload) {
    PayloadReader r(payload);
    VerifyRequest req;
    req.transfer_id = r.get_string();
    return req;
}

const char* verify_verdict_name(VerifyVerdict verdict) {
    switch (verdict) {
        case VerifyVerdict::COMPLETED: return "completed";
        case VerifyVerdict::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case VerifyVerdict::FAILED: return "failed";
        case VerifyVerdict::TIMEOUT: return "timeout";
        case VerifyVerdict::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string VerifyReply::encode() const {
    PayloadWriter w;
    w.put_u8(static_cast<uint8_t>(verdict));
    w.put_string(hash);
    w.put_string(message);
    return w.data();
}

VerifyReply VerifyReply::decode(std::string_view payload) {
    PayloadReader r(payload);
    VerifyReply reply;
    const uint8_t raw = r.get_u8();
    if (raw > static_cast<uint8_t>(VerifyVerdict::UNKNOWN)) {
        throw ProtocolError("bad verify verdict " + std::to_string(raw));
    }
    reply.verdict = static_cast<VerifyVerdict>(raw);
    reply.hash = r.get_string();
    reply.message = r.get_string();
    return reply;
}

void RdmaEndpoint::write(PayloadWriter& w) const {
    w.put_u32(lid);
    w.put_u32(qpn);
    w.put_u32(psn);
    w.put_bytes(gid, sizeof(gid));
}

RdmaEndpoint RdmaEndpoint::read(PayloadReader& r) {
    RdmaEndpoint ep;
    ep.lid = static_cast<uint16_t>(r.get_u32());
    ep.qpn = r.get_u32();
    ep.psn = r.get_u32();
    r.get_bytes(ep.gid, sizeof(ep.gid));
    return ep;
}

std::string RdmaSetup::encode() const {
    PayloadWriter w;
    handshake.write(w);
    endpoint.write(w);
    return w.data();
}

RdmaSetup RdmaSetup::decode(std::string_view payload) {
    PayloadReader r(payload);
    RdmaSetup setup;
    setup.handshake = Handshake::read(r);
    setup.endpoint = RdmaEndpoint::read(r);
    return setup;
}

std::string RdmaSetupReply::encode() const {
    PayloadWriter w;
    w.put_u8(static_cast<uint8_t>(status));
    w.put_string(message);
    endpoint.write(w);
    w.put_u64(remote_addr);
    w.put_u32(rkey);
    return w.data();
}

RdmaSetupReply RdmaSetupReply::decode(std::string_view payload) {
    PayloadReader r(payload);
    RdmaSetupReply reply;
    reply.status = read_status(r);
    reply.message = r.get_string();
    reply.endpoint = RdmaEndpoint::read(r);
    reply.remote_addr = r.get_u64();
    reply.rkey = r.get_u32();
    return reply;
}

std::string RdmaDone::encode() const {
    PayloadWriter w;
    w.put_string(transfer_id);
    w.put_u64(bytes);
    return w.data();
}

RdmaDone RdmaDone::decode(std::string_view payload) {
    PayloadReader r(payload);
    RdmaDone done;
    done.transfer_id = r.get_string();
    done.bytes = r.get_u64();
    return done;
}

} // namespace wire
