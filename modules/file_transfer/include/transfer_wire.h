#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wire {

// Control frames only; bulk data follows a READY reply as raw bytes.
inline constexpr uint32_t kMaxFrameSize = 64u * 1024u;
inline constexpr uint8_t kProtocolVersion = 1;
inline constexpr uint32_t kFrameHeaderSize = 5;

enum class FrameType : uint8_t {
    HANDSHAKE = 1,
    HANDSHAKE_REPLY = 2,
    STREAM_ACK = 3,
    VERIFY = 4,
    VERIFY_REPLY = 5,
    RDMA_SETUP = 6,
    RDMA_SETUP_REPLY = 7,
    RDMA_DONE = 8
};

const char* frame_type_name(FrameType type);
bool is_valid_frame_type(uint8_t raw);

// [type: 1 byte][length: 4 bytes big-endian][payload: length bytes]
std::string encode_frame(FrameType type, std::string_view payload);

// Parses a 5-byte header. Throws ProtocolError on unknown type or oversize length.
void decode_header(const uint8_t* header, FrameType& type, uint32_t& length);

class PayloadWriter {
public:
    void put_u8(uint8_t v);
    void put_u32(uint32_t v);
    void put_u64(uint64_t v);
    void put_string(std::string_view s);
    void put_bytes(const uint8_t* data, size_t len);

    const std::string& data() const { return m_buf; }

private:
    std::string m_buf;
};

// Throws ProtocolError on underrun.
class PayloadReader {
public:
    explicit PayloadReader(std::string_view data) : m_data(data) {}

    uint8_t get_u8();
    uint32_t get_u32();
    uint64_t get_u64();
    std::string get_string();
    void get_bytes(uint8_t* out, size_t len);

    bool at_end() const { return m_pos == m_data.size(); }

private:
    void need(size_t n) const;

    std::string_view m_data;
    size_t m_pos = 0;
};

// ============================================================================
// MESSAGES
// ============================================================================

inline constexpr uint8_t kFlagResume = 0x01;

struct Handshake {
    uint8_t version = kProtocolVersion;
    uint8_t flags = 0;
    std::string transfer_id;
    std::string filename;
    uint64_t total_size = 0;
    std::string hash;
    uint32_t stream_count = 0;
    uint32_t stream_index = 0;
    uint64_t range_offset = 0;
    uint64_t range_length = 0;

    bool resume() const { return (flags & kFlagResume) != 0; }

    void write(PayloadWriter& w) const;
    static Handshake read(PayloadReader& r);
    std::string encode() const;
    static Handshake decode(std::string_view payload);
};

enum class HandshakeStatus : uint8_t {
    READY = 0,
    REJECTED = 1,
    UNKNOWN_TRANSFER = 2,
    ALREADY_COMPLETE = 3
};

const char* handshake_status_name(HandshakeStatus status);

struct HandshakeReply {
    HandshakeStatus status = HandshakeStatus::READY;
    uint64_t resume_offset = 0;     // relative to range_offset
    std::string message;

    std::string encode() const;
    static HandshakeReply decode(std::string_view payload);
};

struct StreamAck {
    uint32_t stream_index = 0;
    uint64_t bytes = 0;

    std::string encode() const;
    static StreamAck decode(std::string_view payload);
};

struct VerifyRequest {
    std::string transfer_id;

    std::string encode() const;
    static VerifyRequest decode(std::string_view payload);
};

enum class VerifyVerdict : uint8_t {
    COMPLETED = 0,
    CHECKSUM_MISMATCH = 1,
    FAILED = 2,
    TIMEOUT = 3,
    UNKNOWN = 4
};

const char* verify_verdict_name(VerifyVerdict verdict);

struct VerifyReply {
    VerifyVerdict verdict = VerifyVerdict::UNKNOWN;
    std::string hash;
    std::string message;

    std::string encode() const;
    static VerifyReply decode(std::string_view payload);
};

// Queue pair coordinates as exchanged out of band.
struct RdmaEndpoint {
    uint16_t lid = 0;
    uint32_t qpn = 0;
    uint32_t psn = 0;
    uint8_t gid[16] = {};

    void write(PayloadWriter& w) const;
    static RdmaEndpoint read(PayloadReader& r);
};

struct RdmaSetup {
    Handshake handshake;        // whole file as a single range
    RdmaEndpoint endpoint;

    std::string encode() const;
    static RdmaSetup decode(std::string_view payload);
};

struct RdmaSetupReply {
    HandshakeStatus status = HandshakeStatus::READY;
    std::string message;
    RdmaEndpoint endpoint;
    uint64_t remote_addr = 0;
    uint32_t rkey = 0;

    std::string encode() const;
    static RdmaSetupReply decode(std::string_view payload);
};

struct RdmaDone {
    std::string transfer_id;
    uint64_t bytes = 0;

    std::string encode() const;
    static RdmaDone decode(std::string_view payload);
};

} // namespace wire
