#include "transfer_wire.h"
#include "transfer_errors.h"
#include "socket_utils.h"
#include "logger.h"

#include <cstring>
#include <iostream>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

template <typename Fn>
static bool throws_protocol_error(Fn fn) {
    try {
        fn();
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

static bool test_frame_layout() {
    const std::string frame = wire::encode_frame(wire::FrameType::STREAM_ACK, std::string(300, 'x'));
    TEST_ASSERT(frame.size() == wire::kFrameHeaderSize + 300, "header plus payload");
    const auto* h = reinterpret_cast<const uint8_t*>(frame.data());
    TEST_ASSERT(h[0] == 3, "type byte");
    TEST_ASSERT(h[1] == 0 && h[2] == 0 && h[3] == 0x01 && h[4] == 0x2C, "big-endian length");

    wire::FrameType type;
    uint32_t length = 0;
    wire::decode_header(h, type, length);
    TEST_ASSERT(type == wire::FrameType::STREAM_ACK && length == 300, "header decodes");
    TEST_ASSERT(std::string(wire::frame_type_name(type)) == "STREAM_ACK", "frame name");
    return true;
}

static bool test_frame_errors() {
    const uint8_t bad_type[5] = {0x42, 0, 0, 0, 0};
    const uint8_t too_long[5] = {1, 0x00, 0x01, 0x00, 0x01};
    wire::FrameType type;
    uint32_t length;
    TEST_ASSERT(throws_protocol_error([&] { wire::decode_header(bad_type, type, length); }), "unknown type");
    TEST_ASSERT(throws_protocol_error([&] { wire::decode_header(too_long, type, length); }), "oversized length");
    TEST_ASSERT(throws_protocol_error([] {
                    wire::encode_frame(wire::FrameType::VERIFY, std::string(wire::kMaxFrameSize + 1, 'a'));
                }),
                "encode refuses oversize payload");
    TEST_ASSERT(!wire::is_valid_frame_type(0) && !wire::is_valid_frame_type(9), "type bounds");
    return true;
}

static bool test_handshake_fields() {
    wire::Handshake hs;
    hs.flags = wire::kFlagResume;
    hs.transfer_id = "0f8fad5b-d9cb-469f-a165-70867728950e";
    hs.filename = "dataset.bin";
    hs.total_size = 10ull * 1024 * 1024 * 1024;
    hs.hash = std::string(64, 'a');
    hs.stream_count = 4;
    hs.stream_index = 3;
    hs.range_offset = 7ull << 30;
    hs.range_length = 3ull << 30;

    const auto back = wire::Handshake::decode(hs.encode());
    TEST_ASSERT(back.resume(), "resume flag");
    TEST_ASSERT(back.transfer_id == hs.transfer_id && back.filename == hs.filename, "strings");
    TEST_ASSERT(back.total_size == hs.total_size, "64-bit size");
    TEST_ASSERT(back.stream_index == 3 && back.range_offset == hs.range_offset &&
                back.range_length == hs.range_length, "range");

    std::string truncated = hs.encode();
    truncated.resize(truncated.size() - 3);
    TEST_ASSERT(throws_protocol_error([&] { wire::Handshake::decode(truncated); }), "truncated handshake");

    std::string wrong_version = hs.encode();
    wrong_version[0] = 9;
    TEST_ASSERT(throws_protocol_error([&] { wire::Handshake::decode(wrong_version); }), "version mismatch");
    return true;
}

static bool test_replies() {
    wire::HandshakeReply reply;
    reply.status = wire::HandshakeStatus::ALREADY_COMPLETE;
    reply.resume_offset = 12345;
    reply.message = "done";
    const auto r = wire::HandshakeReply::decode(reply.encode());
    TEST_ASSERT(r.status == wire::HandshakeStatus::ALREADY_COMPLETE && r.resume_offset == 12345, "reply");

    std::string bad = reply.encode();
    bad[0] = 7;
    TEST_ASSERT(throws_protocol_error([&] { wire::HandshakeReply::decode(bad); }), "bad status");

    wire::VerifyReply verdict;
    verdict.verdict = wire::VerifyVerdict::CHECKSUM_MISMATCH;
    verdict.hash = std::string(64, 'f');
    const auto v = wire::VerifyReply::decode(verdict.encode());
    TEST_ASSERT(v.verdict == wire::VerifyVerdict::CHECKSUM_MISMATCH && v.hash == verdict.hash, "verify reply");
    TEST_ASSERT(std::string(wire::verify_verdict_name(v.verdict)) == "checksum_mismatch", "verdict name");
    return true;
}

static bool test_rdma_messages() {
    wire::RdmaSetupReply reply;
    reply.endpoint.lid = 0xBEEF;
    reply.endpoint.qpn = 0x123456;
    reply.endpoint.psn = 42;
    for (int i = 0; i < 16; ++i) reply.endpoint.gid[i] = static_cast<uint8_t>(i * 3);
    reply.remote_addr = 0x7f0000001000ull;
    reply.rkey = 0xA5A5;

    const auto back = wire::RdmaSetupReply::decode(reply.encode());
    TEST_ASSERT(back.endpoint.lid == 0xBEEF && back.endpoint.qpn == 0x123456, "queue pair identity");
    TEST_ASSERT(std::memcmp(back.endpoint.gid, reply.endpoint.gid, 16) == 0, "gid");
    TEST_ASSERT(back.remote_addr == reply.remote_addr && back.rkey == reply.rkey, "remote region");
    return true;
}

static bool test_socket_framing() {
    int sv[2];
    TEST_ASSERT(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
    Socket a(sv[0]);
    Socket b(sv[1]);

    wire::StreamAck ack;
    ack.stream_index = 2;
    ack.bytes = 999;
    send_frame(a.fd(), wire::FrameType::STREAM_ACK, ack.encode());
    const auto got = wire::StreamAck::decode(recv_frame(b.fd(), wire::FrameType::STREAM_ACK));
    TEST_ASSERT(got.stream_index == 2 && got.bytes == 999, "frame over socket");

    send_frame(a.fd(), wire::FrameType::VERIFY, wire::VerifyRequest{"abc"}.encode());
    TEST_ASSERT(throws_protocol_error([&] { recv_frame(b.fd(), wire::FrameType::STREAM_ACK); }),
                "unexpected frame type rejected");

    a.close();
    bool closed = false;
    try {
        uint8_t byte;
        recv_all(b.fd(), &byte, 1);
    } catch (const TransferIoError&) {
        closed = true;
    }
    TEST_ASSERT(closed, "EOF surfaces as an I/O error");
    return true;
}

static bool test_parse_endpoint() {
    Endpoint ep;
    TEST_ASSERT(parse_endpoint("10.1.2.3:7879", ep), "valid endpoint");
    TEST_ASSERT(ep.ip == "10.1.2.3" && ep.port == 7879, "fields");
    TEST_ASSERT(ep.to_string() == "10.1.2.3:7879", "to_string");
    TEST_ASSERT(!parse_endpoint("10.1.2.3", ep), "missing port");
    TEST_ASSERT(!parse_endpoint("10.1.2.3:0", ep), "port zero");
    TEST_ASSERT(!parse_endpoint("10.1.2.3:70000", ep), "port too large");
    TEST_ASSERT(!parse_endpoint("beta:7879", ep), "names are not endpoints");
    TEST_ASSERT(!parse_endpoint("10.1.2:7879", ep), "short address");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- Wire codec tests ---" << std::endl;

    if (test_frame_layout()) std::cout << "PASS: frame layout" << std::endl;
    if (test_frame_errors()) std::cout << "PASS: frame errors" << std::endl;
    if (test_handshake_fields()) std::cout << "PASS: handshake" << std::endl;
    if (test_replies()) std::cout << "PASS: replies" << std::endl;
    if (test_rdma_messages()) std::cout << "PASS: rdma messages" << std::endl;
    if (test_socket_framing()) std::cout << "PASS: socket framing" << std::endl;
    if (test_parse_endpoint()) std::cout << "PASS: endpoint parsing" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
