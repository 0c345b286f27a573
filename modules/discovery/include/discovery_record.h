#ifndef DISCOVERY_RECORD_H
#define DISCOVERY_RECORD_H

#include "interface_classifier.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr const char* DISCOVERY_SERVICE_TYPE = "_nodelink._tcp";
constexpr int DISCOVERY_RECORD_VERSION = 1;
constexpr size_t DISCOVERY_MAX_DATAGRAM = 1400;

enum class RecordType {
    ANNOUNCE,
    BYE
};

// One UDP datagram carrying a JSON object.
struct DiscoveryRecord {
    RecordType type = RecordType::ANNOUNCE;
    std::string id;
    std::string name;
    std::string ip;
    uint16_t port = 0;
    InterfaceKind interface_kind = InterfaceKind::OTHER;
    std::vector<std::string> capabilities;
    std::string version;
};

std::string encode_record(const DiscoveryRecord& record);

// nullopt for oversized datagrams, other services, unknown versions or
// malformed JSON.
std::optional<DiscoveryRecord> decode_record(const std::string& datagram);

#endif // DISCOVERY_RECORD_H
