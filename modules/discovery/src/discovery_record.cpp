#include "discovery_record.h"
#include "logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string encode_record(const DiscoveryRecord& record) {
    json j;
    j["svc"] = DISCOVERY_SERVICE_TYPE;
    j["v"] = DISCOVERY_RECORD_VERSION;
    j["type"] = record.type == RecordType::BYE ? "bye" : "announce";
    j["id"] = record.id;
    j["name"] = record.name;
    j["ip"] = record.ip;
    j["port"] = record.port;
    j["iface"] = interface_kind_name(record.interface_kind);
    j["caps"] = record.capabilities;
    j["version"] = record.version;
    return j.dump();
}

std::optional<DiscoveryRecord> decode_record(const std::string& datagram) {
    if (datagram.empty() || datagram.size() > DISCOVERY_MAX_DATAGRAM) {
        return std::nullopt;
    }

    const json j = json::parse(datagram, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_DEBUG("DISC: Ignoring non-JSON datagram");
        return std::nullopt;
    }

    try {
        if (j.value("svc", std::string()) != DISCOVERY_SERVICE_TYPE) {
            return std::nullopt;
        }
        if (j.value("v", 0) != DISCOVERY_RECORD_VERSION) {
            return std::nullopt;
        }

        DiscoveryRecord record;
        const std::string type = j.value("type", std::string("announce"));
        if (type == "bye") {
            record.type = RecordType::BYE;
        } else if (type != "announce") {
            return std::nullopt;
        }

        record.id = j.at("id").get<std::string>();
        if (record.id.empty()) {
            return std::nullopt;
        }
        record.name = j.value("name", std::string());
        record.ip = j.value("ip", std::string());
        const int port = j.value("port", 0);
        if (port < 0 || port > 65535) {
            return std::nullopt;
        }
        record.port = static_cast<uint16_t>(port);
        record.interface_kind = parse_interface_kind(j.value("iface", std::string("other")));
        if (j.contains("caps") && j["caps"].is_array()) {
            for (const auto& c : j["caps"]) {
                if (c.is_string()) record.capabilities.push_back(c.get<std::string>());
            }
        }
        record.version = j.value("version", std::string());
        return record;
    } catch (const json::exception& e) {
        LOG_DEBUG("DISC: Malformed record: " + std::string(e.what()));
        return std::nullopt;
    }
}
