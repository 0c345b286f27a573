#include "interface_classifier.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <unordered_map>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_loopback_address(const std::string& addr) {
    return addr.rfind("127.", 0) == 0 || addr == "::1";
}

// Linux exposes the driver behind each netdev; wireless devices also get a
// "wireless" directory.
std::string read_sysfs_description(const std::string& name) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path base = fs::path("/sys/class/net") / name;
    if (fs::exists(base / "wireless", ec)) {
        return "wireless";
    }
    const fs::path driver = fs::read_symlink(base / "device" / "driver", ec);
    if (ec) {
        return "";
    }
    return driver.filename().string();
}

} // namespace

const char* interface_kind_name(InterfaceKind kind) {
    switch (kind) {
        case InterfaceKind::THUNDERBOLT: return "thunderbolt";
        case InterfaceKind::ETHERNET: return "ethernet";
        case InterfaceKind::WIFI: return "wifi";
        case InterfaceKind::LOOPBACK: return "loopback";
        case InterfaceKind::OTHER: return "other";
    }
    return "other";
}

InterfaceKind parse_interface_kind(const std::string& name) {
    const std::string v = to_lower(name);
    if (v == "thunderbolt") return InterfaceKind::THUNDERBOLT;
    if (v == "ethernet") return InterfaceKind::ETHERNET;
    if (v == "wifi") return InterfaceKind::WIFI;
    if (v == "loopback") return InterfaceKind::LOOPBACK;
    return InterfaceKind::OTHER;
}

std::string NetworkInterface::ipv4() const {
    for (const auto& a : addresses) {
        if (a.find(':') == std::string::npos) {
            return a;
        }
    }
    return "";
}

InterfaceClassifier::InterfaceClassifier() : m_patterns(default_patterns()) {}

InterfaceClassifier::InterfaceClassifier(std::vector<Pattern> table) : m_patterns(std::move(table)) {
    for (auto& p : m_patterns) {
        p.token = to_lower(p.token);
    }
}

std::vector<InterfaceClassifier::Pattern> InterfaceClassifier::default_patterns() {
    return {
        {InterfaceKind::LOOPBACK, MatchMode::EXACT, "lo"},
        {InterfaceKind::LOOPBACK, MatchMode::EXACT, "lo0"},
        {InterfaceKind::THUNDERBOLT, MatchMode::CONTAINS, "thunderbolt"},
        {InterfaceKind::THUNDERBOLT, MatchMode::CONTAINS, "bridge"},
        {InterfaceKind::THUNDERBOLT, MatchMode::CONTAINS, "tb"},
        // macOS assigns the Thunderbolt ports en5/en6
        {InterfaceKind::THUNDERBOLT, MatchMode::EXACT, "en5"},
        {InterfaceKind::THUNDERBOLT, MatchMode::EXACT, "en6"},
        {InterfaceKind::WIFI, MatchMode::CONTAINS, "wlan"},
        {InterfaceKind::WIFI, MatchMode::CONTAINS, "wifi"},
        {InterfaceKind::WIFI, MatchMode::CONTAINS, "wi-fi"},
        {InterfaceKind::WIFI, MatchMode::CONTAINS, "wireless"},
        {InterfaceKind::WIFI, MatchMode::PREFIX, "wl"},
        {InterfaceKind::ETHERNET, MatchMode::CONTAINS, "ethernet"},
        {InterfaceKind::ETHERNET, MatchMode::PREFIX, "eth"},
        {InterfaceKind::ETHERNET, MatchMode::PREFIX, "en"},
        {InterfaceKind::ETHERNET, MatchMode::PREFIX, "em"},
    };
}

bool InterfaceClassifier::matches(const Pattern& p, const std::string& lowered) {
    switch (p.mode) {
        case MatchMode::CONTAINS: return lowered.find(p.token) != std::string::npos;
        case MatchMode::PREFIX: return lowered.rfind(p.token, 0) == 0;
        case MatchMode::EXACT: return lowered == p.token;
    }
    return false;
}

InterfaceKind InterfaceClassifier::classify(const std::string& name,
                                            const std::string& description,
                                            bool loopback_flag,
                                            const std::vector<std::string>& addresses) const {
    if (loopback_flag) {
        return InterfaceKind::LOOPBACK;
    }
    if (!addresses.empty() &&
        std::all_of(addresses.begin(), addresses.end(), is_loopback_address)) {
        return InterfaceKind::LOOPBACK;
    }

    const std::string lname = to_lower(name);
    const std::string ldesc = to_lower(description);
    for (const auto& p : m_patterns) {
        if (matches(p, lname)) {
            return p.kind;
        }
        // Descriptions are free text; only substring patterns apply to them
        if (!ldesc.empty() && p.mode == MatchMode::CONTAINS && matches(p, ldesc)) {
            return p.kind;
        }
    }
    return InterfaceKind::OTHER;
}

NetworkInterface InterfaceClassifier::describe(const std::string& name,
                                               const std::vector<std::string>& addresses,
                                               const std::string& description,
                                               bool loopback_flag) const {
    NetworkInterface iface;
    iface.name = name;
    iface.description = description;
    iface.addresses = addresses;
    iface.loopback_flag = loopback_flag;
    iface.kind = classify(name, description, loopback_flag, addresses);
    return iface;
}

std::vector<NetworkInterface> InterfaceClassifier::enumerate() const {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        const int err = errno;
        LOG_ERROR("IFACE: getifaddrs failed, errno=" + std::to_string(err));
        throw std::system_error(err, std::generic_category(), "getifaddrs");
    }

    struct Collected {
        std::vector<std::string> addresses;
        bool loopback = false;
    };
    std::vector<std::string> order;
    std::unordered_map<std::string, Collected> by_name;

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_name) continue;
        if ((ifa->ifa_flags & IFF_UP) == 0) continue;

        char buf[INET6_ADDRSTRLEN] = {0};
        const int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            const uint32_t host = ntohl(sin->sin_addr.s_addr);
            if (host == 0 || IN_MULTICAST(host)) continue;
            inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        } else if (family == AF_INET6) {
            auto* sin6 = reinterpret_cast<sockaddr_in6*>(ifa->ifa_addr);
            if (IN6_IS_ADDR_UNSPECIFIED(&sin6->sin6_addr) || IN6_IS_ADDR_MULTICAST(&sin6->sin6_addr)) continue;
            inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        } else {
            continue;
        }

        const std::string name(ifa->ifa_name);
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            order.push_back(name);
            it = by_name.emplace(name, Collected{}).first;
        }
        it->second.addresses.emplace_back(buf);
        it->second.loopback = it->second.loopback || (ifa->ifa_flags & IFF_LOOPBACK) != 0;
    }
    freeifaddrs(ifaddr);

    std::vector<NetworkInterface> result;
    result.reserve(order.size());
    for (const auto& name : order) {
        const auto& c = by_name[name];
        NetworkInterface iface = describe(name, c.addresses, read_sysfs_description(name), c.loopback);
        iface.enumeration_index = result.size();
        LOG_DEBUG("IFACE: " + name + " -> " + interface_kind_name(iface.kind) +
                  (iface.ipv4().empty() ? "" : " (" + iface.ipv4() + ")"));
        result.push_back(std::move(iface));
    }
    return result;
}

std::vector<NetworkInterface> InterfaceClassifier::rank(std::vector<NetworkInterface> interfaces) const {
    std::stable_sort(interfaces.begin(), interfaces.end(),
                     [](const NetworkInterface& a, const NetworkInterface& b) {
                         return a.rank() < b.rank();
                     });
    return interfaces;
}

std::optional<NetworkInterface> InterfaceClassifier::best_interface(const std::vector<NetworkInterface>& ranked) {
    for (const auto& iface : ranked) {
        if (iface.kind != InterfaceKind::LOOPBACK && !iface.ipv4().empty()) {
            return iface;
        }
    }
    for (const auto& iface : ranked) {
        if (iface.kind == InterfaceKind::LOOPBACK && !iface.ipv4().empty()) {
            return iface;
        }
    }
    return std::nullopt;
}
