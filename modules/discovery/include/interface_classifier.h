#ifndef INTERFACE_CLASSIFIER_H
#define INTERFACE_CLASSIFIER_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Declaration order is rank order (first = most preferred).
enum class InterfaceKind {
    THUNDERBOLT,
    ETHERNET,
    WIFI,
    LOOPBACK,
    OTHER
};

const char* interface_kind_name(InterfaceKind kind);
// Unknown names map to OTHER.
InterfaceKind parse_interface_kind(const std::string& name);

struct NetworkInterface {
    std::string name;
    std::string description;          // driver / hardware hint, may be empty
    InterfaceKind kind = InterfaceKind::OTHER;
    std::vector<std::string> addresses;
    bool loopback_flag = false;
    size_t enumeration_index = 0;

    int rank() const { return static_cast<int>(kind); }
    // First IPv4 address, empty if the interface only has IPv6.
    std::string ipv4() const;
};

/**
 * Name/pattern based interface classification.
 *
 * All heuristics live in one ordered pattern table; the first matching entry
 * wins. Ranking only looks at InterfaceKind, so extending the table never
 * touches rank().
 */
class InterfaceClassifier {
public:
    enum class MatchMode { CONTAINS, PREFIX, EXACT };

    struct Pattern {
        InterfaceKind kind;
        MatchMode mode;
        std::string token;     // lowercase
    };

    InterfaceClassifier();
    explicit InterfaceClassifier(std::vector<Pattern> table);

    static std::vector<Pattern> default_patterns();

    // Loopback flag or a loopback address always wins over the table.
    InterfaceKind classify(const std::string& name,
                           const std::string& description = "",
                           bool loopback_flag = false,
                           const std::vector<std::string>& addresses = {}) const;

    NetworkInterface describe(const std::string& name,
                              const std::vector<std::string>& addresses,
                              const std::string& description = "",
                              bool loopback_flag = false) const;

    // Up interfaces with at least one usable address, in kernel order.
    // Throws std::system_error when the host interface list cannot be read.
    std::vector<NetworkInterface> enumerate() const;

    // Stable: ties keep their input order.
    std::vector<NetworkInterface> rank(std::vector<NetworkInterface> interfaces) const;

    // First non-loopback entry with IPv4, else loopback. Expects ranked input.
    static std::optional<NetworkInterface> best_interface(const std::vector<NetworkInterface>& ranked);

private:
    static bool matches(const Pattern& p, const std::string& lowered_name);

    std::vector<Pattern> m_patterns;
};

#endif // INTERFACE_CLASSIFIER_H
