#include "interface_classifier.h"
#include "logger.h"

#include <iostream>
#include <system_error>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_classify_by_name() {
    InterfaceClassifier c;
    TEST_ASSERT(c.classify("en5") == InterfaceKind::THUNDERBOLT, "en5 is thunderbolt");
    TEST_ASSERT(c.classify("bridge0") == InterfaceKind::THUNDERBOLT, "bridge is thunderbolt");
    TEST_ASSERT(c.classify("Thunderbolt Bridge") == InterfaceKind::THUNDERBOLT, "case-insensitive match");
    TEST_ASSERT(c.classify("eth0") == InterfaceKind::ETHERNET, "eth0 is ethernet");
    TEST_ASSERT(c.classify("enp3s0") == InterfaceKind::ETHERNET, "predictable names are ethernet");
    TEST_ASSERT(c.classify("wlan0") == InterfaceKind::WIFI, "wlan0 is wifi");
    TEST_ASSERT(c.classify("wlp2s0") == InterfaceKind::WIFI, "wlp is wifi");
    TEST_ASSERT(c.classify("wifi0") == InterfaceKind::WIFI, "wifi0 is wifi");
    TEST_ASSERT(c.classify("lo") == InterfaceKind::LOOPBACK, "lo is loopback");
    TEST_ASSERT(c.classify("lo0") == InterfaceKind::LOOPBACK, "lo0 is loopback");
    TEST_ASSERT(c.classify("docker0") == InterfaceKind::OTHER, "unknown names are other");
    return true;
}

static bool test_loopback_signals_override_name() {
    InterfaceClassifier c;
    TEST_ASSERT(c.classify("eth9", "", true) == InterfaceKind::LOOPBACK, "loopback flag wins");
    TEST_ASSERT(c.classify("eth9", "", false, {"127.0.0.1"}) == InterfaceKind::LOOPBACK,
                "loopback-only addresses win");
    TEST_ASSERT(c.classify("eth9", "", false, {"127.0.0.1", "10.0.0.2"}) == InterfaceKind::ETHERNET,
                "one routable address keeps the name's kind");
    return true;
}

static bool test_rank_order() {
    InterfaceClassifier c;
    std::vector<NetworkInterface> ifaces = {
        c.describe("wifi0", {"192.168.1.10"}),
        c.describe("lo0", {"127.0.0.1"}, "", true),
        c.describe("eth0", {"10.0.0.5"}),
        c.describe("en5", {"169.254.10.2"}),
    };
    const auto ranked = c.rank(ifaces);
    TEST_ASSERT(ranked.size() == 4, "nothing dropped");
    TEST_ASSERT(ranked[0].name == "en5", "thunderbolt first");
    TEST_ASSERT(ranked[1].name == "eth0", "ethernet second");
    TEST_ASSERT(ranked[2].name == "wifi0", "wifi third");
    TEST_ASSERT(ranked[3].name == "lo0", "loopback last");
    return true;
}

static bool test_rank_is_stable() {
    InterfaceClassifier c;
    std::vector<NetworkInterface> ifaces = {
        c.describe("eth1", {"10.0.0.1"}),
        c.describe("wlan0", {"192.168.0.3"}),
        c.describe("eth0", {"10.0.0.2"}),
    };
    const auto ranked = c.rank(ifaces);
    TEST_ASSERT(ranked[0].name == "eth1" && ranked[1].name == "eth0", "equal kinds keep input order");
    return true;
}

static bool test_best_interface() {
    InterfaceClassifier c;
    auto ranked = c.rank({
        c.describe("en5", {"fe80::1"}),
        c.describe("wlan0", {"192.168.0.3"}),
        c.describe("lo", {"127.0.0.1"}, "", true),
    });
    auto best = InterfaceClassifier::best_interface(ranked);
    TEST_ASSERT(best.has_value(), "found one");
    TEST_ASSERT(best->name == "wlan0", "skips interfaces without IPv4");
    TEST_ASSERT(best->ipv4() == "192.168.0.3", "ipv4 accessor");

    ranked = c.rank({c.describe("lo", {"127.0.0.1"}, "", true)});
    best = InterfaceClassifier::best_interface(ranked);
    TEST_ASSERT(best && best->kind == InterfaceKind::LOOPBACK, "falls back to loopback");

    TEST_ASSERT(!InterfaceClassifier::best_interface({}).has_value(), "nothing usable");
    return true;
}

static bool test_custom_table() {
    InterfaceClassifier c({{InterfaceKind::THUNDERBOLT, InterfaceClassifier::MatchMode::PREFIX, "ib"}});
    TEST_ASSERT(c.classify("ib0") == InterfaceKind::THUNDERBOLT, "custom pattern applies");
    TEST_ASSERT(c.classify("eth0") == InterfaceKind::OTHER, "default patterns replaced");
    return true;
}

static bool test_enumerate_host() {
    InterfaceClassifier c;
    try {
        const auto ranked = c.rank(c.enumerate());
        for (size_t i = 1; i < ranked.size(); ++i) {
            TEST_ASSERT(ranked[i - 1].rank() <= ranked[i].rank(), "host interfaces ranked");
        }
    } catch (const std::system_error& e) {
        std::cout << "SKIP: host enumeration unavailable: " << e.what() << std::endl;
    }
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- InterfaceClassifier tests ---" << std::endl;

    if (test_classify_by_name()) std::cout << "PASS: classify by name" << std::endl;
    if (test_loopback_signals_override_name()) std::cout << "PASS: loopback override" << std::endl;
    if (test_rank_order()) std::cout << "PASS: rank order" << std::endl;
    if (test_rank_is_stable()) std::cout << "PASS: stable rank" << std::endl;
    if (test_best_interface()) std::cout << "PASS: best interface" << std::endl;
    if (test_custom_table()) std::cout << "PASS: custom pattern table" << std::endl;
    if (test_enumerate_host()) std::cout << "PASS: host enumeration" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
