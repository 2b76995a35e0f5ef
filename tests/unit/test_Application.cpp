#include <catch2/catch_test_macros.hpp>

#include "app/Application.hpp"
#include "support/FakeAgent.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace snmplink;
using snmplink::app::Application;
using snmplink::test::FakeAgent;

namespace {

class TestConfigDir {
public:
    TestConfigDir() : configDir_(std::filesystem::temp_directory_path() / "snmplink_app_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::string path() const { return configDir_.string(); }

    void writeConfig(const std::string& json) const {
        std::ofstream file(configDir_ / "config.json");
        file << json;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

struct RunResult {
    int exitCode;
    std::string output;
};

RunResult runCommand(std::vector<std::string> args,
                     std::shared_ptr<core::IUdpTransport> transport = nullptr) {
    std::ostringstream out;
    Application application(std::move(args), out, std::move(transport));
    int exitCode = application.run();
    return {exitCode, out.str()};
}

} // namespace

TEST_CASE("Application conversion commands", "[Application]") {
    SECTION("A valid value is printed with its type") {
        auto result = runCommand({"convert-gauge32", "200"});
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(result.output == "Gauge32: 200\n");
    }

    SECTION("Type names are case and separator insensitive") {
        auto result = runCommand({"convert-octet-string", "hello"});
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(result.output == "OCTET STRING: hello\n");
    }

    SECTION("Out of range values fail") {
        auto result = runCommand({"convert-integer32", "2147483648"});
        REQUIRE(result.exitCode == Application::EXIT_SNMP_ERROR);
        REQUIRE(result.output.empty());
    }

    SECTION("Unknown types are a usage error") {
        REQUIRE(runCommand({"convert-float", "1.5"}).exitCode == Application::EXIT_USAGE);
    }

    SECTION("Missing value is a usage error") {
        REQUIRE(runCommand({"convert-gauge32"}).exitCode == Application::EXIT_USAGE);
    }
}

TEST_CASE("Application command line handling", "[Application]") {
    TestConfigDir dir;

    SECTION("Help") {
        auto result = runCommand({"--help"});
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(result.output.find("snmplink [options] get OID") != std::string::npos);
    }

    SECTION("No command") {
        REQUIRE(runCommand({"--config-dir", dir.path()}).exitCode == Application::EXIT_USAGE);
    }

    SECTION("Unknown command") {
        auto result = runCommand({"--config-dir", dir.path(), "walk", "system"});
        REQUIRE(result.exitCode == Application::EXIT_USAGE);
    }

    SECTION("Unknown option") {
        REQUIRE(runCommand({"--bogus", "get", "sysDescr.0"}).exitCode == Application::EXIT_USAGE);
    }

    SECTION("Invalid port") {
        auto result = runCommand(
            {"--config-dir", dir.path(), "--host", "127.0.0.1", "--port", "70000", "get", "x"});
        REQUIRE(result.exitCode == Application::EXIT_USAGE);
    }

    SECTION("Invalid version") {
        auto result = runCommand(
            {"--config-dir", dir.path(), "--host", "127.0.0.1", "--version", "3", "get", "x"});
        REQUIRE(result.exitCode == Application::EXIT_USAGE);
    }

    SECTION("GET without a host") {
        auto agent = std::make_shared<FakeAgent>();
        auto result = runCommand({"--config-dir", dir.path(), "get", "sysDescr.0"}, agent);
        REQUIRE(result.exitCode == Application::EXIT_SNMP_ERROR);
        REQUIRE(agent->exchangeCount() == 0);
    }

    SECTION("Missing MIB directory") {
        auto result = runCommand({"--config-dir", dir.path(), "--host", "127.0.0.1",
                                  "--mib-path", dir.path() + "/missing", "get", "sysDescr.0"},
                                 std::make_shared<FakeAgent>());
        REQUIRE(result.exitCode == Application::EXIT_SNMP_ERROR);
    }
}

TEST_CASE("Application requests against an agent", "[Application]") {
    TestConfigDir dir;
    auto agent = std::make_shared<FakeAgent>("private");
    agent->setValue(core::SnmpOids::SYS_DESCR, core::OctetString{"Test agent"});
    agent->setValue(core::SnmpOids::SYS_LOCATION, core::OctetString{"Lab"});

    const std::vector<std::string> base = {"--config-dir", dir.path(), "--host", "10.0.111.112",
                                           "--community", "private"};
    auto withArgs = [&base](std::vector<std::string> extra) {
        auto args = base;
        args.insert(args.end(), extra.begin(), extra.end());
        return args;
    };

    SECTION("GET prints the value with its type") {
        auto result = runCommand(withArgs({"get", "SNMPv2-MIB::sysDescr.0"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(result.output == "SNMPv2-MIB::sysDescr.0 = OCTET STRING: Test agent\n");
        REQUIRE(agent->lastHost() == "10.0.111.112");
        REQUIRE(agent->lastPort() == 161);
    }

    SECTION("GET of a missing object") {
        auto result = runCommand(withArgs({"get", "SNMPv2-MIB::sysContact.0"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_SNMP_ERROR);
        REQUIRE(result.output.empty());
    }

    SECTION("SET converts through the MIB syntax") {
        auto result = runCommand(withArgs({"set", "SNMPv2-MIB::sysLocation.0", "Test"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(agent->value(core::SnmpOids::SYS_LOCATION) ==
                core::SnmpValue(core::OctetString{"Test"}));
    }

    SECTION("Typed SET") {
        auto result =
            runCommand(withArgs({"set-gauge32", ".1.3.6.1.4.1.15000.5.2.1.0", "200"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(agent->value(".1.3.6.1.4.1.15000.5.2.1.0") ==
                core::SnmpValue(core::Gauge32{200}));
    }

    SECTION("Typed SET of a type that cannot be set") {
        auto result =
            runCommand(withArgs({"set-ipaddress", ".1.3.6.1.4.1.15000.5.2.1.0", "1.2.3.4"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_USAGE);
    }

    SECTION("Agent settings come from the config file") {
        dir.writeConfig(R"({
            "agent": {"host": "192.0.2.7", "port": 1161, "community": "private", "version": "v1"},
            "transport": {"timeout_ms": 500, "retries": 0}
        })");

        auto result = runCommand({"--config-dir", dir.path(), "get", "sysDescr.0"}, agent);
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(agent->lastHost() == "192.0.2.7");
        REQUIRE(agent->lastPort() == 1161);
        REQUIRE(agent->lastRequest()->version == core::SnmpVersion::V1);
    }

    SECTION("Command line options override the config file") {
        dir.writeConfig(R"({"agent": {"host": "192.0.2.7", "community": "public"}})");

        auto result = runCommand(withArgs({"--port", "1161", "get", "sysDescr.0"}), agent);
        REQUIRE(result.exitCode == Application::EXIT_OK);
        REQUIRE(agent->lastHost() == "10.0.111.112");
        REQUIRE(agent->lastPort() == 1161);
        REQUIRE(agent->lastRequest()->community == "private");
    }
}
