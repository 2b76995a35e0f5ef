#pragma once

#include "core/services/IUdpTransport.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/mib/MibStore.hpp"
#include "infrastructure/network/SnmpService.hpp"
#include "infrastructure/network/SnmpSession.hpp"

#include <boost/program_options.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace snmplink::app {

/**
 * @brief Command line front end.
 *
 * Usage:
 *   snmplink [options] get OID
 *   snmplink [options] set OID VALUE
 *   snmplink [options] set-<type> OID VALUE
 *   snmplink convert-<type> VALUE
 */
class Application {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_SNMP_ERROR = 1;
    static constexpr int EXIT_USAGE = 2;

    /**
     * @brief Constructs the application for one command line.
     * @param args Arguments without the program name.
     * @param out Stream receiving command results.
     * @param transport Transport to use instead of UDP, mainly for tests.
     */
    Application(std::vector<std::string> args,
                std::ostream& out,
                std::shared_ptr<core::IUdpTransport> transport = nullptr);

    /**
     * @brief Runs the command.
     * @return Process exit code.
     */
    int run();

private:
    void initializeLogging();
    void applyLoggingConfig();
    void initializeComponents();

    int dispatch(const std::vector<std::string>& commands);
    int runGet(const std::vector<std::string>& commands);
    int runSet(const std::vector<std::string>& commands);
    int runTypedSet(const std::string& type, const std::vector<std::string>& commands);
    int runConvert(const std::string& type, const std::vector<std::string>& commands);

    void printUsage(std::ostream& os) const;

    std::vector<std::string> args_;
    std::ostream& out_;
    boost::program_options::options_description options_;
    boost::program_options::variables_map vm_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::MibStore> mib_;
    std::shared_ptr<core::IUdpTransport> transport_;
    std::unique_ptr<infra::SnmpSession> session_;
    std::unique_ptr<infra::SnmpService> service_;
};

} // namespace snmplink::app
