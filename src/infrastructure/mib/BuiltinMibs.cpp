#include "infrastructure/mib/BuiltinMibs.hpp"

namespace snmplink::infra {

namespace {

using core::SnmpValueType;

struct Entry {
    const char* name;
    const char* oid;
    std::optional<SnmpValueType> syntax;
};

MibModuleDefinition makeModule(const std::string& name,
                               std::vector<std::string> imports,
                               std::initializer_list<Entry> entries) {
    MibModuleDefinition module;
    module.name = name;
    module.imports = std::move(imports);
    for (const auto& entry : entries) {
        module.symbols.push_back(core::MibSymbol{
            name, entry.name, core::ObjectIdentifier::fromString(entry.oid), entry.syntax});
    }
    return module;
}

// RFC 2578
MibModuleDefinition snmpv2Smi() {
    return makeModule("SNMPv2-SMI", {},
                      {
                          {"zeroDotZero", "0.0", std::nullopt},
                          {"iso", "1", std::nullopt},
                          {"org", "1.3", std::nullopt},
                          {"dod", "1.3.6", std::nullopt},
                          {"internet", "1.3.6.1", std::nullopt},
                          {"directory", "1.3.6.1.1", std::nullopt},
                          {"mgmt", "1.3.6.1.2", std::nullopt},
                          {"mib-2", "1.3.6.1.2.1", std::nullopt},
                          {"transmission", "1.3.6.1.2.1.10", std::nullopt},
                          {"experimental", "1.3.6.1.3", std::nullopt},
                          {"private", "1.3.6.1.4", std::nullopt},
                          {"enterprises", "1.3.6.1.4.1", std::nullopt},
                          {"security", "1.3.6.1.5", std::nullopt},
                          {"snmpV2", "1.3.6.1.6", std::nullopt},
                          {"snmpDomains", "1.3.6.1.6.1", std::nullopt},
                          {"snmpProxys", "1.3.6.1.6.2", std::nullopt},
                          {"snmpModules", "1.3.6.1.6.3", std::nullopt},
                      });
}

// RFC 3418
MibModuleDefinition snmpv2Mib() {
    return makeModule("SNMPv2-MIB", {"SNMPv2-SMI"},
                      {
                          {"system", "1.3.6.1.2.1.1", std::nullopt},
                          {"sysDescr", "1.3.6.1.2.1.1.1", SnmpValueType::OctetString},
                          {"sysObjectID", "1.3.6.1.2.1.1.2", SnmpValueType::ObjectIdentifier},
                          {"sysUpTime", "1.3.6.1.2.1.1.3", SnmpValueType::TimeTicks},
                          {"sysContact", "1.3.6.1.2.1.1.4", SnmpValueType::OctetString},
                          {"sysName", "1.3.6.1.2.1.1.5", SnmpValueType::OctetString},
                          {"sysLocation", "1.3.6.1.2.1.1.6", SnmpValueType::OctetString},
                          {"sysServices", "1.3.6.1.2.1.1.7", SnmpValueType::Integer},
                          {"sysORLastChange", "1.3.6.1.2.1.1.8", SnmpValueType::TimeTicks},
                          {"sysORTable", "1.3.6.1.2.1.1.9", std::nullopt},
                          {"sysOREntry", "1.3.6.1.2.1.1.9.1", std::nullopt},
                          {"sysORIndex", "1.3.6.1.2.1.1.9.1.1", SnmpValueType::Integer},
                          {"sysORID", "1.3.6.1.2.1.1.9.1.2", SnmpValueType::ObjectIdentifier},
                          {"sysORDescr", "1.3.6.1.2.1.1.9.1.3", SnmpValueType::OctetString},
                          {"sysORUpTime", "1.3.6.1.2.1.1.9.1.4", SnmpValueType::TimeTicks},
                          {"snmp", "1.3.6.1.2.1.11", std::nullopt},
                          {"snmpInPkts", "1.3.6.1.2.1.11.1", SnmpValueType::Counter32},
                          {"snmpInBadVersions", "1.3.6.1.2.1.11.3", SnmpValueType::Counter32},
                          {"snmpInBadCommunityNames", "1.3.6.1.2.1.11.4", SnmpValueType::Counter32},
                          {"snmpInBadCommunityUses", "1.3.6.1.2.1.11.5", SnmpValueType::Counter32},
                          {"snmpInASNParseErrs", "1.3.6.1.2.1.11.6", SnmpValueType::Counter32},
                          {"snmpEnableAuthenTraps", "1.3.6.1.2.1.11.30", SnmpValueType::Integer},
                          {"snmpSilentDrops", "1.3.6.1.2.1.11.31", SnmpValueType::Counter32},
                          {"snmpProxyDrops", "1.3.6.1.2.1.11.32", SnmpValueType::Counter32},
                          {"snmpMIB", "1.3.6.1.6.3.1", std::nullopt},
                          {"snmpMIBObjects", "1.3.6.1.6.3.1.1", std::nullopt},
                          {"snmpSet", "1.3.6.1.6.3.1.1.6", std::nullopt},
                          {"snmpSetSerialNo", "1.3.6.1.6.3.1.1.6.1", SnmpValueType::Integer},
                      });
}

// RFC 2863
MibModuleDefinition ifMib() {
    return makeModule("IF-MIB", {"SNMPv2-SMI", "SNMPv2-MIB"},
                      {
                          {"interfaces", "1.3.6.1.2.1.2", std::nullopt},
                          {"ifNumber", "1.3.6.1.2.1.2.1", SnmpValueType::Integer32},
                          {"ifTable", "1.3.6.1.2.1.2.2", std::nullopt},
                          {"ifEntry", "1.3.6.1.2.1.2.2.1", std::nullopt},
                          {"ifIndex", "1.3.6.1.2.1.2.2.1.1", SnmpValueType::Integer32},
                          {"ifDescr", "1.3.6.1.2.1.2.2.1.2", SnmpValueType::OctetString},
                          {"ifType", "1.3.6.1.2.1.2.2.1.3", SnmpValueType::Integer},
                          {"ifMtu", "1.3.6.1.2.1.2.2.1.4", SnmpValueType::Integer32},
                          {"ifSpeed", "1.3.6.1.2.1.2.2.1.5", SnmpValueType::Gauge32},
                          {"ifPhysAddress", "1.3.6.1.2.1.2.2.1.6", SnmpValueType::OctetString},
                          {"ifAdminStatus", "1.3.6.1.2.1.2.2.1.7", SnmpValueType::Integer},
                          {"ifOperStatus", "1.3.6.1.2.1.2.2.1.8", SnmpValueType::Integer},
                          {"ifLastChange", "1.3.6.1.2.1.2.2.1.9", SnmpValueType::TimeTicks},
                          {"ifInOctets", "1.3.6.1.2.1.2.2.1.10", SnmpValueType::Counter32},
                          {"ifInUcastPkts", "1.3.6.1.2.1.2.2.1.11", SnmpValueType::Counter32},
                          {"ifInDiscards", "1.3.6.1.2.1.2.2.1.13", SnmpValueType::Counter32},
                          {"ifInErrors", "1.3.6.1.2.1.2.2.1.14", SnmpValueType::Counter32},
                          {"ifOutOctets", "1.3.6.1.2.1.2.2.1.16", SnmpValueType::Counter32},
                          {"ifOutUcastPkts", "1.3.6.1.2.1.2.2.1.17", SnmpValueType::Counter32},
                          {"ifOutDiscards", "1.3.6.1.2.1.2.2.1.19", SnmpValueType::Counter32},
                          {"ifOutErrors", "1.3.6.1.2.1.2.2.1.20", SnmpValueType::Counter32},
                          {"ifMIB", "1.3.6.1.2.1.31", std::nullopt},
                          {"ifMIBObjects", "1.3.6.1.2.1.31.1", std::nullopt},
                          {"ifXTable", "1.3.6.1.2.1.31.1.1", std::nullopt},
                          {"ifXEntry", "1.3.6.1.2.1.31.1.1.1", std::nullopt},
                          {"ifName", "1.3.6.1.2.1.31.1.1.1.1", SnmpValueType::OctetString},
                          {"ifHCInOctets", "1.3.6.1.2.1.31.1.1.1.6", SnmpValueType::Counter64},
                          {"ifHCOutOctets", "1.3.6.1.2.1.31.1.1.1.10", SnmpValueType::Counter64},
                          {"ifHighSpeed", "1.3.6.1.2.1.31.1.1.1.15", SnmpValueType::Gauge32},
                          {"ifAlias", "1.3.6.1.2.1.31.1.1.1.18", SnmpValueType::OctetString},
                      });
}

} // namespace

std::vector<std::string> builtinMibNames() {
    return {"SNMPv2-SMI", "SNMPv2-MIB", "IF-MIB"};
}

std::optional<MibModuleDefinition> builtinMib(const std::string& name) {
    if (name == "SNMPv2-SMI") return snmpv2Smi();
    if (name == "SNMPv2-MIB") return snmpv2Mib();
    if (name == "IF-MIB") return ifMib();
    return std::nullopt;
}

} // namespace snmplink::infra
