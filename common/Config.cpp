#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <map>
#include <stdexcept>

namespace lanwatch::common
{
    namespace
    {
        long long ParseInteger(const std::string &key, const std::string &value, long long min, long long max)
        {
            std::size_t used = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(value, &used);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Option '" + key + "' expects an integer, got '" + value + "'");
            }

            if (used != value.size() || parsed < min || parsed > max)
                throw std::invalid_argument("Option '" + key + "' out of range: '" + value + "'");
            return parsed;
        }

        double ParseFraction(const std::string &key, const std::string &value)
        {
            std::size_t used = 0;
            double parsed = 0.0;
            try
            {
                parsed = std::stod(value, &used);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Option '" + key + "' expects a number, got '" + value + "'");
            }

            if (used != value.size() || parsed <= 0.0 || parsed > 1.0)
                throw std::invalid_argument("Option '" + key + "' must be in (0, 1]: '" + value + "'");
            return parsed;
        }

        bool ParseBool(const std::string &key, const std::string &value)
        {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(), ::tolower);
            if (v == "1" || v == "true" || v == "yes" || v == "on")
                return true;
            if (v == "0" || v == "false" || v == "no" || v == "off")
                return false;
            throw std::invalid_argument("Option '" + key + "' expects a boolean, got '" + value + "'");
        }

        using Setter = std::function<void(Config &, const std::string &, const std::string &)>;

        const std::map<std::string, Setter> &Setters()
        {
            static const std::map<std::string, Setter> setters = {
                {"network-cidr", [](Config &c, const std::string &, const std::string &v) { c.network_cidr = v; }},
                {"interface", [](Config &c, const std::string &, const std::string &v) { c.interface = v; }},
                {"discovery-timeout-ms", [](Config &c, const std::string &k, const std::string &v) {
                     c.discovery_timeout = std::chrono::milliseconds(ParseInteger(k, v, 100, 600000));
                 }},
                {"discovery-interval-s", [](Config &c, const std::string &k, const std::string &v) {
                     c.discovery_interval = std::chrono::seconds(ParseInteger(k, v, 1, 86400));
                 }},
                {"max-hosts", [](Config &c, const std::string &k, const std::string &v) {
                     c.max_hosts = static_cast<std::size_t>(ParseInteger(k, v, 1, 65536));
                 }},
                {"use-vendor", [](Config &c, const std::string &k, const std::string &v) { c.use_vendor = ParseBool(k, v); }},
                {"use-snmp", [](Config &c, const std::string &k, const std::string &v) { c.use_snmp = ParseBool(k, v); }},
                {"use-reverse-dns", [](Config &c, const std::string &k, const std::string &v) { c.use_reverse_dns = ParseBool(k, v); }},
                {"snmp-community", [](Config &c, const std::string &, const std::string &v) { c.snmp_community = v; }},
                {"snmp-port", [](Config &c, const std::string &k, const std::string &v) {
                     c.snmp_port = static_cast<std::uint16_t>(ParseInteger(k, v, 1, 65535));
                 }},
                {"snmp-timeout-ms", [](Config &c, const std::string &k, const std::string &v) {
                     c.snmp_timeout = std::chrono::milliseconds(ParseInteger(k, v, 10, 60000));
                 }},
                {"dns-timeout-ms", [](Config &c, const std::string &k, const std::string &v) {
                     c.dns_timeout = std::chrono::milliseconds(ParseInteger(k, v, 10, 60000));
                 }},
                {"oui-cache", [](Config &c, const std::string &, const std::string &v) { c.oui_cache_path = v; }},
                {"monitor-interval-ms", [](Config &c, const std::string &k, const std::string &v) {
                     c.monitor_interval = std::chrono::milliseconds(ParseInteger(k, v, 100, 3600000));
                 }},
                {"burst-size", [](Config &c, const std::string &k, const std::string &v) {
                     c.burst_size = static_cast<int>(ParseInteger(k, v, 1, 100));
                 }},
                {"probe-timeout-ms", [](Config &c, const std::string &k, const std::string &v) {
                     c.probe_timeout = std::chrono::milliseconds(ParseInteger(k, v, 10, 60000));
                 }},
                {"loss-ceiling", [](Config &c, const std::string &k, const std::string &v) { c.loss_ceiling = ParseFraction(k, v); }},
                {"workers", [](Config &c, const std::string &k, const std::string &v) {
                     c.worker_count = static_cast<std::size_t>(ParseInteger(k, v, 1, 1024));
                 }},
                {"hub-queue-limit", [](Config &c, const std::string &k, const std::string &v) {
                     c.hub_queue_limit = static_cast<std::size_t>(ParseInteger(k, v, 1, 1000000));
                 }},
                {"stream-port", [](Config &c, const std::string &k, const std::string &v) {
                     c.stream_port = static_cast<std::uint16_t>(ParseInteger(k, v, 0, 65535));
                 }},
                {"cert", [](Config &c, const std::string &, const std::string &v) { c.cert_path = v; }},
                {"key", [](Config &c, const std::string &, const std::string &v) { c.key_path = v; }},
                {"db", [](Config &c, const std::string &, const std::string &v) { c.db_path = v; }},
            };
            return setters;
        }

        std::string EnvName(const std::string &key)
        {
            std::string name = "LANWATCH_";
            for (char c : key)
                name += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return name;
        }
    }

    bool Config::Set(const std::string &key, const std::string &value)
    {
        auto it = Setters().find(key);
        if (it == Setters().end())
            return false;
        it->second(*this, key, value);
        return true;
    }

    std::vector<std::string> Config::Keys()
    {
        std::vector<std::string> keys;
        for (const auto &pair : Setters())
            keys.push_back(pair.first);
        return keys;
    }

    void Config::ApplyEnvironment()
    {
        for (const auto &pair : Setters())
        {
            const char *value = std::getenv(EnvName(pair.first).c_str());
            if (value != nullptr)
                pair.second(*this, pair.first, value);
        }
    }

    std::vector<std::string> Config::ApplyArguments(int argc, char *argv[])
    {
        std::vector<std::string> rest;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0)
            {
                rest.push_back(arg);
                continue;
            }

            auto eq = arg.find('=');
            std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            std::string value = eq == std::string::npos ? "true" : arg.substr(eq + 1);

            if (!Set(key, value))
                rest.push_back(arg);
        }
        return rest;
    }
}
