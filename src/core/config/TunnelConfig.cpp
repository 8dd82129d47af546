#include "core/config/TunnelConfig.hpp"
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>

namespace udptunnel {
namespace core {
namespace config {

namespace {

// Порт может прийти как число или как строка из веб-формы
uint16_t readPort(const nlohmann::json& j, const char* key, uint16_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;

    long value = 0;
    if (it->is_number_integer()) {
        value = it->get<long>();
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) return fallback;
        try {
            size_t pos = 0;
            value = std::stol(text, &pos);
            if (pos != text.size()) {
                throw std::invalid_argument(text);
            }
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid port for '") + key + "': " + text);
        }
    } else {
        throw std::invalid_argument(std::string("Invalid port type for '") + key + "'");
    }

    if (value <= 0 || value > 65535) {
        throw std::invalid_argument(std::string("Port out of range for '") + key + "'");
    }
    return static_cast<uint16_t>(value);
}

std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    throw std::invalid_argument(std::string("Expected string for '") + key + "'");
}

bool readBool(const nlohmann::json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    throw std::invalid_argument(std::string("Expected boolean for '") + key + "'");
}

std::optional<int> readOptionalInt(const nlohmann::json& j, const char* key, long minValue, long maxValue) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;

    long value = 0;
    if (it->is_number_unsigned()) {
        const auto raw = it->get<uint64_t>();
        if (raw > static_cast<uint64_t>(maxValue)) {
            throw std::invalid_argument(std::string("Value out of range for '") + key + "': " + std::to_string(raw));
        }
        value = static_cast<long>(raw);
    } else if (it->is_number_integer()) {
        value = it->get<long>();
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            value = std::stol(text, &pos);
            if (pos != text.size()) {
                throw std::invalid_argument(text);
            }
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid integer for '") + key + "': " + text);
        }
    } else {
        throw std::invalid_argument(std::string("Expected integer for '") + key + "'");
    }

    if (value < minValue || value > maxValue) {
        throw std::invalid_argument(std::string("Value out of range for '") + key + "': " + std::to_string(value));
    }
    return static_cast<int>(value);
}

ExtraArgs readExtraArgs(const nlohmann::json& j) {
    auto it = j.find("extra_args");
    if (it == j.end() || it->is_null()) return std::vector<std::string>{};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_array()) {
        std::vector<std::string> fragments;
        for (const auto& item : *it) {
            if (!item.is_string()) {
                throw std::invalid_argument("extra_args entries must be strings");
            }
            fragments.push_back(item.get<std::string>());
        }
        return fragments;
    }
    throw std::invalid_argument("extra_args must be a string or a list of strings");
}

} // namespace

std::string roleName(Role role) {
    return role == Role::Server ? "server" : "client";
}

nlohmann::json InstanceSpec::toJson() const {
    nlohmann::json j = {
        {"enabled", enabled},
        {"alias", alias},
        {"password", password},
        {"raw_mode", rawMode},
        {"cipher_mode", cipherMode},
        {"auth_mode", authMode},
        {"auto_iptables", autoRule},
        {"lower_level", lowerLevel},
        {"dev", dev},
        {"disable_anti_replay", disableAntiReplay},
        {"disable_bpf", disableBpf}
    };

    if (role == Role::Server) {
        j["listen_ip"] = listenIp;
        j["listen_port"] = listenPort;
        j["forward_ip"] = forwardIp;
        j["forward_port"] = forwardPort;
    } else {
        j["local_ip"] = localIp;
        j["local_port"] = localPort;
        j["server_ip"] = serverIp;
        j["server_port"] = serverPort;
        j["source_ip"] = sourceIp;
        j["source_port"] = sourcePort;
        if (seqMode) j["seq_mode"] = *seqMode;
    }

    if (logLevel) j["log_level"] = *logLevel;

    if (const auto* line = std::get_if<std::string>(&extraArgs)) {
        j["extra_args"] = *line;
    } else {
        j["extra_args"] = std::get<std::vector<std::string>>(extraArgs);
    }
    return j;
}

InstanceSpec InstanceSpec::fromJson(Role role, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Instance entry must be an object");
    }

    InstanceSpec spec;
    spec.role = role;
    spec.enabled = readBool(j, "enabled", false);
    spec.alias = readString(j, "alias", role == Role::Server ? "New Server" : "New Client");

    if (role == Role::Server) {
        spec.listenIp = readString(j, "listen_ip", spec.listenIp);
        spec.listenPort = readPort(j, "listen_port", spec.listenPort);
        spec.forwardIp = readString(j, "forward_ip", spec.forwardIp);
        spec.forwardPort = readPort(j, "forward_port", spec.forwardPort);
    } else {
        spec.localIp = readString(j, "local_ip", spec.localIp);
        spec.localPort = readPort(j, "local_port", spec.localPort);
        spec.serverIp = readString(j, "server_ip", spec.serverIp);
        spec.serverPort = readPort(j, "server_port", spec.serverPort);
        spec.sourceIp = readString(j, "source_ip", "");
        spec.sourcePort = readString(j, "source_port", "");
        // udp2raw --seq-mode принимает 0..4
        spec.seqMode = readOptionalInt(j, "seq_mode", 0, 4);
    }

    spec.password = readString(j, "password", spec.password);
    spec.rawMode = readString(j, "raw_mode", spec.rawMode);
    spec.cipherMode = readString(j, "cipher_mode", spec.cipherMode);
    spec.authMode = readString(j, "auth_mode", spec.authMode);
    // auto_rule: ключ самой первой версии файла
    spec.autoRule = readBool(j, "auto_iptables", readBool(j, "auto_rule", true));

    auto level = j.find("log_level");
    if (level != j.end() && level->is_string() && !level->get_ref<const std::string&>().empty()) {
        spec.logLevel = level->get<std::string>();
    }

    spec.lowerLevel = readString(j, "lower_level", "");
    spec.dev = readString(j, "dev", "");
    spec.disableAntiReplay = readBool(j, "disable_anti_replay", false);
    spec.disableBpf = readBool(j, "disable_bpf", false);
    spec.extraArgs = readExtraArgs(j);
    return spec;
}

nlohmann::json GlobalSpec::toJson() const {
    return {
        {"enabled", enabled},
        {"log_level", logLevel},
        {"wait_lock", waitLock},
        {"retry_on_error", retryOnError},
        {"keep_iptables", keepRule}
    };
}

GlobalSpec GlobalSpec::fromJson(const nlohmann::json& j) {
    GlobalSpec spec;
    if (j.is_null()) return spec;
    if (!j.is_object()) {
        throw std::invalid_argument("'global' must be an object");
    }
    spec.enabled = readBool(j, "enabled", false);
    spec.logLevel = readString(j, "log_level", spec.logLevel);
    spec.waitLock = readBool(j, "wait_lock", spec.waitLock);
    spec.retryOnError = readBool(j, "retry_on_error", spec.retryOnError);
    spec.keepRule = readBool(j, "keep_iptables", spec.keepRule);
    return spec;
}

nlohmann::json ConfigSnapshot::toJson() const {
    nlohmann::json j;
    j["global"] = global.toJson();
    j["servers"] = nlohmann::json::array();
    for (const auto& server : servers) {
        j["servers"].push_back(server.toJson());
    }
    j["clients"] = nlohmann::json::array();
    for (const auto& client : clients) {
        j["clients"].push_back(client.toJson());
    }
    return j;
}

ConfigSnapshot ConfigSnapshot::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration root must be an object");
    }

    ConfigSnapshot snapshot;
    snapshot.global = GlobalSpec::fromJson(j.value("global", nlohmann::json()));

    auto readList = [&j](const char* key, Role role, std::vector<InstanceSpec>& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        if (!it->is_array()) {
            throw std::invalid_argument(std::string("'") + key + "' must be a list");
        }
        for (const auto& entry : *it) {
            out.push_back(InstanceSpec::fromJson(role, entry));
        }
    };
    readList("servers", Role::Server, snapshot.servers);
    readList("clients", Role::Client, snapshot.clients);
    return snapshot;
}

ConfigSnapshot ConfigSnapshot::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed configuration file " + path + ": " + e.what());
    }
    return fromJson(j);
}

std::string ConfigSnapshot::fingerprint() const {
    const std::string data = toJson().dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash, &sha256);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace config
} // namespace core
} // namespace udptunnel
