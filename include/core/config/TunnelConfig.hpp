#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace udptunnel {
namespace core {
namespace config {

// Роль экземпляра туннеля
enum class Role {
    Server,
    Client
};

std::string roleName(Role role);

/**
 * @brief Дополнительные аргументы udp2raw
 *
 * Старые конфигурации хранят одну строку, новые хранят список фрагментов.
 * Каждый фрагмент разбирается по правилам shell отдельно.
 */
using ExtraArgs = std::variant<std::string, std::vector<std::string>>;

/**
 * @brief Описание одного экземпляра туннеля (server или client)
 *
 * Неизменяемо в течение одного цикла запуска. Поля endpoint'ов
 * интерпретируются в зависимости от роли.
 */
struct InstanceSpec {
    Role role = Role::Server;
    bool enabled = false;
    std::string alias;

    // server: WAN -> локальный сервис
    std::string listenIp = "0.0.0.0";
    uint16_t listenPort = 29900;
    std::string forwardIp = "127.0.0.1";
    uint16_t forwardPort = 51820;

    // client: локальный порт -> удалённый сервер
    std::string localIp = "127.0.0.1";
    uint16_t localPort = 3333;
    std::string serverIp = "1.2.3.4";
    uint16_t serverPort = 29900;

    std::string password = "password";
    std::string rawMode = "faketcp";
    std::string cipherMode = "xor";
    std::string authMode = "simple";
    bool autoRule = true;
    std::optional<std::string> logLevel; ///< Переопределяет глобальный уровень

    // Расширенные параметры
    std::string lowerLevel;
    std::string dev;
    bool disableAntiReplay = false;
    bool disableBpf = false;

    // Только для client
    std::string sourceIp;
    std::string sourcePort;
    std::optional<int> seqMode;

    ExtraArgs extraArgs = std::vector<std::string>{};

    nlohmann::json toJson() const;
    static InstanceSpec fromJson(Role role, const nlohmann::json& j);
};

// Глобальные параметры, общие для всех экземпляров одного цикла
struct GlobalSpec {
    bool enabled = false;
    std::string logLevel = "info";
    bool waitLock = true;
    bool retryOnError = true;
    bool keepRule = true;

    nlohmann::json toJson() const;
    static GlobalSpec fromJson(const nlohmann::json& j);
};

/**
 * @brief Снимок конфигурации, который потребляет Supervisor
 *
 * Ядро никогда не изменяет и не сохраняет снимок.
 */
struct ConfigSnapshot {
    GlobalSpec global;
    std::vector<InstanceSpec> servers;
    std::vector<InstanceSpec> clients;

    nlohmann::json toJson() const;
    static ConfigSnapshot fromJson(const nlohmann::json& j);
    static ConfigSnapshot fromFile(const std::string& path);

    // SHA-256 компактного JSON-представления, hex
    std::string fingerprint() const;
};

} // namespace config
} // namespace core
} // namespace udptunnel
