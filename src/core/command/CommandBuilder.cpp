#include "core/command/CommandBuilder.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace udptunnel {
namespace core {
namespace command {

namespace {

const std::unordered_map<std::string, int> kVerbosityTable = {
    {"fatal", 1},
    {"error", 2},
    {"warn", 3},
    {"info", 4},
    {"debug", 5},
    {"trace", 6}
};

constexpr int kDefaultVerbosity = 4;

void appendPair(std::vector<std::string>& out, const std::string& flag, const std::string& value) {
    out.push_back(flag);
    out.push_back(value);
}

void appendOptional(std::vector<std::string>& out, const std::string& flag, const std::string& value) {
    if (!value.empty()) {
        appendPair(out, flag, value);
    }
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

std::vector<std::string> CommandBuilder::build(const config::InstanceSpec& instance,
                                               const config::GlobalSpec& global) {
    std::vector<std::string> args;
    const bool isServer = instance.role == config::Role::Server;

    if (isServer) {
        args.push_back("-s");
        appendPair(args, "-l", instance.listenIp + ":" + std::to_string(instance.listenPort));
        appendPair(args, "-r", instance.forwardIp + ":" + std::to_string(instance.forwardPort));
    } else {
        args.push_back("-c");
        appendPair(args, "-l", instance.localIp + ":" + std::to_string(instance.localPort));
        appendPair(args, "-r", instance.serverIp + ":" + std::to_string(instance.serverPort));
    }

    appendPair(args, "-k", instance.password);
    appendOptional(args, "--raw-mode", instance.rawMode);
    appendOptional(args, "--cipher-mode", instance.cipherMode);
    appendOptional(args, "--auth-mode", instance.authMode);

    if (instance.autoRule) {
        args.push_back("-a");
        if (global.keepRule) {
            args.push_back("--keep-rule");
        }
    }
    if (global.waitLock) {
        args.push_back("--wait-lock");
    }
    if (global.retryOnError) {
        args.push_back("--retry-on-error");
    }

    // Параметры, которые udp2raw понимает только в режиме клиента
    if (!isServer) {
        appendOptional(args, "--source-ip", instance.sourceIp);
        appendOptional(args, "--source-port", instance.sourcePort);
        if (instance.seqMode) {
            appendPair(args, "--seq-mode", std::to_string(*instance.seqMode));
        }
    }

    appendOptional(args, "--lower-level", instance.lowerLevel);
    appendOptional(args, "--dev", instance.dev);
    if (instance.disableAntiReplay) {
        args.push_back("--disable-anti-replay");
    }
    if (instance.disableBpf) {
        args.push_back("--disable-bpf");
    }

    const std::string& level = instance.logLevel ? *instance.logLevel : global.logLevel;
    appendPair(args, "--log-level", std::to_string(verbosityLevel(level)));

    appendExtraArgs(instance.extraArgs, args);
    return args;
}

std::vector<std::string> CommandBuilder::commandLine(const std::string& binary,
                                                     const std::vector<std::string>& args) {
    std::vector<std::string> cmd;
    cmd.reserve(args.size() + 1);
    cmd.push_back(binary);
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

int CommandBuilder::verbosityLevel(const std::string& level) {
    auto it = kVerbosityTable.find(level);
    return it != kVerbosityTable.end() ? it->second : kDefaultVerbosity;
}

void CommandBuilder::appendExtraArgs(const config::ExtraArgs& extra, std::vector<std::string>& out) {
    std::vector<std::string> fragments;
    if (const auto* line = std::get_if<std::string>(&extra)) {
        fragments.push_back(*line);
    } else {
        fragments = std::get<std::vector<std::string>>(extra);
    }

    for (const auto& fragment : fragments) {
        if (isBlank(fragment)) continue;
        auto tokens = splitShell(fragment);
        out.insert(out.end(), tokens.begin(), tokens.end());
    }
}

std::vector<std::string> CommandBuilder::splitShell(const std::string& fragment) {
    enum class State { Plain, Single, Double };

    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    State state = State::Plain;

    for (size_t i = 0; i < fragment.size(); ++i) {
        const char c = fragment[i];
        switch (state) {
        case State::Plain:
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (inToken) {
                    tokens.push_back(current);
                    current.clear();
                    inToken = false;
                }
            } else if (c == '\'') {
                state = State::Single;
                inToken = true;
            } else if (c == '"') {
                state = State::Double;
                inToken = true;
            } else if (c == '\\') {
                if (i + 1 >= fragment.size()) {
                    throw std::invalid_argument("No escaped character: " + fragment);
                }
                current += fragment[++i];
                inToken = true;
            } else {
                current += c;
                inToken = true;
            }
            break;
        case State::Single:
            if (c == '\'') {
                state = State::Plain;
            } else {
                current += c;
            }
            break;
        case State::Double:
            if (c == '"') {
                state = State::Plain;
            } else if (c == '\\' && i + 1 < fragment.size() &&
                       (fragment[i + 1] == '\\' || fragment[i + 1] == '"' ||
                        fragment[i + 1] == '$' || fragment[i + 1] == '`')) {
                current += fragment[++i];
            } else {
                current += c;
            }
            break;
        }
    }

    if (state != State::Plain) {
        throw std::invalid_argument("No closing quotation: " + fragment);
    }
    if (inToken) {
        tokens.push_back(current);
    }
    return tokens;
}

std::vector<std::string> CommandBuilder::redact(const std::vector<std::string>& args) {
    std::vector<std::string> result = args;
    for (size_t i = 0; i + 1 < result.size(); ++i) {
        if (result[i] == "-k") {
            result[i + 1] = "******";
            ++i;
        }
    }
    return result;
}

std::string CommandBuilder::join(const std::vector<std::string>& args) {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

} // namespace command
} // namespace core
} // namespace udptunnel
