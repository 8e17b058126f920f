#include "PubSubTypes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace my_pubsub {

namespace {

const std::set<std::string> kKnownOptions = {
    "username", "password", "reconnectPeriod", "connectTimeout", "clientId", "clean",
};

std::string envOr(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

bool parsePort(const std::string& s, int& port) {
    if (s.empty()) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        port = std::stoi(s);
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port <= 65535;
}

void setError(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

const char* ToString(PubSubErrc code) {
    switch (code) {
        case PubSubErrc::Ok:                   return "ok";
        case PubSubErrc::NotInitialized:       return "not_initialized";
        case PubSubErrc::NotReady:             return "not_ready";
        case PubSubErrc::InvalidArgument:      return "invalid_argument";
        case PubSubErrc::TransportSendFailure: return "transport_send_failure";
        case PubSubErrc::RetryExhausted:       return "retry_exhausted";
        case PubSubErrc::ConnectionClosed:     return "connection_closed";
    }
    return "unknown";
}

PubSubError PubSubError::Make(PubSubErrc code, std::string message) {
    PubSubError e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

std::string PubSubError::ToString() const {
    if (message.empty()) return my_pubsub::ToString(code);
    return std::string(my_pubsub::ToString(code)) + ": " + message;
}

std::string BrokerAddress::ToString() const {
    std::ostringstream oss;
    oss << scheme << "://";
    if (host.find(':') != std::string::npos) {
        oss << '[' << host << ']';
    } else {
        oss << host;
    }
    oss << ':' << port;
    return oss.str();
}

bool ParseBrokerAddress(const std::string& url, BrokerAddress& out, std::string* err) {
    BrokerAddress addr;
    std::string rest = url;

    const auto sep = url.find("://");
    if (sep != std::string::npos) {
        addr.scheme = url.substr(0, sep);
        std::transform(addr.scheme.begin(), addr.scheme.end(), addr.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        rest = url.substr(sep + 3);
    } else {
        addr.scheme = "mqtt";
    }

    if (addr.scheme == "mqtt" || addr.scheme == "tcp") {
        addr.tls = false;
        addr.port = 1883;
    } else if (addr.scheme == "mqtts" || addr.scheme == "ssl") {
        addr.tls = true;
        addr.port = 8883;
    } else {
        setError(err, "unsupported broker scheme: " + addr.scheme);
        return false;
    }

    // 去掉路径部分
    const auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);

    // 去掉 user:pass@ 前缀（凭据由 options 提供）
    const auto at = rest.rfind('@');
    if (at != std::string::npos) rest = rest.substr(at + 1);

    if (rest.empty()) {
        setError(err, "broker host is empty: " + url);
        return false;
    }

    std::string port_str;
    if (rest.front() == '[') {
        const auto close = rest.find(']');
        if (close == std::string::npos) {
            setError(err, "malformed IPv6 broker address: " + url);
            return false;
        }
        addr.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                setError(err, "malformed broker address: " + url);
                return false;
            }
            port_str = rest.substr(close + 2);
            if (port_str.empty()) {
                setError(err, "broker port is empty: " + url);
                return false;
            }
        }
    } else {
        const auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            addr.host = rest.substr(0, colon);
            port_str = rest.substr(colon + 1);
            if (port_str.empty()) {
                setError(err, "broker port is empty: " + url);
                return false;
            }
        } else {
            addr.host = rest;
        }
    }

    if (addr.host.empty()) {
        setError(err, "broker host is empty: " + url);
        return false;
    }
    if (!port_str.empty() && !parsePort(port_str, addr.port)) {
        setError(err, "invalid broker port: " + port_str);
        return false;
    }

    out = addr;
    return true;
}

ConnectionConfig ConnectionConfig::FromJson(const nlohmann::json& options) {
    ConnectionConfig cfg;
    const nlohmann::json opts = options.is_object() ? options : nlohmann::json::object();

    auto has = [&opts](const char* key) { return opts.contains(key) && !opts[key].is_null(); };

    cfg.username = has("username") ? opts["username"].get<std::string>() : envOr("MQTT_USERNAME", "");
    cfg.password = has("password") ? opts["password"].get<std::string>() : envOr("MQTT_PASSWORD", "");
    if (has("reconnectPeriod")) cfg.reconnect_period_ms = opts["reconnectPeriod"].get<int>();
    if (has("connectTimeout"))  cfg.connect_timeout_ms  = opts["connectTimeout"].get<int>();
    cfg.client_id = has("clientId") ? opts["clientId"].get<std::string>() : std::string();
    if (cfg.client_id.empty()) cfg.client_id = GenerateClientId();
    if (has("clean")) cfg.clean = opts["clean"].get<bool>();

    for (auto it = opts.begin(); it != opts.end(); ++it) {
        if (kKnownOptions.count(it.key()) == 0) {
            cfg.extra[it.key()] = it.value();
        }
    }
    return cfg;
}

nlohmann::json ConnectionConfig::ToJson() const {
    nlohmann::json j = extra;
    j["username"] = username;
    j["password"] = password.empty() ? "" : "******";
    j["reconnectPeriod"] = reconnect_period_ms;
    j["connectTimeout"] = connect_timeout_ms;
    j["clientId"] = client_id;
    j["clean"] = clean;
    return j;
}

std::string GenerateClientId(const std::string& prefix) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 0xffff);

    std::ostringstream oss;
    oss << prefix << '_' << ms << '_' << std::hex << dist(gen);
    return oss.str();
}

} // namespace my_pubsub
