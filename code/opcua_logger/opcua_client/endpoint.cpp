#include "endpoint.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace opcualogger {

namespace {

bool isDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

// 只接受不超过 max_value 的十进制数字串
std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t max_value) {
    if (!isDigits(text) || text.size() > 20) {
        return std::nullopt;
    }
    try {
        auto value = std::stoull(text);
        if (value > max_value) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

const char* kOpcTcpScheme = "opc.tcp://";

} // anonymous namespace

DataPointId::DataPointId(uint16_t ns, uint32_t numeric)
    : namespace_index(ns)
    , type(IdentifierType::Numeric)
    , identifier(std::to_string(numeric)) {
}

DataPointId::DataPointId(uint16_t ns, std::string name)
    : namespace_index(ns)
    , type(IdentifierType::String)
    , identifier(std::move(name)) {
}

std::optional<DataPointId> DataPointId::parse(const std::string& text) {
    std::string rest = text;
    uint16_t ns = 0;

    if (rest.rfind("ns=", 0) == 0) {
        auto semicolon = rest.find(';');
        if (semicolon == std::string::npos) {
            return std::nullopt;
        }
        auto ns_value = parseUnsigned(rest.substr(3, semicolon - 3),
                                      std::numeric_limits<uint16_t>::max());
        if (!ns_value) {
            return std::nullopt;
        }
        ns = static_cast<uint16_t>(*ns_value);
        rest = rest.substr(semicolon + 1);
    }

    if (rest.rfind("i=", 0) == 0) {
        auto numeric = parseUnsigned(rest.substr(2), std::numeric_limits<uint32_t>::max());
        if (!numeric) {
            return std::nullopt;
        }
        return DataPointId(ns, static_cast<uint32_t>(*numeric));
    }

    if (rest.rfind("s=", 0) == 0 && rest.size() > 2) {
        return DataPointId(ns, rest.substr(2));
    }

    return std::nullopt;
}

DataPointId DataPointId::objectsFolder() {
    return DataPointId(0, static_cast<uint32_t>(85));
}

uint32_t DataPointId::numericValue() const {
    if (type != IdentifierType::Numeric) {
        return 0;
    }
    auto value = parseUnsigned(identifier, std::numeric_limits<uint32_t>::max());
    return value ? static_cast<uint32_t>(*value) : 0;
}

std::string DataPointId::toString() const {
    if (type == IdentifierType::Opaque) {
        return identifier;
    }

    std::string text;
    if (namespace_index != 0) {
        text = "ns=" + std::to_string(namespace_index) + ";";
    }
    text += (type == IdentifierType::Numeric) ? "i=" : "s=";
    text += identifier;
    return text;
}

bool DataPointId::operator==(const DataPointId& other) const {
    return namespace_index == other.namespace_index
        && type == other.type
        && identifier == other.identifier;
}

Endpoint Endpoint::parse(const std::string& url,
                         const std::string& security_mode,
                         const std::string& username,
                         const std::string& password) {
    const std::string scheme = kOpcTcpScheme;
    if (url.rfind(scheme, 0) != 0) {
        throw ConnectError(ErrorSeverity::Fatal,
                           "Malformed endpoint '" + url + "': expected " + scheme + "<host>:<port>");
    }

    Endpoint endpoint;
    endpoint.url = url;

    std::string authority = url.substr(scheme.size());
    auto slash = authority.find('/');
    if (slash != std::string::npos) {
        authority = authority.substr(0, slash);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6 字面量: [::1]:4840
        auto bracket = authority.find(']');
        if (bracket == std::string::npos) {
            throw ConnectError(ErrorSeverity::Fatal, "Malformed endpoint '" + url + "': unterminated IPv6 host");
        }
        endpoint.host = authority.substr(1, bracket - 1);
        std::string tail = authority.substr(bracket + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                throw ConnectError(ErrorSeverity::Fatal, "Malformed endpoint '" + url + "'");
            }
            port_text = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (endpoint.host.empty()) {
        throw ConnectError(ErrorSeverity::Fatal, "Malformed endpoint '" + url + "': missing host");
    }

    if (!port_text.empty()) {
        auto port = parseUnsigned(port_text, std::numeric_limits<uint16_t>::max());
        if (!port || *port == 0) {
            throw ConnectError(ErrorSeverity::Fatal, "Malformed endpoint '" + url + "': invalid port '" + port_text + "'");
        }
        endpoint.port = static_cast<uint16_t>(*port);
    }

    if (security_mode != "None" && security_mode != "Sign" && security_mode != "SignAndEncrypt") {
        throw ConnectError(ErrorSeverity::Fatal, "Unknown security mode '" + security_mode + "'");
    }
    endpoint.security_mode = security_mode;
    endpoint.username = username;
    endpoint.password = password;

    return endpoint;
}

} // namespace opcualogger
