#pragma once
// RPC Protocol: JSON-RPC 2.0 helpers and error codes
//
// Provides utilities for building JSON-RPC requests and responses
// compliant with JSON-RPC 2.0, plus the mapping
// from engine errors to structured error objects.

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace podium::rpc {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Engine-specific errors
    constexpr int ENGINE_ERROR = -32001;      // validation, admission, season, cooldown
    constexpr int ACCESS_DENIED = -32002;     // unauthorized or paused
    constexpr int STORE_ERROR = -32003;       // state could not be persisted
}

// Thrown by parameter helpers; reported as INVALID_PARAMS
class ParamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by method handlers; reported with the engine error name
class EngineError : public std::runtime_error {
public:
    explicit EngineError(Error e)
        : std::runtime_error(error_name(e)), code_(e) {}

    Error code() const { return code_; }

private:
    Error code_;
};

inline int rpc_code_for(Error e) {
    return (e == Error::Unauthorized || e == Error::Paused) ? error::ACCESS_DENIED
                                                            : error::ENGINE_ERROR;
}

// Build a JSON-RPC 2.0 success response
inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

// Build a JSON-RPC 2.0 error response
inline json make_error(const json& id, int code, const std::string& message,
                       const json& data = json()) {
    json err = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        err["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", err}
    };
}

// Engine error as a JSON-RPC error with a stable machine-readable name
inline json make_engine_error(const json& id, Error e) {
    return make_error(id, rpc_code_for(e), error_name(e), {{"error", error_name(e)}});
}

// Validate JSON-RPC 2.0 request
inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be an object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    return true;
}

// Extract request components
struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

} // namespace podium::rpc
