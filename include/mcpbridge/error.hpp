#pragma once
#include <stdexcept>
#include <string>

namespace mcpbridge {

class BridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ParseError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

class ProtocolError : public BridgeError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : BridgeError(msg), code(code) {}
};

class TransportError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

class TimeoutError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/// The subprocess exited (or its pipes closed) while the call was in flight.
class ProcessTerminatedError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/// Spawn or initialization handshake failed.
class StartupError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

class ConfigError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

namespace error {
    constexpr int ParseError         = -32700;
    constexpr int InvalidRequest     = -32600;
    constexpr int MethodNotFound     = -32601;
    constexpr int InvalidParams      = -32602;
    constexpr int InternalError      = -32603;
    constexpr int ServerNotRunning   = -32000;
    constexpr int RequestTimeout     = -32001;
    constexpr int ProcessTerminated  = -32002;
} // namespace error

} // namespace mcpbridge
