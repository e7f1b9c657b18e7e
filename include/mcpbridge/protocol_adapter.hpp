#pragma once
#include "router.hpp"
#include "session.hpp"
#include "upstream.hpp"
#include "version.hpp"
#include <optional>
#include <string>

namespace mcpbridge {

/// Validates inbound JSON-RPC envelopes and answers them: locally for
/// initialize, ping and the cached */list methods, through the Upstream
/// for tools/call, prompts/get and resources/read.
///
/// handle() never throws; every failure becomes an error envelope.
class ProtocolAdapter {
public:
    struct Options {
        std::string server_name = std::string(BRIDGE_NAME);
        std::string server_version = std::string(BRIDGE_VERSION);
    };

    /// `sessions` may be null when no per-session metadata is kept.
    ProtocolAdapter(Upstream& upstream, SessionManager* sessions, Options opts);
    ProtocolAdapter(Upstream& upstream, SessionManager* sessions);

    /// Returns the response envelope, or nullopt for a notification.
    [[nodiscard]] std::optional<nlohmann::json> handle(const nlohmann::json& envelope,
                                                       const std::string& session_id = {});

    /// The advertisement returned for initialize.
    [[nodiscard]] nlohmann::json advertisement() const;

private:
    void register_handlers();
    HandlerResult forward(const std::string& method, const nlohmann::json& params);

    Upstream& upstream_;
    SessionManager* sessions_;
    Options opts_;
    Router router_;
};

} // namespace mcpbridge
