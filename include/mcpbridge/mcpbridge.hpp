#pragma once

/// Umbrella header for the mcp-bridge library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "line_reader.hpp"
#include "process_supervisor.hpp"
#include "correlator.hpp"
#include "upstream.hpp"
#include "router.hpp"
#include "session.hpp"
#include "protocol_adapter.hpp"
#include "bridge.hpp"
#include "config.hpp"
#include "transport/http_server.hpp"
