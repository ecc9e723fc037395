#pragma once

/// Umbrella header for the Ranger MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "app.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "arg_value.hpp"
#include "responder.hpp"
#include "tool_registry.hpp"
#include "ranger_tools.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
