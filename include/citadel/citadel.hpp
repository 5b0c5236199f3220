#pragma once

/// Umbrella header for the mcp-citadel gateway library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "method.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "stats.hpp"
#include "session.hpp"
#include "call_table.hpp"
#include "backend.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "gateway.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/process_transport.hpp"
#include "transport/adapter.hpp"
#include "transport/http_adapter.hpp"
#include "transport/unix_socket_adapter.hpp"
