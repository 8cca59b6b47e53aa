#pragma once

/// Umbrella header for the mockmcp library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "coerce.hpp"
#include "log.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
