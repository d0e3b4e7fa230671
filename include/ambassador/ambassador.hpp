#pragma once

// Umbrella header - includes all public ambassador headers

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "types.hpp"
#include "backend_types.hpp"
#include "secret_mask.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "frame_reader.hpp"
#include "protocol.hpp"
#include "session_manager.hpp"
#include "catalog_cache.hpp"
#include "dispatcher.hpp"
#include "relay_server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
