#ifndef MCPWS_HPP_
#define MCPWS_HPP_

#include "mcpws/config.hpp"
#include "mcpws/connection.hpp"
#include "mcpws/crypto.hpp"
#include "mcpws/discovery.hpp"
#include "mcpws/dispatcher.hpp"
#include "mcpws/errors.hpp"
#include "mcpws/event_loop.hpp"
#include "mcpws/frame_codec.hpp"
#include "mcpws/handshake.hpp"
#include "mcpws/job.hpp"
#include "mcpws/json_rpc.hpp"
#include "mcpws/log.hpp"
#include "mcpws/rate_limiter.hpp"
#include "mcpws/request_queue.hpp"
#include "mcpws/response_cache.hpp"
#include "mcpws/schema_validator.hpp"
#include "mcpws/server.hpp"
#include "mcpws/session.hpp"
#include "mcpws/tool_registry.hpp"
#include "mcpws/vocabulary.hpp"

#endif  // MCPWS_HPP_
