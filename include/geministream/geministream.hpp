/**
 * @file geministream.hpp
 * @brief Main header for geministream
 *
 * Resilient Gemini streaming client: retries with exponential backoff,
 * heartbeats for stalled connections, and fail-over across endpoints.
 */

#ifndef GEMINISTREAM_HPP
#define GEMINISTREAM_HPP

#include "geministream/types.hpp"
#include "geministream/errors.hpp"
#include "geministream/events.hpp"
#include "geministream/cancellation.hpp"
#include "geministream/channel.hpp"
#include "geministream/logging.hpp"
#include "geministream/backend.hpp"
#include "geministream/transport.hpp"
#include "geministream/stream_client.hpp"
#include "geministream/settings.hpp"

namespace geministream {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace geministream

#endif // GEMINISTREAM_HPP
