/* Flow-NetChan
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "netchan/util/util_fwd.hpp"
#include <memory>
#include <variant>

/**
 * Flow-NetChan module describing the platform listening primitive at its interface boundary -- that is the
 * callback-driven, asynchronous listening-socket facility that a channel::Listener_channel wraps -- together with
 * the value types used to configure and query it (endpoints, socket addresses, protocol options, parameters).
 *
 * The primitive itself is abstract (Platform_listener, Platform_connection); Asio_listener and Asio_connection
 * implement it on top of boost.asio.  Its state machine (setup -> waiting/ready -> failed/cancelled) is assumed
 * here, not re-specified; a channel only reacts to it.
 */
namespace netchan::platform
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Host_port_endpoint;
struct Unix_endpoint;
struct Service_endpoint;
class Socket_address;
struct Stream_options;
struct Datagram_options;
struct Listener_parameters;
class Platform_listener;
class Platform_connection;
class Asio_listener;
class Asio_connection;

/**
 * A bind (or connect) target: either a host/port pair, a Unix-domain socket path, or a discoverable service.
 * The first two request a specific local endpoint; the last requests advertisement under a name.
 */
using Endpoint = std::variant<Host_port_endpoint, Unix_endpoint, Service_endpoint>;

/**
 * The transport-specific options bag: exactly one of stream (TCP-like) or datagram (UDP-like) options.
 * The held alternative is decided at construction and never changes afterwards; only the options inside do.
 */
using Protocol_options = std::variant<Stream_options, Datagram_options>;

/// The state of a Platform_listener, as reported through its state handler.
enum class Listener_state
{
  /// Initial: constructed, not yet started.  Never reported through the state handler.
  S_SETUP,
  /// Started but cannot currently listen (e.g., no usable network); may later become ready.
  S_WAITING,
  /// Listening; the local endpoint and port can be queried.
  S_READY,
  /// Terminally failed with an error.
  S_FAILED,
  /// Terminally cancelled, following a cancel() call.
  S_CANCELLED
}; // enum class Listener_state

/// The state of a Platform_connection, as reported through its state handler.  Same meanings as Listener_state.
enum class Connection_state
{
  /// Initial: accepted, not yet started.  Never reported through the state handler.
  S_SETUP,
  /// Started, not yet usable.
  S_PREPARING,
  /// Usable.
  S_READY,
  /// Terminally failed with an error.
  S_FAILED,
  /// Terminally cancelled, following a cancel() call.
  S_CANCELLED
}; // enum class Connection_state

/// Multipath mode requested of the platform; the platform decides what (if anything) to do with it.
enum class Multipath_service_type
{
  /// No multipath.
  S_DISABLED,
  /// Secondary paths used only when the primary fails.
  S_HANDOVER,
  /// Secondary paths used to minimize latency.
  S_INTERACTIVE,
  /// All paths used to maximize bandwidth.
  S_AGGREGATE
}; // enum class Multipath_service_type

/// Short-hand for ref-counted pointer to a Platform_listener.
using Platform_listener_ptr = std::shared_ptr<Platform_listener>;

/// Short-hand for ref-counted pointer to a Platform_connection.
using Platform_connection_ptr = std::shared_ptr<Platform_connection>;

/**
 * Constructs a Platform_listener from the given parameters; this is the "construct-with-parameters" step of the
 * primitive, and it may fail synchronously (e.g., invalid parameters).  Same `err_code` semantics as usual:
 * null => throw `flow::error::Runtime_error` on error; else set `*err_code` and return null on error.
 * The `Logger*` is the one to use for logging from the listener.
 */
using Listener_factory = Function<Platform_listener_ptr (flow::log::Logger* logger_ptr,
                                                         const Listener_parameters& params,
                                                         Error_code* err_code)>;

/// User hook invoked with parameters right before the platform object is created from them.
using Parameters_configurator = Function<void (Listener_parameters* params)>;

// Free functions.

/**
 * Prints string representation of the given state to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Listener_state val);

/**
 * Prints string representation of the given state to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Connection_state val);

/**
 * Prints string representation of the given mode to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Multipath_service_type val);

/**
 * Returns the default Listener_factory, which creates Asio_listener objects.
 * @return See above.
 */
Listener_factory asio_listener_factory();

} // namespace netchan::platform
