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

#include "netchan/platform/endpoint.hpp"
#include "netchan/platform/protocol_options.hpp"
#include <optional>
#include <string>

namespace netchan::platform
{

// Types.

/**
 * The full set of construction parameters for a Platform_listener.  A channel::Listener_channel fills these in
 * from its own options and the bind target right before constructing the listener; registered
 * #Parameters_configurator hooks then get a last chance to modify them.
 */
struct Listener_parameters
{
  /// Transport-specific options; the held alternative decides stream vs. datagram.
  Protocol_options m_protocol_options;

  /// Local endpoint (host/port or Unix path) to listen on; nullopt means let the platform choose.
  std::optional<Endpoint> m_required_local_endpoint;

  /// Name of the interface to which listening is restricted; empty means any.
  std::string m_required_interface;

  /// Whether the local endpoint may be reused (`SO_REUSEADDR` and `SO_REUSEPORT`).
  bool m_allow_local_endpoint_reuse = false;

  /// Whether peer-to-peer interfaces may be used.
  bool m_include_peer_to_peer = false;

  /// Requested multipath mode.
  Multipath_service_type m_multipath_service_type = Multipath_service_type::S_DISABLED;
}; // struct Listener_parameters

/**
 * Prints string representation of the given parameters to the given `ostream`.
 *
 * @relatesalso Listener_parameters
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Listener_parameters& val);

} // namespace netchan::platform
