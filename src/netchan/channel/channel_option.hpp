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

#include "netchan/platform/platform_fwd.hpp"
#include <sys/socket.h>

/**
 * The closed set of options supported by channel::Listener_channel::async_set_option() and
 * channel::Listener_channel::async_get_option().  Each option is a distinct type whose `Value` member type is the
 * type of its value; so an option the channel does not know, or a value of the wrong type, does not compile.
 * Likewise an option with no setter (Listener_handle) can only be read.
 */
namespace netchan::channel::option
{

// Types.

/// Whether the channel reads automatically.  It always does: setting `false` is rejected.
struct Auto_read
{
  /// Value type.
  using Value = bool;
};

/**
 * A (level, name) socket option with an `int` value.  `SOL_SOCKET`/`SO_REUSEADDR` and `SOL_SOCKET`/`SO_REUSEPORT`
 * are handled by the channel itself (see reuse_address(), reuse_port()); all others are forwarded to the
 * protocol options (platform::Stream_options or platform::Datagram_options).
 */
struct Socket_option
{
  /// Value type.
  using Value = int;

  /**
   * `SOL_SOCKET`/`SO_REUSEADDR`.
   * @return See above.
   */
  static Socket_option reuse_address()
  {
    return Socket_option{ SOL_SOCKET, SO_REUSEADDR };
  }

  /**
   * `SOL_SOCKET`/`SO_REUSEPORT`.
   * @return See above.
   */
  static Socket_option reuse_port()
  {
    return Socket_option{ SOL_SOCKET, SO_REUSEPORT };
  }

  /// Level, e.g., `IPPROTO_TCP`.
  int m_level;
  /// Name, e.g., `TCP_NODELAY`.
  int m_name;
}; // struct Socket_option

/// Whether the local endpoint may be reused.  Folded with the reuse socket options at activation.
struct Allow_local_endpoint_reuse
{
  /// Value type.
  using Value = bool;
};

/// Whether peer-to-peer interfaces may be used.
struct Enable_peer_to_peer
{
  /// Value type.
  using Value = bool;
};

/// Requested multipath mode.
struct Multipath_service
{
  /// Value type.
  using Value = platform::Multipath_service_type;
};

/// The platform listener wrapped by the channel, if any.  Read-only.
struct Listener_handle
{
  /// Value type.
  using Value = platform::Platform_listener_ptr;
};

} // namespace netchan::channel::option
