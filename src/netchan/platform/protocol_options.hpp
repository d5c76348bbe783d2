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
#include <optional>

namespace netchan::platform
{

// Types.

/**
 * Options for a stream (TCP-like) listener and the connections it accepts.  Every member corresponds to one
 * (level, name) socket option pair; apply_socket_option() and socket_option_value() map between the two.
 * An unset (`nullopt`) member means the OS default applies.
 */
struct Stream_options
{
  // Data.

  /// `IPPROTO_TCP`/`TCP_NODELAY`.
  bool m_no_delay = false;
  /// `IPPROTO_TCP`/`TCP_CORK`.
  bool m_no_push = false;
  /// `SOL_SOCKET`/`SO_KEEPALIVE`.
  bool m_enable_keepalive = false;
  /// `IPPROTO_TCP`/`TCP_KEEPCNT`.
  std::optional<int> m_keepalive_count;
  /// `IPPROTO_TCP`/`TCP_KEEPIDLE` (seconds).
  std::optional<int> m_keepalive_idle;
  /// `IPPROTO_TCP`/`TCP_KEEPINTVL` (seconds).
  std::optional<int> m_keepalive_interval;
  /// `IPPROTO_TCP`/`TCP_MAXSEG`.
  std::optional<int> m_max_segment_size;
  /// `IPPROTO_TCP`/`TCP_USER_TIMEOUT` (milliseconds).
  std::optional<int> m_connection_drop_time;
  /// `IPPROTO_TCP`/`TCP_QUICKACK`.
  bool m_disable_ack_stretching = false;
  /// `IPPROTO_TCP`/`TCP_FASTOPEN`.
  bool m_enable_fast_open = false;
  /// `IPPROTO_IPV6`/`IPV6_V6ONLY`.
  std::optional<bool> m_v6_only;

  // Methods.

  /**
   * Stores `value` in the member corresponding to the given socket option.  A boolean option takes any non-zero
   * `value` to mean `true`.
   *
   * @param level
   *        E.g., `IPPROTO_TCP`.
   * @param name
   *        E.g., `TCP_NODELAY`.
   * @param value
   *        New value.
   * @return Success; or channel::error::Code::S_UNSUPPORTED_SOCKET_OPTION if nothing corresponds to (level, name).
   */
  Error_code apply_socket_option(int level, int name, int value);

  /**
   * Loads the value of the member corresponding to the given socket option.  A boolean option yields 0 or 1;
   * an unset option yields 0.
   *
   * @param level
   *        See apply_socket_option().
   * @param name
   *        See apply_socket_option().
   * @param value
   *        Output.  Untouched on error.
   * @return See apply_socket_option().
   */
  Error_code socket_option_value(int level, int name, int* value) const;

  /**
   * Applies the options to the given open socket, via `setsockopt()`; unset members are skipped.  Options that are
   * irrelevant to the socket's family (`IPV6_V6ONLY` on an IPv4 socket) are skipped as well.
   *
   * @param native_handle
   *        Open socket descriptor.
   * @param is_v6
   *        Whether it is an IPv6 socket.
   * @return Success; or the first error from the OS.
   */
  Error_code apply_to_socket(int native_handle, bool is_v6) const;
}; // struct Stream_options

/// Options for a datagram (UDP-like) listener.  Same conventions as Stream_options.
struct Datagram_options
{
  // Data.

  /// `IPPROTO_IPV6`/`IPV6_V6ONLY`.
  std::optional<bool> m_v6_only;
  /// `IPPROTO_UDP`/`UDP_NO_CHECK6_TX`.
  bool m_prefer_no_checksum = false;

  // Methods.

  /**
   * See Stream_options::apply_socket_option().
   *
   * @param level
   *        See Stream_options::apply_socket_option().
   * @param name
   *        See Stream_options::apply_socket_option().
   * @param value
   *        See Stream_options::apply_socket_option().
   * @return See Stream_options::apply_socket_option().
   */
  Error_code apply_socket_option(int level, int name, int value);

  /**
   * See Stream_options::socket_option_value().
   *
   * @param level
   *        See Stream_options::socket_option_value().
   * @param name
   *        See Stream_options::socket_option_value().
   * @param value
   *        See Stream_options::socket_option_value().
   * @return See Stream_options::socket_option_value().
   */
  Error_code socket_option_value(int level, int name, int* value) const;

  /**
   * See Stream_options::apply_to_socket().
   *
   * @param native_handle
   *        See Stream_options::apply_to_socket().
   * @param is_v6
   *        See Stream_options::apply_to_socket().
   * @return See Stream_options::apply_to_socket().
   */
  Error_code apply_to_socket(int native_handle, bool is_v6) const;
}; // struct Datagram_options

// Free functions.

/**
 * Applies a socket option to whichever alternative `options` holds.
 *
 * @param options
 *        Target.
 * @param level
 *        See Stream_options::apply_socket_option().
 * @param name
 *        See Stream_options::apply_socket_option().
 * @param value
 *        See Stream_options::apply_socket_option().
 * @return See Stream_options::apply_socket_option().
 */
Error_code apply_socket_option(Protocol_options* options, int level, int name, int value);

/**
 * Loads a socket option from whichever alternative `options` holds.
 *
 * @param options
 *        Source.
 * @param level
 *        See Stream_options::socket_option_value().
 * @param name
 *        See Stream_options::socket_option_value().
 * @param value
 *        See Stream_options::socket_option_value().
 * @return See Stream_options::socket_option_value().
 */
Error_code socket_option_value(const Protocol_options& options, int level, int name, int* value);

/**
 * Returns `true` if `options` holds Stream_options.
 *
 * @param options
 *        Options.
 * @return See above.
 */
bool is_stream(const Protocol_options& options);

} // namespace netchan::platform
