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
#include "netchan/platform/protocol_options.hpp"
#include "netchan/channel/error.hpp"
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netinet/udp.h>
#include <sys/socket.h>
#include <cassert>
#include <cerrno>

#ifndef UDP_NO_CHECK6_TX
#  define UDP_NO_CHECK6_TX 101 // Linux value; older libc headers lack it.
#endif

namespace netchan::platform
{

namespace
{

/**
 * Internal helper: `setsockopt()` with an `int` value.
 *
 * @param native_handle
 *        Socket.
 * @param level
 *        Level.
 * @param name
 *        Name.
 * @param value
 *        Value.
 * @return Success or `errno`-based error.
 */
Error_code set_int_option(int native_handle, int level, int name, int value)
{
  if (::setsockopt(native_handle, level, name, &value, sizeof(value)) == -1)
  {
    return Error_code(errno, boost::system::system_category());
  }
  return Error_code();
}

} // namespace (anon)

// Stream_options implementations.

Error_code Stream_options::apply_socket_option(int level, int name, int value)
{
  if (level == SOL_SOCKET)
  {
    if (name == SO_KEEPALIVE)
    {
      m_enable_keepalive = value != 0;
      return Error_code();
    }
  }
  else if (level == IPPROTO_IPV6)
  {
    if (name == IPV6_V6ONLY)
    {
      m_v6_only = value != 0;
      return Error_code();
    }
  }
  else if (level == IPPROTO_TCP)
  {
    switch (name)
    {
    case TCP_NODELAY: m_no_delay = value != 0; return Error_code();
    case TCP_CORK: m_no_push = value != 0; return Error_code();
    case TCP_KEEPCNT: m_keepalive_count = value; return Error_code();
    case TCP_KEEPIDLE: m_keepalive_idle = value; return Error_code();
    case TCP_KEEPINTVL: m_keepalive_interval = value; return Error_code();
    case TCP_MAXSEG: m_max_segment_size = value; return Error_code();
    case TCP_USER_TIMEOUT: m_connection_drop_time = value; return Error_code();
    case TCP_QUICKACK: m_disable_ack_stretching = value != 0; return Error_code();
    case TCP_FASTOPEN: m_enable_fast_open = value != 0; return Error_code();
    }
  }

  return channel::error::Code::S_UNSUPPORTED_SOCKET_OPTION;
} // Stream_options::apply_socket_option()

Error_code Stream_options::socket_option_value(int level, int name, int* value) const
{
  assert(value);

  if (level == SOL_SOCKET)
  {
    if (name == SO_KEEPALIVE)
    {
      *value = m_enable_keepalive;
      return Error_code();
    }
  }
  else if (level == IPPROTO_IPV6)
  {
    if (name == IPV6_V6ONLY)
    {
      *value = m_v6_only.value_or(false);
      return Error_code();
    }
  }
  else if (level == IPPROTO_TCP)
  {
    switch (name)
    {
    case TCP_NODELAY: *value = m_no_delay; return Error_code();
    case TCP_CORK: *value = m_no_push; return Error_code();
    case TCP_KEEPCNT: *value = m_keepalive_count.value_or(0); return Error_code();
    case TCP_KEEPIDLE: *value = m_keepalive_idle.value_or(0); return Error_code();
    case TCP_KEEPINTVL: *value = m_keepalive_interval.value_or(0); return Error_code();
    case TCP_MAXSEG: *value = m_max_segment_size.value_or(0); return Error_code();
    case TCP_USER_TIMEOUT: *value = m_connection_drop_time.value_or(0); return Error_code();
    case TCP_QUICKACK: *value = m_disable_ack_stretching; return Error_code();
    case TCP_FASTOPEN: *value = m_enable_fast_open; return Error_code();
    }
  }

  return channel::error::Code::S_UNSUPPORTED_SOCKET_OPTION;
} // Stream_options::socket_option_value()

Error_code Stream_options::apply_to_socket(int native_handle, bool is_v6) const
{
  Error_code err_code;

  // Shorthand: set it if no error so far.
  const auto set = [&](int level, int name, int value)
  {
    if (!err_code)
    {
      err_code = set_int_option(native_handle, level, name, value);
    }
  };

  if (m_no_delay) { set(IPPROTO_TCP, TCP_NODELAY, 1); }
  if (m_no_push) { set(IPPROTO_TCP, TCP_CORK, 1); }
  if (m_enable_keepalive) { set(SOL_SOCKET, SO_KEEPALIVE, 1); }
  if (m_keepalive_count) { set(IPPROTO_TCP, TCP_KEEPCNT, *m_keepalive_count); }
  if (m_keepalive_idle) { set(IPPROTO_TCP, TCP_KEEPIDLE, *m_keepalive_idle); }
  if (m_keepalive_interval) { set(IPPROTO_TCP, TCP_KEEPINTVL, *m_keepalive_interval); }
  if (m_max_segment_size) { set(IPPROTO_TCP, TCP_MAXSEG, *m_max_segment_size); }
  if (m_connection_drop_time) { set(IPPROTO_TCP, TCP_USER_TIMEOUT, *m_connection_drop_time); }
  if (m_disable_ack_stretching) { set(IPPROTO_TCP, TCP_QUICKACK, 1); }
  if (m_enable_fast_open) { set(IPPROTO_TCP, TCP_FASTOPEN, 1); }
  if (m_v6_only && is_v6) { set(IPPROTO_IPV6, IPV6_V6ONLY, *m_v6_only); }

  return err_code;
} // Stream_options::apply_to_socket()

// Datagram_options implementations.

Error_code Datagram_options::apply_socket_option(int level, int name, int value)
{
  if ((level == IPPROTO_IPV6) && (name == IPV6_V6ONLY))
  {
    m_v6_only = value != 0;
    return Error_code();
  }
  if ((level == IPPROTO_UDP) && (name == UDP_NO_CHECK6_TX))
  {
    m_prefer_no_checksum = value != 0;
    return Error_code();
  }
  return channel::error::Code::S_UNSUPPORTED_SOCKET_OPTION;
}

Error_code Datagram_options::socket_option_value(int level, int name, int* value) const
{
  assert(value);

  if ((level == IPPROTO_IPV6) && (name == IPV6_V6ONLY))
  {
    *value = m_v6_only.value_or(false);
    return Error_code();
  }
  if ((level == IPPROTO_UDP) && (name == UDP_NO_CHECK6_TX))
  {
    *value = m_prefer_no_checksum;
    return Error_code();
  }
  return channel::error::Code::S_UNSUPPORTED_SOCKET_OPTION;
}

Error_code Datagram_options::apply_to_socket(int native_handle, bool is_v6) const
{
  Error_code err_code;
  if (m_v6_only && is_v6)
  {
    err_code = set_int_option(native_handle, IPPROTO_IPV6, IPV6_V6ONLY, *m_v6_only);
  }
  if ((!err_code) && m_prefer_no_checksum && is_v6)
  {
    err_code = set_int_option(native_handle, IPPROTO_UDP, UDP_NO_CHECK6_TX, 1);
  }
  return err_code;
}

// Free function implementations.

Error_code apply_socket_option(Protocol_options* options, int level, int name, int value)
{
  return std::visit([&](auto& alt) -> Error_code { return alt.apply_socket_option(level, name, value); },
                    *options);
}

Error_code socket_option_value(const Protocol_options& options, int level, int name, int* value)
{
  return std::visit([&](const auto& alt) -> Error_code { return alt.socket_option_value(level, name, value); },
                    options);
}

bool is_stream(const Protocol_options& options)
{
  return std::holds_alternative<Stream_options>(options);
}

} // namespace netchan::platform
