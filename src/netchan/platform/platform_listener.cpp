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
#include "netchan/platform/platform_listener.hpp"
#include "netchan/platform/platform_connection.hpp"
#include "netchan/platform/asio_listener.hpp"
#include <cassert>

namespace netchan::platform
{

// Implementations.

Platform_listener::~Platform_listener() = default;

Platform_connection::~Platform_connection() = default;

Listener_factory asio_listener_factory()
{
  return [](flow::log::Logger* logger_ptr, const Listener_parameters& params, Error_code* err_code)
           -> Platform_listener_ptr
  {
    return Asio_listener::create(logger_ptr, params, err_code);
  };
}

std::ostream& operator<<(std::ostream& os, Listener_state val)
{
  switch (val)
  {
  case Listener_state::S_SETUP: return os << "setup";
  case Listener_state::S_WAITING: return os << "waiting";
  case Listener_state::S_READY: return os << "ready";
  case Listener_state::S_FAILED: return os << "failed";
  case Listener_state::S_CANCELLED: return os << "cancelled";
  }
  assert(false && "Compiler should catch this.");
  return os;
}

std::ostream& operator<<(std::ostream& os, Connection_state val)
{
  switch (val)
  {
  case Connection_state::S_SETUP: return os << "setup";
  case Connection_state::S_PREPARING: return os << "preparing";
  case Connection_state::S_READY: return os << "ready";
  case Connection_state::S_FAILED: return os << "failed";
  case Connection_state::S_CANCELLED: return os << "cancelled";
  }
  assert(false && "Compiler should catch this.");
  return os;
}

std::ostream& operator<<(std::ostream& os, Multipath_service_type val)
{
  switch (val)
  {
  case Multipath_service_type::S_DISABLED: return os << "disabled";
  case Multipath_service_type::S_HANDOVER: return os << "handover";
  case Multipath_service_type::S_INTERACTIVE: return os << "interactive";
  case Multipath_service_type::S_AGGREGATE: return os << "aggregate";
  }
  assert(false && "Compiler should catch this.");
  return os;
}

std::ostream& operator<<(std::ostream& os, const Listener_parameters& val)
{
  os << (is_stream(val.m_protocol_options) ? "stream" : "datagram") << " local_endpoint[";
  if (val.m_required_local_endpoint)
  {
    os << *val.m_required_local_endpoint;
  }
  os << "] interface[" << val.m_required_interface << "] reuse[" << val.m_allow_local_endpoint_reuse
     << "] p2p[" << val.m_include_peer_to_peer << "] multipath[" << val.m_multipath_service_type << ']';
  return os;
}

} // namespace netchan::platform
