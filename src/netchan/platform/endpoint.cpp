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
#include "netchan/platform/endpoint.hpp"
#include "netchan/channel/error.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace netchan::platform
{

// Socket_address implementations.

Socket_address::Socket_address(const boost::asio::ip::address& address, uint16_t port) :
  m_value(Ip{ address, port })
{
  // Nope.
}

Socket_address::Socket_address(const fs::path& path) :
  m_value(path)
{
  // Nope.
}

std::optional<Socket_address> Socket_address::from_endpoint(const Endpoint& endpoint, Error_code* err_code)
{
  using flow::error::Runtime_error;
  using boost::asio::ip::make_address;
  using std::get_if;

  Error_code sys_err_code;
  std::optional<Socket_address> result;

  if (const auto host_port = get_if<Host_port_endpoint>(&endpoint))
  {
    const auto address = make_address(host_port->m_host, sys_err_code);
    if (!sys_err_code)
    {
      result.emplace(address, host_port->m_port);
    }
    else
    {
      sys_err_code = channel::error::Code::S_INVALID_ENDPOINT;
    }
  }
  else if (const auto unix_endpoint = get_if<Unix_endpoint>(&endpoint))
  {
    result.emplace(unix_endpoint->m_path);
  }
  else
  {
    sys_err_code = channel::error::Code::S_INVALID_ENDPOINT; // A service has no address by itself.
  }

  if (sys_err_code)
  {
    if (err_code)
    {
      *err_code = sys_err_code;
      return std::nullopt;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return result;
} // Socket_address::from_endpoint()

bool Socket_address::is_ip() const
{
  return std::holds_alternative<Ip>(m_value);
}

std::optional<uint16_t> Socket_address::port() const
{
  if (const auto ip = std::get_if<Ip>(&m_value))
  {
    return ip->m_port;
  }
  return std::nullopt;
}

void Socket_address::set_port(uint16_t port)
{
  assert(is_ip());
  std::get<Ip>(m_value).m_port = port;
}

const boost::asio::ip::address& Socket_address::ip_address() const
{
  assert(is_ip());
  return std::get<Ip>(m_value).m_address;
}

const fs::path& Socket_address::unix_path() const
{
  assert(!is_ip());
  return std::get<fs::path>(m_value);
}

bool operator==(const Socket_address& val1, const Socket_address& val2)
{
  if (val1.is_ip() != val2.is_ip())
  {
    return false;
  }
  // else
  return val1.is_ip() ? ((val1.ip_address() == val2.ip_address()) && (val1.port() == val2.port()))
                      : (val1.unix_path() == val2.unix_path());
}

bool operator!=(const Socket_address& val1, const Socket_address& val2)
{
  return !operator==(val1, val2);
}

std::ostream& operator<<(std::ostream& os, const Socket_address& val)
{
  if (!val.is_ip())
  {
    return os << "unix:" << val.unix_path().string();
  }
  // else
  const auto& address = val.ip_address();
  if (address.is_v6())
  {
    return os << '[' << address << "]:" << *val.port();
  }
  return os << address << ':' << *val.port();
}

std::ostream& operator<<(std::ostream& os, const Endpoint& val)
{
  using std::get_if;

  if (const auto host_port = get_if<Host_port_endpoint>(&val))
  {
    return os << "host_port[" << host_port->m_host << ':' << host_port->m_port << ']';
  }
  if (const auto unix_endpoint = get_if<Unix_endpoint>(&val))
  {
    return os << "unix[" << unix_endpoint->m_path.string() << ']';
  }
  const auto& service = std::get<Service_endpoint>(val);
  os << "service[" << service.m_name << '|' << service.m_type << '|' << service.m_domain;
  if (!service.m_interface.empty())
  {
    os << "|if=" << service.m_interface;
  }
  return os << ']';
}

} // namespace netchan::platform
