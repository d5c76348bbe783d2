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
#include <boost/asio/ip/address.hpp>
#include <optional>
#include <string>

namespace netchan::platform
{

// Types.

/// Endpoint alternative: a host (numeric address here) and port.  Port 0 requests an ephemeral port.
struct Host_port_endpoint
{
  /// Host; must be a numeric IPv4 or IPv6 address wherever it is turned into a Socket_address.
  std::string m_host;
  /// Port; 0 means any.
  uint16_t m_port;
};

/// Endpoint alternative: a Unix-domain stream socket path.
struct Unix_endpoint
{
  /// Path in the file system.
  fs::path m_path;
};

/**
 * Endpoint alternative: a service to advertise, identified by the usual name/type/domain triple, which is passed
 * opaquely to the platform.  Optionally a network interface (by name) to which listening shall be restricted.
 */
struct Service_endpoint
{
  /// Instance name; may be empty to let the platform pick.
  std::string m_name;
  /// Service type, e.g., `"_http._tcp"`.
  std::string m_type;
  /// Domain; may be empty meaning default.
  std::string m_domain;
  /// Interface name; empty means any.
  std::string m_interface;
};

/**
 * A concrete socket address: an IP address plus port, or a Unix-domain socket path.  Unlike Endpoint it is
 * never symbolic.  This is what a channel reports as its local address.
 */
class Socket_address
{
public:
  // Constructors/destructor.

  /**
   * Constructs an IP address.
   *
   * @param address
   *        Address.
   * @param port
   *        Port.
   */
  explicit Socket_address(const boost::asio::ip::address& address, uint16_t port);

  /**
   * Constructs a Unix-domain address.
   *
   * @param path
   *        Path.
   */
  explicit Socket_address(const fs::path& path);

  // Methods.

  /**
   * Creates the Socket_address corresponding to a host/port or Unix-domain Endpoint.  A host must be a numeric
   * address; a Service_endpoint cannot be converted.
   *
   * @param endpoint
   *        Endpoint.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        channel::error::Code::S_INVALID_ENDPOINT.
   * @return The address; or nullopt on error.
   */
  static std::optional<Socket_address> from_endpoint(const Endpoint& endpoint, Error_code* err_code = 0);

  /**
   * Whether it is an IP address (else Unix-domain).
   * @return See above.
   */
  bool is_ip() const;

  /**
   * The port, if an IP address.
   * @return See above; nullopt if Unix-domain.
   */
  std::optional<uint16_t> port() const;

  /**
   * Replaces the port.  Pre-condition: is_ip().
   *
   * @param port
   *        New port.
   */
  void set_port(uint16_t port);

  /**
   * The IP address.  Pre-condition: is_ip().
   * @return See above.
   */
  const boost::asio::ip::address& ip_address() const;

  /**
   * The path.  Pre-condition: `!is_ip()`.
   * @return See above.
   */
  const fs::path& unix_path() const;

private:
  // Types.

  /// IP address plus port.
  struct Ip
  {
    /// Address.
    boost::asio::ip::address m_address;
    /// Port.
    uint16_t m_port;
  };

  // Data.

  /// The address.
  std::variant<Ip, fs::path> m_value;
}; // class Socket_address

// Free functions.

/**
 * Returns `true` if and only if the two addresses are identical.
 *
 * @relatesalso Socket_address
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Socket_address& val1, const Socket_address& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Socket_address
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Socket_address& val1, const Socket_address& val2);

/**
 * Prints `a.b.c.d:port`, `[v6]:port` or `unix:path`.
 *
 * @relatesalso Socket_address
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Socket_address& val);

/**
 * Prints string representation of the given endpoint.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Endpoint& val);

} // namespace netchan::platform
