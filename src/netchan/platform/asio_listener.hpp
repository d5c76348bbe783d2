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

#include "netchan/platform/platform_listener.hpp"
#include <flow/log/log.hpp>
#include <boost/asio.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <memory>

namespace netchan::platform
{

// Types.

/**
 * Platform_listener implemented on top of boost.asio: a TCP or Unix-domain stream acceptor, or (for
 * Datagram_options) a bound UDP socket.  All socket work happens on the callback queue given to start(), which
 * is also where the handlers are invoked; so each handler invocation follows the socket operation it reports
 * without any further hand-off.
 *
 * What it listens on:
 *   - Listener_parameters::m_required_local_endpoint, if set (host/port with numeric host, or Unix path);
 *   - else the IPv4 wildcard address with port 0.  This is also the case when only a service is set (see
 *     set_service()): advertisement is not performed, so the service is merely remembered and logged.
 *
 * A stream acceptor hands each accepted socket over as an Asio_connection, ejected from boost.asio via
 * `release()`.  A datagram listener reports Listener_state::S_READY once bound and never produces connections.
 *
 * Construct via create() (or asio_listener_factory()), which validates the parameters synchronously.
 */
class Asio_listener :
  public Platform_listener,
  public flow::log::Log_context,
  public std::enable_shared_from_this<Asio_listener>
{
public:
  // Constructors/destructor.

  /// Closes any open socket.  No handlers are invoked.
  ~Asio_listener() override;

  // Methods.

  /**
   * Validates `params` and creates a listener in Listener_state::S_SETUP.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param params
   *        Parameters; copied.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        channel::error::Code::S_INVALID_ENDPOINT (symbolic host; Unix path with datagram options).
   * @return The listener; or null on error.
   */
  static std::shared_ptr<Asio_listener> create(flow::log::Logger* logger_ptr, const Listener_parameters& params,
                                               Error_code* err_code = 0);

  /**
   * Implements Platform_listener API.
   * @return See above.
   */
  Listener_state state() const override;

  /**
   * Implements Platform_listener API.
   * @return See above.
   */
  const Listener_parameters& parameters() const override;

  /**
   * Implements Platform_listener API.
   * @return See above.
   */
  std::optional<uint16_t> port() const override;

  /**
   * Implements Platform_listener API.
   * @param service
   *        See above.
   */
  void set_service(const Service_endpoint& service) override;

  /**
   * Implements Platform_listener API.
   * @param handler
   *        See above.
   */
  void set_state_handler(State_handler&& handler) override;

  /**
   * Implements Platform_listener API.
   * @param handler
   *        See above.
   */
  void set_new_connection_handler(New_connection_handler&& handler) override;

  /**
   * Implements Platform_listener API.
   * @param queue
   *        See above.
   */
  void start(util::Task_engine* queue) override;

  /// Implements Platform_listener API.
  void cancel() override;

private:
  // Types.

  /// Short-hand for TCP acceptor.
  using Tcp_acceptor = boost::asio::ip::tcp::acceptor;

  /// Short-hand for Unix-domain stream acceptor.
  using Local_acceptor = boost::asio::local::stream_protocol::acceptor;

  /// Short-hand for UDP socket.
  using Udp_socket = boost::asio::ip::udp::socket;

  /// `SO_REUSEPORT` as a boost.asio socket option.
  using Reuse_port = boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param params
   *        See create().
   * @param bind_address
   *        Validated address to bind; nullopt means the IPv4 wildcard with port 0.
   */
  explicit Asio_listener(flow::log::Logger* logger_ptr, const Listener_parameters& params,
                         std::optional<Socket_address>&& bind_address);

  // Methods.

  /**
   * Thread C: opens, configures, binds and (for streams) listens; then reports `S_READY` or `S_FAILED`; then
   * begins accepting.
   */
  void open_and_listen();

  /**
   * Thread C: binds the stream acceptor; throws `boost::system::system_error` on error.
   *
   * @tparam Acceptor
   *         Tcp_acceptor or Local_acceptor.
   * @param acceptor
   *         Acceptor.
   * @param endpoint
   *         Endpoint to bind.
   */
  template<typename Acceptor>
  void open_bind_listen(Acceptor* acceptor, const typename Acceptor::endpoint_type& endpoint);

  /**
   * Thread C: begins the next background accept on the given acceptor.
   *
   * @tparam Acceptor
   *         Tcp_acceptor or Local_acceptor.
   * @param acceptor
   *         Acceptor.
   */
  template<typename Acceptor>
  void async_accept_next(Acceptor* acceptor);

  /**
   * Thread C: handles the result of the background accept: an accepted socket, or an error.  On success, or on a
   * non-fatal error, begins the next accept.
   *
   * @tparam Acceptor
   *         Tcp_acceptor or Local_acceptor.
   * @param acceptor
   *         Acceptor.
   * @param sys_err_code
   *         Result.
   * @param peer_socket
   *         Accepted socket, if success.
   */
  template<typename Acceptor>
  void on_next_peer_socket_or_error(Acceptor* acceptor, const Error_code& sys_err_code,
                                    typename Acceptor::protocol_type::socket&& peer_socket);

  /**
   * Thread C: sets #m_state; then invokes #m_on_state_func.
   *
   * @param new_state
   *        New state.
   * @param err_code
   *        Error if `S_FAILED`; else success.
   */
  void report_state(Listener_state new_state, const Error_code& err_code = Error_code());

  /// Thread C: closes whichever socket is open, errors ignored; removes the Unix-domain socket file we bound, if any.
  void close_sockets();

  // Data.

  /// See parameters().
  const Listener_parameters m_params;

  /// Address to bind; see ctor.
  const std::optional<Socket_address> m_bind_address;

  /// See set_service().  Not touched after start().
  std::optional<Service_endpoint> m_service;

  /// See set_state_handler().  Not touched after start().
  State_handler m_on_state_func;

  /// See set_new_connection_handler().  Not touched after start().
  New_connection_handler m_on_new_connection_func;

  /// See start().  Null until then.
  std::atomic<util::Task_engine*> m_queue;

  /// See state().
  std::atomic<Listener_state> m_state;

  /// See port().  0 means not (yet) known.
  std::atomic<uint16_t> m_port;

  /// TCP acceptor, if listening via TCP.  Thread C only.
  boost::movelib::unique_ptr<Tcp_acceptor> m_tcp_acceptor;

  /// Unix-domain acceptor, if listening via Unix-domain socket.  Thread C only.
  boost::movelib::unique_ptr<Local_acceptor> m_local_acceptor;

  /// UDP socket, if datagram.  Thread C only.
  boost::movelib::unique_ptr<Udp_socket> m_udp_socket;

  /**
   * Socket file created by a successful Unix-domain bind; empty if none (or already removed).  Only a file we
   * created ourselves is removed: a failed bind may have failed precisely because another listener owns the path.
   * Thread C only.
   */
  fs::path m_bound_local_path;
}; // class Asio_listener

} // namespace netchan::platform
