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
#include "netchan/platform/asio_listener.hpp"
#include "netchan/platform/asio_connection.hpp"
#include "netchan/channel/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <sys/socket.h>
#include <cassert>
#include <cerrno>
#include <type_traits>

namespace netchan::platform
{

namespace
{

/**
 * Internal helper: converts a TCP endpoint.
 *
 * @param endpoint
 *        Endpoint.
 * @return See above.
 */
std::optional<Socket_address> to_socket_address(const boost::asio::ip::tcp::endpoint& endpoint)
{
  return Socket_address(endpoint.address(), endpoint.port());
}

/**
 * Internal helper: converts a Unix-domain endpoint; an unnamed (empty-path) one has no address.
 *
 * @param endpoint
 *        Endpoint.
 * @return See above.
 */
std::optional<Socket_address> to_socket_address(const boost::asio::local::stream_protocol::endpoint& endpoint)
{
  const auto path = endpoint.path();
  if (path.empty())
  {
    return std::nullopt;
  }
  return Socket_address(fs::path(path));
}

/**
 * Internal helper: restricts the socket to the given interface via `SO_BINDTODEVICE`; throws
 * `boost::system::system_error` on failure.  Does nothing if `interface_name` is empty.
 *
 * @param native_handle
 *        Socket.
 * @param interface_name
 *        Interface name.
 */
void bind_to_device(int native_handle, const std::string& interface_name)
{
  if (interface_name.empty())
  {
    return;
  }
  // else
  if (::setsockopt(native_handle, SOL_SOCKET, SO_BINDTODEVICE,
                   interface_name.c_str(), socklen_t(interface_name.size())) == -1)
  {
    throw boost::system::system_error(Error_code(errno, boost::system::system_category()), "SO_BINDTODEVICE");
  }
}

} // namespace (anon)

// Asio_listener implementations.

Asio_listener::Asio_listener(flow::log::Logger* logger_ptr, const Listener_parameters& params,
                             std::optional<Socket_address>&& bind_address) :
  flow::log::Log_context(logger_ptr, Log_component::S_PLATFORM),
  m_params(params),
  m_bind_address(std::move(bind_address)),
  m_queue(0),
  m_state(Listener_state::S_SETUP),
  m_port(0)
{
  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Created with params [" << m_params << "].");
}

Asio_listener::~Asio_listener()
{
  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Destroying.");
  /* If start()ed, everything that referred to us (posted tasks, async handlers) held a shared_ptr to us; so
   * thread C is not touching the sockets right now. */
  close_sockets();
}

std::shared_ptr<Asio_listener> Asio_listener::create(flow::log::Logger* logger_ptr,
                                                     const Listener_parameters& params, Error_code* err_code)
{
  using flow::error::Runtime_error;

  Error_code sys_err_code;
  std::optional<Socket_address> bind_address;

  if (params.m_required_local_endpoint)
  {
    bind_address = Socket_address::from_endpoint(*params.m_required_local_endpoint, &sys_err_code);
    if ((!sys_err_code) && (!is_stream(params.m_protocol_options)) && (!bind_address->is_ip()))
    {
      sys_err_code = channel::error::Code::S_INVALID_ENDPOINT; // No Unix-domain datagram listening.
    }
  }

  if (sys_err_code)
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_PLATFORM);
    FLOW_LOG_WARNING("Asio_listener: Cannot create listener with params [" << params << "]; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    if (err_code)
    {
      *err_code = sys_err_code;
      return std::shared_ptr<Asio_listener>();
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  // Can't make_shared<>(): private ctor.
  return std::shared_ptr<Asio_listener>(new Asio_listener(logger_ptr, params, std::move(bind_address)));
} // Asio_listener::create()

Listener_state Asio_listener::state() const
{
  return m_state;
}

const Listener_parameters& Asio_listener::parameters() const
{
  return m_params;
}

std::optional<uint16_t> Asio_listener::port() const
{
  const uint16_t port = m_port;
  if (port == 0)
  {
    return std::nullopt;
  }
  return port;
}

void Asio_listener::set_service(const Service_endpoint& service)
{
  assert((!m_queue) && "Must set service before start().");
  m_service = service;
}

void Asio_listener::set_state_handler(State_handler&& handler)
{
  assert((!m_queue) && "Must set handlers before start().");
  m_on_state_func = std::move(handler);
}

void Asio_listener::set_new_connection_handler(New_connection_handler&& handler)
{
  assert((!m_queue) && "Must set handlers before start().");
  m_on_new_connection_func = std::move(handler);
}

void Asio_listener::start(util::Task_engine* queue)
{
  assert(queue);
  assert((!m_queue) && "Must start() at most once.");

  FLOW_LOG_INFO("Asio_listener [" << this << "]: Starting; will open/bind/listen in callback queue.");
  if (m_service)
  {
    FLOW_LOG_INFO("Asio_listener [" << this << "]: Service [" << Endpoint(*m_service) << "] is recorded; it will "
                  "not be advertised; listening on the usual address instead.");
  }

  m_queue = queue;
  boost::asio::post(*queue, [this, self = shared_from_this()]()
  {
    // We are in thread C.
    open_and_listen();
  });
}

void Asio_listener::open_and_listen()
{
  using boost::asio::ip::address_v4;
  using boost::asio::ip::tcp;
  using boost::asio::ip::udp;
  using boost::asio::local::stream_protocol;
  using boost::system::system_error;

  // We are in thread C.
  if (m_state != Listener_state::S_SETUP)
  {
    FLOW_LOG_TRACE("Asio_listener [" << this << "]: Cancelled before opening; not opening.");
    return;
  }
  // else

  const auto queue = m_queue.load();
  const auto bind_address = m_bind_address.value_or(Socket_address(address_v4::any(), 0));
  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Opening; will bind to [" << bind_address << "].");

  try
  {
    if (!is_stream(m_params.m_protocol_options))
    {
      const udp::endpoint endpoint(bind_address.ip_address(), *bind_address.port());
      m_udp_socket.reset(new Udp_socket(*queue));
      m_udp_socket->open(endpoint.protocol());
      if (m_params.m_allow_local_endpoint_reuse)
      {
        m_udp_socket->set_option(Udp_socket::reuse_address(true));
        m_udp_socket->set_option(Reuse_port(true));
      }
      bind_to_device(m_udp_socket->native_handle(), m_params.m_required_interface);

      const auto sys_err_code = std::get<Datagram_options>(m_params.m_protocol_options)
                                  .apply_to_socket(m_udp_socket->native_handle(), endpoint.address().is_v6());
      if (sys_err_code)
      {
        throw system_error(sys_err_code, "datagram options");
      }
      m_udp_socket->bind(endpoint);
      m_port = m_udp_socket->local_endpoint().port();
    }
    else if (bind_address.is_ip())
    {
      m_tcp_acceptor.reset(new Tcp_acceptor(*queue));
      open_bind_listen(m_tcp_acceptor.get(), tcp::endpoint(bind_address.ip_address(), *bind_address.port()));
      m_port = m_tcp_acceptor->local_endpoint().port();
    }
    else
    {
      m_local_acceptor.reset(new Local_acceptor(*queue));
      open_bind_listen(m_local_acceptor.get(), stream_protocol::endpoint(bind_address.unix_path().string()));
      m_bound_local_path = bind_address.unix_path();
    }
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Asio_listener [" << this << "]: Unable to open/bind/listen on [" << bind_address << "]; "
                     "could be due to address clash; details logged below.");
    const auto& sys_err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    close_sockets();
    report_state(Listener_state::S_FAILED, sys_err_code);
    return;
  }

  FLOW_LOG_INFO("Asio_listener [" << this << "]: Successfully listening on [" << bind_address << "] "
                "(actual port [" << m_port << "]).  Ready for connections.");
  report_state(Listener_state::S_READY);

  // The handler may have cancel()ed us; then the accept would just be aborted anyway.
  if (m_tcp_acceptor)
  {
    async_accept_next(m_tcp_acceptor.get());
  }
  else if (m_local_acceptor)
  {
    async_accept_next(m_local_acceptor.get());
  }
} // Asio_listener::open_and_listen()

template<typename Acceptor>
void Asio_listener::open_bind_listen(Acceptor* acceptor, const typename Acceptor::endpoint_type& endpoint)
{
  // All of these throw on error.
  acceptor->open(endpoint.protocol());
  if (m_params.m_allow_local_endpoint_reuse)
  {
    acceptor->set_option(typename Acceptor::reuse_address(true));
    if constexpr(std::is_same_v<Acceptor, Tcp_acceptor>)
    {
      acceptor->set_option(Reuse_port(true));
    }
  }

  if constexpr(std::is_same_v<Acceptor, Tcp_acceptor>)
  {
    bind_to_device(acceptor->native_handle(), m_params.m_required_interface);
    const auto sys_err_code = std::get<Stream_options>(m_params.m_protocol_options)
                                .apply_to_socket(acceptor->native_handle(), endpoint.address().is_v6());
    if (sys_err_code)
    {
      throw boost::system::system_error(sys_err_code, "stream options");
    }
  }

  acceptor->bind(endpoint);
  acceptor->listen();
}

template<typename Acceptor>
void Asio_listener::async_accept_next(Acceptor* acceptor)
{
  using Peer_socket = typename Acceptor::protocol_type::socket;

  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Starting the next background accept.");
  acceptor->async_accept([this, self = shared_from_this(), acceptor]
                           (const Error_code& async_err_code, Peer_socket peer_socket)
  {
    // We are in thread C.
    on_next_peer_socket_or_error(acceptor, async_err_code, std::move(peer_socket));
  });
}

template<typename Acceptor>
void Asio_listener::on_next_peer_socket_or_error(Acceptor* acceptor, const Error_code& sys_err_code,
                                                 typename Acceptor::protocol_type::socket&& peer_socket)
{
  using flow::util::ostream_op_string;

  // We are in thread C.
  if ((sys_err_code == boost::asio::error::operation_aborted) || (m_state != Listener_state::S_READY))
  {
    return; // Stuff is shutting down.  GTFO.
  }
  // else
  assert(sys_err_code != boost::asio::error::would_block); // Not possible for async handlers.

  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Incoming connection, or error when trying to accept one.");
  if (sys_err_code)
  {
    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      FLOW_LOG_WARNING("Asio_listener [" << this << "]: Incoming connection aborted halfway during connection; "
                       "this is quite weird but should not be fatal.  Ignoring.  Still listening.");
      // Fall through.
    }
    else
    {
      FLOW_LOG_WARNING("Asio_listener [" << this << "]: The background accept failed fatally.  "
                       "Closing acceptor; no longer listening.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();

      close_sockets();
      report_state(Listener_state::S_FAILED, sys_err_code);
      return;
    }
  } // if (sys_err_code)
  else // if (!sys_err_code)
  {
    Error_code dummy;
    auto local_address = to_socket_address(peer_socket.local_endpoint(dummy));
    auto remote_address = to_socket_address(peer_socket.remote_endpoint(dummy));

    // Eject the socket from boost.asio; Asio_connection owns the descriptor from now on.
    util::Native_handle native_peer_socket(peer_socket.release());
    assert(!peer_socket.is_open());
    FLOW_LOG_TRACE("Asio_listener [" << this << "]: "
                   "Ejected ownership of new incoming peer socket [" << native_peer_socket << "].");

    auto new_connection
      = std::make_shared<Asio_connection>(get_logger(),
                                          ostream_op_string("listener@", this, "=>", native_peer_socket),
                                          std::move(native_peer_socket),
                                          std::move(local_address), std::move(remote_address));
    assert(native_peer_socket.null());

    if (m_on_new_connection_func)
    {
      m_on_new_connection_func(std::move(new_connection));
    }
    else
    {
      FLOW_LOG_WARNING("Asio_listener [" << this << "]: No new-connection handler; dropping connection.");
    }

    if (m_state != Listener_state::S_READY)
    {
      return; // Handler cancel()ed us synchronously (it should not really do that, but it's not a problem).
    }
  } // else if (!sys_err_code)

  async_accept_next(acceptor);
} // Asio_listener::on_next_peer_socket_or_error()

void Asio_listener::cancel()
{
  const auto queue = m_queue.load();
  if (!queue)
  {
    auto expected = Listener_state::S_SETUP;
    if (m_state.compare_exchange_strong(expected, Listener_state::S_CANCELLED))
    {
      FLOW_LOG_INFO("Asio_listener [" << this << "]: Cancelled before start(); no notification will follow.");
    }
    return;
  }
  // else

  FLOW_LOG_TRACE("Asio_listener [" << this << "]: Cancel requested; will close in callback queue.");
  boost::asio::post(*queue, [this, self = shared_from_this()]()
  {
    // We are in thread C.
    const Listener_state state = m_state;
    if ((state == Listener_state::S_FAILED) || (state == Listener_state::S_CANCELLED))
    {
      FLOW_LOG_TRACE("Asio_listener [" << this << "]: Already in terminal state [" << state << "]; "
                     "ignoring cancel.");
      return;
    }
    // else

    FLOW_LOG_INFO("Asio_listener [" << this << "]: Cancelling; no longer listening.");
    close_sockets();
    report_state(Listener_state::S_CANCELLED);
  });
} // Asio_listener::cancel()

void Asio_listener::report_state(Listener_state new_state, const Error_code& err_code)
{
  // We are in thread C.
  m_state = new_state;
  if (m_on_state_func)
  {
    m_on_state_func(new_state, err_code);
  }
}

void Asio_listener::close_sockets()
{
  Error_code dummy;
  if (m_tcp_acceptor)
  {
    m_tcp_acceptor->close(dummy);
  }
  if (m_local_acceptor)
  {
    m_local_acceptor->close(dummy);
  }
  if (m_udp_socket)
  {
    m_udp_socket->close(dummy);
  }

  if (!m_bound_local_path.empty())
  {
    Error_code sys_err_code;
    fs::remove(m_bound_local_path, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Asio_listener [" << this << "]: Could not remove socket file [" << m_bound_local_path << "]; "
                       "a later bind to it may fail.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    else
    {
      FLOW_LOG_TRACE("Asio_listener [" << this << "]: Removed socket file [" << m_bound_local_path << "].");
    }
    m_bound_local_path.clear();
  }
}

} // namespace netchan::platform
