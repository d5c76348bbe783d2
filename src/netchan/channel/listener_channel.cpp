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
#include "netchan/channel/listener_channel.hpp"
#include "netchan/channel/child_channel.hpp"
#include "netchan/platform/protocol_options.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <cassert>
#include <cstdlib>

namespace netchan::channel
{

namespace
{

/**
 * Internal helper: `config` with an empty #Listener_channel::Config::m_listener_factory replaced by the default.
 *
 * @param config
 *        Config.
 * @return See above.
 */
Listener_channel::Config with_default_factory(Listener_channel::Config config)
{
  if (!config.m_listener_factory)
  {
    config.m_listener_factory = platform::asio_listener_factory();
  }
  return config;
}

} // namespace (anon)

Listener_channel::Listener_channel(flow::log::Logger* logger_ptr, util::Event_loop* loop, const Config& config,
                                   platform::Platform_listener_ptr&& listener) :
  State_managed_channel(logger_ptr, "listener", config.m_nickname, loop),
  m_config(with_default_factory(config)),
  m_protocol_options(config.m_protocol_options),
  m_listener(std::move(listener)),
  m_reuse_address(false),
  m_reuse_port(false),
  m_allow_local_endpoint_reuse(false),
  m_enable_peer_to_peer(false),
  m_multipath_service_type(platform::Multipath_service_type::S_DISABLED)
{
  FLOW_LOG_INFO("Listener [" << *this << "]: Created on [" << *loop << "]; "
                "pre-configured listener [" << m_listener.get() << "]; "
                "children on [" << (m_config.m_child_loop_group ? "loop group" : "own loop") << "].");
}

Listener_channel::~Listener_channel()
{
  if (m_listener)
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Shutting down; cancelling platform listener just in case.");
    m_listener->cancel();
  }
}

Listener_channel_ptr Listener_channel::create(flow::log::Logger* logger_ptr, util::Event_loop* loop,
                                              const Config& config)
{
  return create(logger_ptr, loop, config, platform::Platform_listener_ptr());
}

Listener_channel_ptr Listener_channel::create(flow::log::Logger* logger_ptr, util::Event_loop* loop,
                                              const Config& config, platform::Platform_listener_ptr listener)
{
  // Can't make_shared<>(): private ctor.
  return Listener_channel_ptr(new Listener_channel(logger_ptr, loop, config, std::move(listener)));
}

void Listener_channel::async_activate(const platform::Endpoint& target, Task_err&& on_done_func)
{
  post_or_run([this, target, on_done_func = std::move(on_done_func)]() mutable
  {
    activate0(target, std::move(on_done_func));
  });
}

void Listener_channel::async_adopt_preconfigured(Task_err&& on_done_func)
{
  post_or_run([this, on_done_func = std::move(on_done_func)]() mutable
  {
    adopt_preconfigured0(std::move(on_done_func));
  });
}

void Listener_channel::activate0(const platform::Endpoint& target, Task_err&& on_done_func)
{
  using platform::Listener_parameters;
  using platform::Service_endpoint;
  using std::get_if;

  FLOW_LOG_INFO("Listener [" << *this << "]: Activation requested on [" << target << "].");

  if (const auto err_code = begin_activating0(std::move(on_done_func)))
  {
    on_done_func(err_code);
    return;
  }
  // else

  // Build the parameters.

  Listener_parameters params;
  params.m_protocol_options = m_protocol_options;

  const auto service = get_if<Service_endpoint>(&target);
  if (service)
  {
    params.m_required_interface = service->m_interface;
  }
  else
  {
    params.m_required_local_endpoint = target;
  }

  params.m_allow_local_endpoint_reuse = m_reuse_address || m_reuse_port || m_allow_local_endpoint_reuse;
  params.m_include_peer_to_peer = m_enable_peer_to_peer;
  params.m_multipath_service_type = m_multipath_service_type;

  if (m_config.m_parameters_configurator)
  {
    m_config.m_parameters_configurator(&params);
  }

  // Construct the listener.

  Error_code sys_err_code;
  auto listener = m_config.m_listener_factory(get_logger(), params, &sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Listener [" << *this << "]: Could not construct platform listener with params "
                     "[" << params << "]; closing.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    close0(sys_err_code, Task_err()); // This fails the pending activation.
    return;
  }
  // else
  assert(listener);

  m_listener = std::move(listener);
  if (service)
  {
    m_listener->set_service(*service);
  }

  start_listener0();
} // Listener_channel::activate0()

void Listener_channel::adopt_preconfigured0(Task_err&& on_done_func)
{
  if (state0().closed())
  {
    on_done_func(error::Code::S_IO_ON_CLOSED_CHANNEL);
    return;
  }
  // else
  if ((!m_listener) || (m_listener->state() != platform::Listener_state::S_SETUP))
  {
    FLOW_LOG_WARNING("Listener [" << *this << "]: Asked to adopt pre-configured listener, but "
                     "[" << (m_listener ? "it is not in setup state" : "there is none") << "].");
    on_done_func(error::Code::S_NOT_PRE_CONFIGURED);
    return;
  }
  // else

  FLOW_LOG_INFO("Listener [" << *this << "]: Adopting pre-configured listener with params "
                "[" << m_listener->parameters() << "].");
  if (const auto err_code = begin_activating0(std::move(on_done_func)))
  {
    on_done_func(err_code);
    return;
  }
  // else

  start_listener0();
}

void Listener_channel::start_listener0()
{
  using platform::Listener_state;
  using platform::Platform_connection_ptr;

  assert(m_listener);

  /* The platform invokes these from thread C.  They hold only a weak reference to us; and they touch nothing of
   * ours there but re-post onto thread W (`loop` outlives thread C, since thread C is in it). */
  const std::weak_ptr<State_managed_channel> weak_this(shared_from_this());
  const auto loop = event_loop();

  m_listener->set_state_handler([this, weak_this, loop](Listener_state new_state, const Error_code& err_code)
  {
    // We are in thread C.
    loop->post([this, weak_this, new_state, err_code]()
    {
      // We are in thread W.
      if (const auto self = weak_this.lock())
      {
        on_listener_state0(new_state, err_code);
      }
    });
  });

  m_listener->set_new_connection_handler([this, weak_this, loop](Platform_connection_ptr new_connection)
  {
    // We are in thread C.
    loop->post([this, weak_this, new_connection = std::move(new_connection)]() mutable
    {
      // We are in thread W.
      if (const auto self = weak_this.lock())
      {
        on_new_connection0(std::move(new_connection));
      }
      else
      {
        new_connection->cancel(); // Nobody to hand it to.
      }
    });
  });

  FLOW_LOG_TRACE("Listener [" << *this << "]: Starting platform listener on callback queue.");
  m_listener->start(loop->callback_queue());
} // Listener_channel::start_listener0()

void Listener_channel::on_listener_state0(platform::Listener_state new_state, const Error_code& err_code)
{
  using platform::Listener_state;

  FLOW_LOG_TRACE("Listener [" << *this << "]: Platform listener reports state [" << new_state << "] "
                 "while we are [" << state0().kind() << "].");

  switch (new_state)
  {
  case Listener_state::S_SETUP:
    FLOW_LOG_FATAL("Listener [" << *this << "]: Platform listener reported setup state; the platform must never "
                   "do that.");
    assert(false && "Platform reported setup state.");
    std::abort();

  case Listener_state::S_WAITING:
    break; // Informational; it may yet become ready.

  case Listener_state::S_READY:
    if (state0().kind() != Channel_state::Kind::S_ACTIVATING)
    {
      // Closed in the meantime (and cancellation is on its way); nothing to complete.
      FLOW_LOG_TRACE("Listener [" << *this << "]: Ignoring readiness; not activating.");
      break;
    }
    // else
    bind_complete0();
    break;

  case Listener_state::S_FAILED:
    if (state0().closed())
    {
      FLOW_LOG_TRACE("Listener [" << *this << "]: Ignoring failure; already closed.");
      m_listener.reset(); // Terminal: no cancellation confirmation will follow.
      break;
    }
    // else
    FLOW_LOG_WARNING("Listener [" << *this << "]: Platform listener failed with [" << err_code << "] "
                     "[" << err_code.message() << "]; closing.");
    fire_error0(err_code);
    close0(err_code, Task_err());
    m_listener.reset(); // As above: terminal; nothing more will come from it.
    break;

  case Listener_state::S_CANCELLED:
    assert(state0().closed() && "Platform listener cancelled, but only we cancel it, and only on close.");
    FLOW_LOG_TRACE("Listener [" << *this << "]: Platform listener confirmed cancellation; releasing it.");
    m_listener.reset();
    break;
  }
} // Listener_channel::on_listener_state0()

void Listener_channel::bind_complete0()
{
  Error_code err_code;
  auto local_address = resolve_local_address0(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Listener [" << *this << "]: Platform listener is ready, but the local address is unknown "
                     "[" << err_code << "] [" << err_code.message() << "]; activating anyway without one.");
  }
  auto remote_address = resolve_remote_address0(&err_code); // A listener has none; ignore the error.
  assert(!remote_address);

  if (local_address)
  {
    FLOW_LOG_INFO("Listener [" << *this << "]: Bound to [" << *local_address << "].");
  }
  address_cache()->set(std::move(local_address), std::move(remote_address));
  become_active0();
}

std::optional<Socket_address> Listener_channel::resolve_local_address0(Error_code* err_code) const
{
  assert(err_code);
  assert(m_listener);

  const auto& endpoint = m_listener->parameters().m_required_local_endpoint;
  if (!endpoint)
  {
    *err_code = error::Code::S_UNABLE_TO_RESOLVE_ENDPOINT;
    return std::nullopt;
  }
  // else

  Error_code conversion_err_code;
  auto address = Socket_address::from_endpoint(*endpoint, &conversion_err_code);
  if (conversion_err_code)
  {
    *err_code = error::Code::S_UNABLE_TO_RESOLVE_ENDPOINT;
    return std::nullopt;
  }
  // else

  if (address->is_ip() && (*address->port() == 0))
  {
    const auto actual_port = m_listener->port();
    if (!actual_port)
    {
      *err_code = error::Code::S_UNABLE_TO_RESOLVE_ENDPOINT;
      return std::nullopt;
    }
    // else
    address->set_port(*actual_port);
  }

  err_code->clear();
  return address;
} // Listener_channel::resolve_local_address0()

std::optional<Socket_address> Listener_channel::resolve_remote_address0(Error_code* err_code) const
{
  assert(err_code);
  *err_code = error::Code::S_OPERATION_UNSUPPORTED;
  return std::nullopt;
}

void Listener_channel::on_new_connection0(platform::Platform_connection_ptr&& new_connection)
{
  using flow::util::ostream_op_string;

  const auto child_loop = m_config.m_child_loop_group ? m_config.m_child_loop_group->next() : event_loop();
  const auto child_nickname = ostream_op_string(nickname(), "=>", new_connection->native_handle());
  auto child = Child_channel::create(get_logger(), child_nickname, child_loop, std::move(new_connection),
                                     m_config.m_child_protocol_options, m_config.m_child_parameters_configurator);
  FLOW_LOG_TRACE("Listener [" << *this << "]: Accepted connection; made child [" << *child << "].");

  // Tell the pipeline; unless we're closed.  The handoff below happens regardless.
  if ((!state0().closed()) && pipeline0().m_on_child_accepted)
  {
    pipeline0().m_on_child_accepted(child);
  }

  // Hand off; from here on the child keeps itself alive (while registered), and we forget it.
  auto logger_ptr = get_logger();
  child_loop->post([child, logger_ptr]()
  {
    child->async_register([child, logger_ptr](const Error_code& err_code)
    {
      if (err_code)
      {
        FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHANNEL);
        FLOW_LOG_WARNING("Child [" << *child << "]: Registration failed with [" << err_code << "] "
                         "[" << err_code.message() << "]; closing it.");
        child->async_close(Task_err());
      }
    });
  });
} // Listener_channel::on_new_connection0()

void Listener_channel::do_close0()
{
  if (m_listener)
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Cancelling platform listener; awaiting confirmation.");
    m_listener->cancel();
  }
}

void Listener_channel::async_write(Task_err&& on_done_func)
{
  post_or_run([this, on_done_func = std::move(on_done_func)]()
  {
    on_done_func(state0().closed() ? error::Code::S_IO_ON_CLOSED_CHANNEL : error::Code::S_OPERATION_UNSUPPORTED);
  });
}

void Listener_channel::flush()
{
  // Nothing is ever written.
}

void Listener_channel::read()
{
  // Auto-read is always on.
}

void Listener_channel::async_close_half(Task_err&& on_done_func)
{
  post_or_run([this, on_done_func = std::move(on_done_func)]()
  {
    on_done_func(state0().closed() ? error::Code::S_IO_ON_CLOSED_CHANNEL : error::Code::S_OPERATION_UNSUPPORTED);
  });
}

void Listener_channel::async_trigger_outbound_event(const Outbound_event& event, Task_err&& on_done_func)
{
  if (const auto bind_event = std::get_if<Bind_to_endpoint_event>(&event))
  {
    async_activate(bind_event->m_target, std::move(on_done_func));
    return;
  }
  // else

  post_or_run([this, on_done_func = std::move(on_done_func)]()
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Outbound event not supported.");
    on_done_func(error::Code::S_OPERATION_UNSUPPORTED);
  });
}

bool Listener_channel::is_writable() const
{
  return true;
}

Error_code Listener_channel::set_option0(const option::Auto_read&, bool value)
{
  return value ? Error_code() : Error_code(error::Code::S_OPERATION_UNSUPPORTED);
}

Error_code Listener_channel::set_option0(const option::Socket_option& option, int value)
{
  if (option.m_level == SOL_SOCKET)
  {
    if (option.m_name == SO_REUSEADDR)
    {
      m_reuse_address = value != 0;
      return Error_code();
    }
    if (option.m_name == SO_REUSEPORT)
    {
      m_reuse_port = value != 0;
      return Error_code();
    }
  }
  return platform::apply_socket_option(&m_protocol_options, option.m_level, option.m_name, value);
}

Error_code Listener_channel::set_option0(const option::Allow_local_endpoint_reuse&, bool value)
{
  m_allow_local_endpoint_reuse = value;
  return Error_code();
}

Error_code Listener_channel::set_option0(const option::Enable_peer_to_peer&, bool value)
{
  m_enable_peer_to_peer = value;
  return Error_code();
}

Error_code Listener_channel::set_option0(const option::Multipath_service&, platform::Multipath_service_type value)
{
  m_multipath_service_type = value;
  return Error_code();
}

Error_code Listener_channel::get_option0(const option::Auto_read&, bool* value) const
{
  *value = true;
  return Error_code();
}

Error_code Listener_channel::get_option0(const option::Socket_option& option, int* value) const
{
  if (option.m_level == SOL_SOCKET)
  {
    if (option.m_name == SO_REUSEADDR)
    {
      *value = m_reuse_address;
      return Error_code();
    }
    if (option.m_name == SO_REUSEPORT)
    {
      *value = m_reuse_port;
      return Error_code();
    }
  }
  return platform::socket_option_value(m_protocol_options, option.m_level, option.m_name, value);
}

Error_code Listener_channel::get_option0(const option::Allow_local_endpoint_reuse&, bool* value) const
{
  *value = m_allow_local_endpoint_reuse;
  return Error_code();
}

Error_code Listener_channel::get_option0(const option::Enable_peer_to_peer&, bool* value) const
{
  *value = m_enable_peer_to_peer;
  return Error_code();
}

Error_code Listener_channel::get_option0(const option::Multipath_service&,
                                         platform::Multipath_service_type* value) const
{
  *value = m_multipath_service_type;
  return Error_code();
}

Error_code Listener_channel::get_option0(const option::Listener_handle&, platform::Platform_listener_ptr* value) const
{
  *value = m_listener;
  return Error_code();
}

} // namespace netchan::channel
