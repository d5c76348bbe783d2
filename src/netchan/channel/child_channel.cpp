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
#include "netchan/channel/child_channel.hpp"
#include "netchan/channel/error.hpp"
#include <flow/error/error.hpp>
#include <cassert>
#include <cstdlib>

namespace netchan::channel
{

Child_channel::Child_channel(flow::log::Logger* logger_ptr, util::String_view nickname, util::Event_loop* loop,
                             platform::Platform_connection_ptr&& connection,
                             const platform::Protocol_options& protocol_options,
                             const Child_parameters_configurator& configurator) :
  State_managed_channel(logger_ptr, "child", nickname, loop),
  m_connection(std::move(connection)),
  m_protocol_options(protocol_options),
  m_configurator(configurator)
{
  assert(m_connection);
  FLOW_LOG_TRACE("Child [" << *this << "]: Created on [" << *loop << "].");
}

Child_channel::~Child_channel()
{
  if (!state0().closed())
  {
    m_connection->cancel();
  }
}

Child_channel_ptr Child_channel::create(flow::log::Logger* logger_ptr, util::String_view nickname,
                                        util::Event_loop* loop, platform::Platform_connection_ptr connection,
                                        const platform::Protocol_options& protocol_options,
                                        const Child_parameters_configurator& configurator)
{
  return Child_channel_ptr(new Child_channel(logger_ptr, nickname, loop, std::move(connection),
                                             protocol_options, configurator));
}

void Child_channel::async_register(Task_err&& on_done_func)
{
  post_or_run([this, on_done_func = std::move(on_done_func)]() mutable
  {
    register0(std::move(on_done_func));
  });
}

void Child_channel::register0(Task_err&& on_done_func)
{
  using platform::Connection_state;

  if (const auto err_code = begin_activating0(std::move(on_done_func)))
  {
    on_done_func(err_code);
    return;
  }
  // else

  if (m_configurator)
  {
    m_configurator(&m_protocol_options);
  }

  // Apply the options to the socket; local address (if known) tells us the family.
  const auto native_handle = m_connection->native_handle();
  if (!native_handle.null())
  {
    const auto local_address = m_connection->local_address();
    const bool is_v6 = local_address && local_address->is_ip() && local_address->ip_address().is_v6();
    const bool is_ip = local_address && local_address->is_ip();

    Error_code sys_err_code;
    if (is_ip)
    {
      sys_err_code = std::visit([&](const auto& options) -> Error_code
                                  { return options.apply_to_socket(native_handle.m_native_handle, is_v6); },
                                m_protocol_options);
    }
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Child [" << *this << "]: Could not apply protocol options to [" << native_handle << "]; "
                       "closing.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      close0(sys_err_code, Task_err()); // Fails the pending registration.
      return;
    }
  }

  m_self_ref = shared_from_this();

  const std::weak_ptr<State_managed_channel> weak_this(m_self_ref);
  const auto loop = event_loop();
  m_connection->start(loop->callback_queue(),
                      [this, weak_this, loop](Connection_state new_state, const Error_code& err_code)
  {
    // We are in thread C.
    loop->post([this, weak_this, new_state, err_code]()
    {
      // We are in thread W.
      if (const auto self = weak_this.lock())
      {
        on_connection_state0(new_state, err_code);
      }
    });
  });
} // Child_channel::register0()

void Child_channel::on_connection_state0(platform::Connection_state new_state, const Error_code& err_code)
{
  using platform::Connection_state;

  FLOW_LOG_TRACE("Child [" << *this << "]: Connection reports state [" << new_state << "] "
                 "while we are [" << state0().kind() << "].");
  if (state0().closed())
  {
    return; // Whatever it is, it no longer matters.
  }
  // else

  switch (new_state)
  {
  case Connection_state::S_SETUP:
    FLOW_LOG_FATAL("Child [" << *this << "]: Connection reported setup state; the platform must never do that.");
    assert(false && "Platform reported setup state.");
    std::abort();
  case Connection_state::S_PREPARING:
    break;
  case Connection_state::S_READY:
    if (state0().kind() == Channel_state::Kind::S_ACTIVATING)
    {
      address_cache()->set(m_connection->local_address(), m_connection->remote_address());
      become_active0();
    }
    break;
  case Connection_state::S_FAILED:
    FLOW_LOG_WARNING("Child [" << *this << "]: Connection failed with [" << err_code << "] "
                     "[" << err_code.message() << "].");
    fire_error0(err_code);
    close0(err_code, Task_err());
    break;
  case Connection_state::S_CANCELLED:
    assert(false && "Only we cancel the connection, and only once closed.");
    break;
  }
} // Child_channel::on_connection_state0()

void Child_channel::do_close0()
{
  m_connection->cancel();
  if (m_self_ref)
  {
    // Don't die right here, in the middle of close0(); the task will do it.
    event_loop()->post([self = std::move(m_self_ref)]() {});
  }
}

util::Native_handle Child_channel::native_handle() const
{
  return m_connection->native_handle();
}

const platform::Protocol_options& Child_channel::protocol_options0() const
{
  return m_protocol_options;
}

} // namespace netchan::channel
