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

#include "netchan/test/fake_platform.hpp"
#include <flow/error/error.hpp>
#include <boost/asio/post.hpp>
#include <cassert>

namespace netchan::test
{

using platform::Listener_state;
using platform::Connection_state;
using Lock = flow::util::Lock_guard<flow::util::Mutex_non_recursive>;

// Fake_platform_listener implementations.

Fake_platform_listener::Fake_platform_listener(const platform::Listener_parameters& params) :
  m_params(params),
  m_state(Listener_state::S_SETUP),
  m_port(0),
  m_auto_confirm_cancel(true),
  m_n_starts(0),
  m_n_cancels(0),
  m_queue(0)
{
}

Listener_state Fake_platform_listener::state() const
{
  return m_state;
}

const platform::Listener_parameters& Fake_platform_listener::parameters() const
{
  return m_params;
}

std::optional<uint16_t> Fake_platform_listener::port() const
{
  const uint16_t port = m_port;
  return (port == 0) ? std::nullopt : std::optional<uint16_t>(port);
}

void Fake_platform_listener::set_service(const platform::Service_endpoint& service)
{
  Lock lock(m_mutex);
  m_service = service;
}

void Fake_platform_listener::set_state_handler(State_handler&& handler)
{
  Lock lock(m_mutex);
  m_on_state_func = std::move(handler);
}

void Fake_platform_listener::set_new_connection_handler(New_connection_handler&& handler)
{
  Lock lock(m_mutex);
  m_on_new_connection_func = std::move(handler);
}

void Fake_platform_listener::start(util::Task_engine* queue)
{
  m_queue = queue;
  ++m_n_starts;
}

void Fake_platform_listener::cancel()
{
  ++m_n_cancels;
  const Listener_state state = m_state;
  if (m_auto_confirm_cancel && m_queue
      && (state != Listener_state::S_CANCELLED) && (state != Listener_state::S_FAILED))
  {
    notify_state(Listener_state::S_CANCELLED);
  }
}

void Fake_platform_listener::force_state(Listener_state new_state)
{
  m_state = new_state;
}

void Fake_platform_listener::set_port(uint16_t port)
{
  m_port = port;
}

void Fake_platform_listener::set_auto_confirm_cancel(bool auto_confirm)
{
  m_auto_confirm_cancel = auto_confirm;
}

void Fake_platform_listener::notify_state(Listener_state new_state, const Error_code& err_code)
{
  const auto queue = m_queue.load();
  assert(queue);

  m_state = new_state;
  State_handler on_state_func;
  {
    Lock lock(m_mutex);
    on_state_func = m_on_state_func;
  }
  boost::asio::post(*queue, [on_state_func, new_state, err_code]()
  {
    on_state_func(new_state, err_code);
  });
}

void Fake_platform_listener::notify_new_connection(platform::Platform_connection_ptr new_connection)
{
  const auto queue = m_queue.load();
  assert(queue);

  New_connection_handler on_new_connection_func;
  {
    Lock lock(m_mutex);
    on_new_connection_func = m_on_new_connection_func;
  }
  boost::asio::post(*queue, [on_new_connection_func, new_connection]()
  {
    on_new_connection_func(new_connection);
  });
}

unsigned int Fake_platform_listener::n_starts() const
{
  return m_n_starts;
}

unsigned int Fake_platform_listener::n_cancels() const
{
  return m_n_cancels;
}

std::optional<platform::Service_endpoint> Fake_platform_listener::service() const
{
  Lock lock(m_mutex);
  return m_service;
}

// Fake_platform_connection implementations.

Fake_platform_connection::Fake_platform_connection(std::optional<platform::Socket_address> local_address,
                                                   std::optional<platform::Socket_address> remote_address,
                                                   bool auto_ready) :
  m_local_address(std::move(local_address)),
  m_remote_address(std::move(remote_address)),
  m_auto_ready(auto_ready),
  m_state(Connection_state::S_SETUP),
  m_n_starts(0),
  m_n_cancels(0),
  m_queue(0)
{
}

Connection_state Fake_platform_connection::state() const
{
  return m_state;
}

void Fake_platform_connection::start(util::Task_engine* queue, State_handler&& on_state_func)
{
  m_on_state_func = std::move(on_state_func);
  m_queue = queue;
  ++m_n_starts;
  if (m_auto_ready)
  {
    notify_state(Connection_state::S_PREPARING);
    notify_state(Connection_state::S_READY);
  }
}

void Fake_platform_connection::cancel()
{
  ++m_n_cancels;
  const Connection_state state = m_state;
  if (m_queue && (state != Connection_state::S_CANCELLED) && (state != Connection_state::S_FAILED))
  {
    notify_state(Connection_state::S_CANCELLED);
  }
  else
  {
    m_state = Connection_state::S_CANCELLED;
  }
}

std::optional<platform::Socket_address> Fake_platform_connection::local_address() const
{
  return m_local_address;
}

std::optional<platform::Socket_address> Fake_platform_connection::remote_address() const
{
  return m_remote_address;
}

util::Native_handle Fake_platform_connection::native_handle() const
{
  return util::Native_handle();
}

void Fake_platform_connection::notify_state(Connection_state new_state, const Error_code& err_code)
{
  const auto queue = m_queue.load();
  assert(queue);

  m_state = new_state;
  const auto on_state_func = m_on_state_func;
  boost::asio::post(*queue, [on_state_func, new_state, err_code]()
  {
    on_state_func(new_state, err_code);
  });
}

unsigned int Fake_platform_connection::n_starts() const
{
  return m_n_starts;
}

unsigned int Fake_platform_connection::n_cancels() const
{
  return m_n_cancels;
}

// Fake_listener_factory implementations.

Fake_listener_factory::Fake_listener_factory(const Error_code& fail_with) :
  m_fail_with(fail_with),
  m_n_calls(0)
{
}

platform::Listener_factory Fake_listener_factory::function()
{
  return [this](flow::log::Logger*, const platform::Listener_parameters& params, Error_code* err_code)
           -> platform::Platform_listener_ptr
  {
    Lock lock(m_mutex);
    ++m_n_calls;
    m_last_params = params;
    if (m_fail_with)
    {
      if (!err_code)
      {
        throw flow::error::Runtime_error(m_fail_with, "Fake_listener_factory");
      }
      *err_code = m_fail_with;
      return platform::Platform_listener_ptr();
    }
    // else

    if (err_code)
    {
      err_code->clear();
    }
    m_last_listener = std::make_shared<Fake_platform_listener>(params);
    return m_last_listener;
  };
}

unsigned int Fake_listener_factory::n_calls() const
{
  Lock lock(m_mutex);
  return m_n_calls;
}

std::shared_ptr<Fake_platform_listener> Fake_listener_factory::last_listener() const
{
  Lock lock(m_mutex);
  return m_last_listener;
}

platform::Listener_parameters Fake_listener_factory::last_params() const
{
  Lock lock(m_mutex);
  return m_last_params;
}

} // namespace netchan::test
