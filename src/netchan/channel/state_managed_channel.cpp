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
#include "netchan/channel/state_managed_channel.hpp"
#include "netchan/channel/error.hpp"
#include <cassert>

namespace netchan::channel
{

State_managed_channel::State_managed_channel(flow::log::Logger* logger_ptr, const char* kind_name,
                                             util::String_view nickname, util::Event_loop* loop) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL),
  m_kind_name(kind_name),
  m_nickname(nickname),
  m_loop(loop),
  m_is_active(false)
{
  assert(m_loop);
}

State_managed_channel::~State_managed_channel()
{
  /* No one refers to us anymore, hence nothing can be running on thread W on our behalf either; so it's fine to
   * touch thread W state from whatever thread we are in. */
  auto on_activated_func = m_state.take_pending_activation();
  if ((!on_activated_func) && m_on_closed_funcs.empty())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Channel [" << *this << "]: Shutting down with handlers still pending; they shall be invoked "
                "with operation-aborted error.");
  if (on_activated_func)
  {
    on_activated_func(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  }
  for (const auto& on_closed_func : m_on_closed_funcs)
  {
    on_closed_func(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  }
}

const std::string& State_managed_channel::nickname() const
{
  return m_nickname;
}

const char* State_managed_channel::kind_name() const
{
  return m_kind_name;
}

util::Event_loop* State_managed_channel::event_loop() const
{
  return m_loop;
}

void State_managed_channel::post_or_run(util::Task&& task)
{
  m_loop->post_or_run([self = shared_from_this(), task = std::move(task)]()
  {
    task();
  });
}

void State_managed_channel::set_pipeline_handlers(Pipeline_handlers&& handlers)
{
  /* We need a copyable lambda for util::Task; hence the shared_ptr detour, as Pipeline_handlers can be large-ish
   * and is moved in anyway. */
  auto handlers_ptr = std::make_shared<Pipeline_handlers>(std::move(handlers));
  post_or_run([this, handlers_ptr]()
  {
    m_pipeline = std::move(*handlers_ptr);
  });
}

void State_managed_channel::async_close(Task_err&& on_done_func)
{
  post_or_run([this, on_done_func = std::move(on_done_func)]() mutable
  {
    FLOW_LOG_INFO("Channel [" << *this << "]: Close requested.");
    close0(error::Code::S_IO_ON_CLOSED_CHANNEL, std::move(on_done_func));
  });
}

void State_managed_channel::async_wait_closed(Task_err&& on_done_func)
{
  assert(on_done_func);
  post_or_run([this, on_done_func = std::move(on_done_func)]() mutable
  {
    if (m_state.closed())
    {
      on_done_func(Error_code());
      return;
    }
    // else
    m_on_closed_funcs.emplace_back(std::move(on_done_func));
  });
}

std::optional<Socket_address> State_managed_channel::local_address() const
{
  return m_address_cache.local_address();
}

std::optional<Socket_address> State_managed_channel::remote_address() const
{
  return m_address_cache.remote_address();
}

bool State_managed_channel::is_active() const
{
  return m_is_active;
}

Error_code State_managed_channel::begin_activating0(Task_err&& on_done_func)
{
  assert(m_loop->in_loop());

  const auto prev_kind = m_state.kind();
  const auto err_code = m_state.begin_activating(std::move(on_done_func));
  if (err_code)
  {
    FLOW_LOG_WARNING("Channel [" << *this << "]: Activation requested in state [" << prev_kind << "]; rejecting "
                     "with [" << err_code << "] [" << err_code.message() << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Channel [" << *this << "]: Activating.");
  }
  return err_code;
}

void State_managed_channel::become_active0()
{
  assert(m_loop->in_loop());

  auto on_activated_func = m_state.become_active();
  m_is_active = true;
  FLOW_LOG_INFO("Channel [" << *this << "]: Active.");

  if (on_activated_func)
  {
    on_activated_func(Error_code());
  }
  if (m_pipeline.m_on_active && (!m_state.closed())) // Activation handler may have closed us.
  {
    m_pipeline.m_on_active();
  }
}

void State_managed_channel::close0(const Error_code& reason, Task_err&& on_done_func)
{
  assert(m_loop->in_loop());

  if (m_state.closed())
  {
    FLOW_LOG_TRACE("Channel [" << *this << "]: Close requested, but already closed.");
    if (on_done_func)
    {
      on_done_func(error::Code::S_IO_ON_CLOSED_CHANNEL);
    }
    return;
  }
  // else

  FLOW_LOG_INFO("Channel [" << *this << "]: Closing in state [" << m_state.kind() << "] due to "
                "[" << reason << "] [" << reason.message() << "].");

  auto close_result = m_state.begin_closing(reason);
  m_is_active = false;

  do_close0();

  if (close_result.m_on_activated_func)
  {
    FLOW_LOG_TRACE("Channel [" << *this << "]: Failing pending activation.");
    close_result.m_on_activated_func(reason);
  }
  if (close_result.m_was_active && m_pipeline.m_on_inactive)
  {
    m_pipeline.m_on_inactive();
  }
  if (on_done_func)
  {
    on_done_func(Error_code());
  }

  const auto on_closed_funcs = std::move(m_on_closed_funcs);
  m_on_closed_funcs.clear();
  for (const auto& on_closed_func : on_closed_funcs)
  {
    on_closed_func(Error_code());
  }
} // State_managed_channel::close0()

void State_managed_channel::fire_error0(const Error_code& err_code)
{
  if (m_pipeline.m_on_error)
  {
    m_pipeline.m_on_error(err_code);
  }
}

const Channel_state& State_managed_channel::state0() const
{
  return m_state;
}

const Pipeline_handlers& State_managed_channel::pipeline0() const
{
  return m_pipeline;
}

Address_cache* State_managed_channel::address_cache()
{
  return &m_address_cache;
}

std::ostream& operator<<(std::ostream& os, const State_managed_channel& val)
{
  return os << val.kind_name() << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace netchan::channel
