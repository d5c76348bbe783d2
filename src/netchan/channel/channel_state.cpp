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
#include "netchan/channel/channel_state.hpp"
#include "netchan/channel/error.hpp"
#include <cassert>

namespace netchan::channel
{

Channel_state::Channel_state() :
  m_value(Idle())
{
  // Nope.
}

Channel_state::Kind Channel_state::kind() const
{
  return Kind(m_value.index()); // Alternatives are in the same order as Kind.
}

bool Channel_state::closed() const
{
  return std::holds_alternative<Closed>(m_value);
}

const Error_code& Channel_state::closed_reason() const
{
  static const Error_code S_SUCCESS;
  const auto closed_state = std::get_if<Closed>(&m_value);
  return closed_state ? closed_state->m_reason : S_SUCCESS;
}

Error_code Channel_state::begin_activating(Task_err&& on_done_func)
{
  switch (kind())
  {
  case Kind::S_IDLE:
    m_value = Activating{ std::move(on_done_func) };
    return Error_code();
  case Kind::S_CLOSED:
    return error::Code::S_IO_ON_CLOSED_CHANNEL;
  case Kind::S_ACTIVATING:
  case Kind::S_ACTIVE:
    break;
  }
  return error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE;
}

Task_err Channel_state::become_active()
{
  const auto activating = std::get_if<Activating>(&m_value);
  assert(activating && "Can only become active from activating state.");

  auto on_done_func = std::move(activating->m_on_done_func);
  m_value = Active();
  return on_done_func;
}

Channel_state::Close_result Channel_state::begin_closing(const Error_code& reason)
{
  assert((!closed()) && "Closed state is absorbing.");

  Close_result result{ Task_err(), std::holds_alternative<Active>(m_value) };
  if (const auto activating = std::get_if<Activating>(&m_value))
  {
    result.m_on_activated_func = std::move(activating->m_on_done_func);
  }
  m_value = Closed{ reason };
  return result;
}

Task_err Channel_state::take_pending_activation()
{
  if (const auto activating = std::get_if<Activating>(&m_value))
  {
    auto on_done_func = std::move(activating->m_on_done_func);
    activating->m_on_done_func = Task_err();
    return on_done_func;
  }
  return Task_err();
}

std::ostream& operator<<(std::ostream& os, Channel_state::Kind val)
{
  using Kind = Channel_state::Kind;
  switch (val)
  {
  case Kind::S_IDLE: return os << "idle";
  case Kind::S_ACTIVATING: return os << "activating";
  case Kind::S_ACTIVE: return os << "active";
  case Kind::S_CLOSED: return os << "closed";
  }
  assert(false && "Compiler should catch this.");
  return os;
}

} // namespace netchan::channel
