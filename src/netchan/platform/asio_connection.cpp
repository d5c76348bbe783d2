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
#include "netchan/platform/asio_connection.hpp"
#include <boost/asio/post.hpp>
#include <cassert>

namespace netchan::platform
{

Asio_connection::Asio_connection(flow::log::Logger* logger_ptr, util::String_view nickname,
                                 util::Native_handle&& native_handle,
                                 std::optional<Socket_address>&& local_address,
                                 std::optional<Socket_address>&& remote_address) :
  flow::log::Log_context(logger_ptr, Log_component::S_PLATFORM),
  m_nickname(nickname),
  m_local_address(std::move(local_address)),
  m_remote_address(std::move(remote_address)),
  m_native_handle(std::move(native_handle)),
  m_state(Connection_state::S_SETUP),
  m_queue(0)
{
  FLOW_LOG_TRACE("Asio_connection [" << m_nickname << "]: Created over [" << m_native_handle << "].");
}

Asio_connection::~Asio_connection()
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  close_socket();
}

Connection_state Asio_connection::state() const
{
  return m_state;
}

void Asio_connection::start(util::Task_engine* queue, State_handler&& on_state_func)
{
  assert(queue);
  assert((!m_queue) && "Must start() at most once.");

  m_on_state_func = std::move(on_state_func);
  m_queue = queue;
  boost::asio::post(*queue, [this, self = shared_from_this()]()
  {
    // We are in thread C.
    if (m_state != Connection_state::S_SETUP)
    {
      return; // Cancelled meanwhile; that reported already.
    }
    // else

    // Already connected: nothing to prepare.
    m_state = Connection_state::S_PREPARING;
    m_on_state_func(Connection_state::S_PREPARING, Error_code());
    if (m_state == Connection_state::S_PREPARING)
    {
      FLOW_LOG_TRACE("Asio_connection [" << m_nickname << "]: Ready.");
      m_state = Connection_state::S_READY;
      m_on_state_func(Connection_state::S_READY, Error_code());
    }
  });
}

void Asio_connection::cancel()
{
  const auto queue = m_queue.load();
  if (!queue)
  {
    flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
    close_socket();
    m_state = Connection_state::S_CANCELLED;
    return;
  }
  // else

  boost::asio::post(*queue, [this, self = shared_from_this()]()
  {
    // We are in thread C.
    const Connection_state state = m_state;
    if ((state == Connection_state::S_FAILED) || (state == Connection_state::S_CANCELLED))
    {
      return;
    }
    // else

    {
      flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
      close_socket();
    }
    FLOW_LOG_TRACE("Asio_connection [" << m_nickname << "]: Cancelled.");
    m_state = Connection_state::S_CANCELLED;
    m_on_state_func(Connection_state::S_CANCELLED, Error_code());
  });
}

std::optional<Socket_address> Asio_connection::local_address() const
{
  return m_local_address;
}

std::optional<Socket_address> Asio_connection::remote_address() const
{
  return m_remote_address;
}

util::Native_handle Asio_connection::native_handle() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_native_handle;
}

void Asio_connection::close_socket()
{
  if (!m_native_handle.null())
  {
    FLOW_LOG_TRACE("Asio_connection [" << m_nickname << "]: Closing [" << m_native_handle << "].");
    util::close_native_handle(&m_native_handle);
  }
}

} // namespace netchan::platform
