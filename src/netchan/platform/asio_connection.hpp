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

#include "netchan/platform/platform_connection.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <atomic>
#include <memory>

namespace netchan::platform
{

// Types.

/**
 * Platform_connection over a socket accepted by Asio_listener.  It owns the native descriptor (closed on cancel()
 * or destruction) and remembers the addresses as they were at accept time.  Being already connected, once
 * start()ed it reports Connection_state::S_PREPARING and then Connection_state::S_READY right away.
 */
class Asio_connection :
  public Platform_connection,
  public flow::log::Log_context,
  public std::enable_shared_from_this<Asio_connection>
{
public:
  // Constructors/destructor.

  /**
   * Takes over the given socket.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable name.
   * @param native_handle
   *        Open socket; becomes null.
   * @param local_address
   *        Local address.
   * @param remote_address
   *        Remote address.
   */
  explicit Asio_connection(flow::log::Logger* logger_ptr, util::String_view nickname,
                           util::Native_handle&& native_handle,
                           std::optional<Socket_address>&& local_address,
                           std::optional<Socket_address>&& remote_address);

  /// Closes the socket if still open.
  ~Asio_connection() override;

  // Methods.

  /**
   * Implements Platform_connection API.
   * @return See above.
   */
  Connection_state state() const override;

  /**
   * Implements Platform_connection API.
   *
   * @param queue
   *        See above.
   * @param on_state_func
   *        See above.
   */
  void start(util::Task_engine* queue, State_handler&& on_state_func) override;

  /// Implements Platform_connection API.
  void cancel() override;

  /**
   * Implements Platform_connection API.
   * @return See above.
   */
  std::optional<Socket_address> local_address() const override;

  /**
   * Implements Platform_connection API.
   * @return See above.
   */
  std::optional<Socket_address> remote_address() const override;

  /**
   * Implements Platform_connection API.
   * @return See above.
   */
  util::Native_handle native_handle() const override;

private:
  // Methods.

  /// Closes #m_native_handle if not null.  Caller must lock #m_mutex.
  void close_socket();

  // Data.

  /// Nickname given to ctor.
  const std::string m_nickname;

  /// See local_address().
  const std::optional<Socket_address> m_local_address;

  /// See remote_address().
  const std::optional<Socket_address> m_remote_address;

  /// Protects #m_native_handle.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// The socket; null once closed.
  util::Native_handle m_native_handle;

  /// See state().
  std::atomic<Connection_state> m_state;

  /// See start().  Null until then.
  std::atomic<util::Task_engine*> m_queue;

  /// See start().  Thread C only, after start().
  State_handler m_on_state_func;
}; // class Asio_connection

} // namespace netchan::platform
