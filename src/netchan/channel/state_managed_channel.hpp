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

#include "netchan/channel/channel_state.hpp"
#include "netchan/channel/address_cache.hpp"
#include "netchan/channel/pipeline.hpp"
#include "netchan/util/event_loop.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <vector>

namespace netchan::channel
{

// Types.

/**
 * The lifecycle shared by all channels, driven entirely on thread W of one owning util::Event_loop: the
 * Channel_state machine, its completion handlers, the close path, the Address_cache and the pipeline events.
 * A subclass supplies activation (how it gets from `Idle` to `Activating` and on to `Active`, via
 * begin_activating0() and become_active0()) and the closing of its platform object (do_close0()).
 *
 * ### The close path ###
 * All closing, whether requested via async_close() or forced by an error (failed construction, platform failure),
 * goes through close0().  It, in order: transitions to `Closed(reason)`; lets the subclass close its platform
 * object; fails the pending activation handler, if any, with `reason`; fires Pipeline_handlers::m_on_inactive if
 * the channel was active; succeeds the close request's handler, if any; succeeds every async_wait_closed()
 * handler.  Each handler thus fires exactly once.
 *
 * ### Thread safety ###
 * All public methods are safe to call concurrently from any thread.  Subclass methods whose names end in `0`
 * are thread W only.
 */
class State_managed_channel :
  public flow::log::Log_context,
  public std::enable_shared_from_this<State_managed_channel>,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Invokes any handler still pending (activation, async_wait_closed()) with
   * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
   */
  virtual ~State_managed_channel();

  // Methods.

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Short kind name such as `"listener"`, used when printing.
   * @return See above.
   */
  const char* kind_name() const;

  /**
   * The owning loop.
   * @return See above.
   */
  util::Event_loop* event_loop() const;

  /**
   * Replaces the pipeline handlers.  Takes effect on thread W; so call it before activating, to be sure of
   * seeing all events.
   *
   * @param handlers
   *        Handlers.
   */
  void set_pipeline_handlers(Pipeline_handlers&& handlers);

  /**
   * Closes the channel; see the close path in class doc header.  Fails with error::Code::S_IO_ON_CLOSED_CHANNEL
   * if already closed.  A pending activation fails with error::Code::S_IO_ON_CLOSED_CHANNEL.
   *
   * @param on_done_func
   *        Completion handler; may be empty.
   */
  void async_close(Task_err&& on_done_func);

  /**
   * Invokes `on_done_func` (with success) once the channel is closed, whichever way; immediately if it already is.
   *
   * @param on_done_func
   *        Completion handler.
   */
  void async_wait_closed(Task_err&& on_done_func);

  /**
   * Cached local address; see Address_cache.
   * @return See above.
   */
  std::optional<Socket_address> local_address() const;

  /**
   * Cached remote address; see Address_cache.
   * @return See above.
   */
  std::optional<Socket_address> remote_address() const;

  /**
   * Whether the channel is active.  Reflects thread W state, as of some very recent moment.
   * @return See above.
   */
  bool is_active() const;

protected:
  // Constructors.

  /**
   * Constructs an `Idle` channel.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param kind_name
   *        See kind_name(); must be a literal.
   * @param nickname
   *        Human-readable name.
   * @param loop
   *        Owning loop.  Must outlive `*this`.
   */
  explicit State_managed_channel(flow::log::Logger* logger_ptr, const char* kind_name,
                                 util::String_view nickname, util::Event_loop* loop);

  // Methods.

  /**
   * Runs `task` on thread W, synchronously if already there; keeps `*this` alive until it has run.
   *
   * @param task
   *        Task.
   */
  void post_or_run(util::Task&& task);

  /**
   * Thread W: Channel_state::begin_activating() plus logging.  On error `on_done_func` is untouched.
   *
   * @param on_done_func
   *        See Channel_state::begin_activating().
   * @return See Channel_state::begin_activating().
   */
  Error_code begin_activating0(Task_err&& on_done_func);

  /// Thread W: `Activating` -> `Active`; then invokes the activation handler and Pipeline_handlers::m_on_active.
  void become_active0();

  /**
   * Thread W: the close path; see class doc header.  If already closed, invokes `on_done_func` (if not empty) with
   * error::Code::S_IO_ON_CLOSED_CHANNEL and does nothing else.
   *
   * @param reason
   *        Why.
   * @param on_done_func
   *        Handler of the close request; may be empty.
   */
  void close0(const Error_code& reason, Task_err&& on_done_func);

  /**
   * Thread W: as part of close0(), closes the subclass's platform object.  The state is already `Closed`.
   * Must not invoke handlers.
   */
  virtual void do_close0() = 0;

  /**
   * Thread W: fires Pipeline_handlers::m_on_error, if set.
   *
   * @param err_code
   *        Error.
   */
  void fire_error0(const Error_code& err_code);

  /**
   * Thread W: state.
   * @return See above.
   */
  const Channel_state& state0() const;

  /**
   * Thread W: pipeline.
   * @return See above.
   */
  const Pipeline_handlers& pipeline0() const;

  /**
   * Address cache, for writing.
   * @return See above.
   */
  Address_cache* address_cache();

private:
  // Data.

  /// See kind_name().
  const char* const m_kind_name;

  /// See nickname().
  const std::string m_nickname;

  /// See event_loop().
  util::Event_loop* const m_loop;

  /// Thread W: the state.
  Channel_state m_state;

  /// Thread W: see set_pipeline_handlers().
  Pipeline_handlers m_pipeline;

  /// Thread W: handlers from async_wait_closed() while not closed.
  std::vector<Task_err> m_on_closed_funcs;

  /// See is_active().  Written on thread W only.
  std::atomic<bool> m_is_active;

  /// See local_address(), remote_address().
  Address_cache m_address_cache;
}; // class State_managed_channel

} // namespace netchan::channel
