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

#include "netchan/util/util_fwd.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <vector>

namespace netchan::util
{

// Types.

/**
 * The single-threaded owning execution context to which channels are permanently bound, plus the dedicated serial
 * queue on which the platform delivers its notifications for those channels.
 *
 * There are two threads in here:
 *   - Thread W, the *worker*: channel state lives here.  Everything posted via post() and post_or_run() runs here,
 *     one task at a time in FIFO order; in_loop() tells whether the caller is already in it.
 *   - Thread C, the *callback queue*: callback_queue() is handed to platform objects (`start(queue)`), which then
 *     invoke their notification handlers from it.  Those handlers are expected to do nothing more than re-post
 *     onto thread W.
 *
 * Both are `flow::async::Single_thread_task_loop`s started in the constructor and stopped in the destructor.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently from any thread, except the destructor, which must not be called
 * from thread W or thread C.
 */
class Event_loop :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Starts both threads; returns once they are running.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable name used in logging and in (truncated) OS thread names.
   */
  explicit Event_loop(flow::log::Logger* logger_ptr, String_view nickname);

  /**
   * Stops thread C, then thread W, joining both.  Tasks not yet run are dropped without running (their captured
   * state, if any, is freed).
   */
  ~Event_loop();

  // Methods.

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns `true` if and only if the calling thread is thread W.
   * @return See above.
   */
  bool in_loop() const;

  /**
   * Queues `task` to run on thread W; never runs it synchronously, even if called from thread W.
   *
   * @param task
   *        Task to execute.
   */
  void post(Task&& task);

  /**
   * Runs `task` synchronously if called from thread W; otherwise like post().  The decision is made once,
   * right here, based on the calling thread's identity.
   *
   * @param task
   *        Task to execute.
   */
  void post_or_run(Task&& task);

  /**
   * The queue (thread C) on which platform objects shall deliver their notifications.
   * @return See above.  Valid until `*this` is destroyed.
   */
  Task_engine* callback_queue();

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Thread W.  Ordering: declared before #m_callback_queue, so it is destroyed after it.
  flow::async::Single_thread_task_loop m_worker;

  /// Thread C.
  flow::async::Single_thread_task_loop m_callback_queue;
}; // class Event_loop

/**
 * A fixed-size group of Event_loop objects, from which next() hands out loops in round-robin fashion.  A
 * channel::Listener_channel draws each accepted child's loop from one of these.
 *
 * next() and size() are safe to call concurrently.
 */
class Event_loop_group :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Creates and starts `n_loops` loops.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Prefix for the loops' nicknames.
   * @param n_loops
   *        How many; must be positive.
   */
  explicit Event_loop_group(flow::log::Logger* logger_ptr, String_view nickname, size_t n_loops);

  // Methods.

  /**
   * The next loop in round-robin order.
   * @return See above.  Never null.
   */
  Event_loop* next();

  /**
   * Number of loops.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// The loops; the vector is not modified after construction.
  std::vector<boost::movelib::unique_ptr<Event_loop>> m_loops;

  /// Incremented by each next() call; index into #m_loops modulo its size.
  std::atomic<size_t> m_next_idx;
}; // class Event_loop_group

// Free functions.

/**
 * Prints string representation of the given Event_loop to the given `ostream`.
 *
 * @relatesalso Event_loop
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Event_loop& val);

} // namespace netchan::util
