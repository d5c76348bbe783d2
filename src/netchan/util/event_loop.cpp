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
#include "netchan/util/event_loop.hpp"
#include <flow/util/util.hpp>
#include <boost/move/make_unique.hpp>

namespace netchan::util
{

// Event_loop implementations.

Event_loop::Event_loop(flow::log::Logger* logger_ptr, String_view nickname_arg) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_nickname(nickname_arg),
  // (Linux) OS thread names truncate to 15 chars; the prefixes keep the two apart at least.
  m_worker(get_logger(), flow::util::ostream_op_string("EvW-", m_nickname)),
  m_callback_queue(get_logger(), flow::util::ostream_op_string("EvC-", m_nickname))
{
  using flow::async::reset_thread_pinning;

  m_worker.start([this]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.
  });
  m_callback_queue.start([this]()
  {
    reset_thread_pinning(get_logger());
  });

  FLOW_LOG_INFO("Event_loop [" << *this << "]: Worker thread and callback-queue thread started.");
}

Event_loop::~Event_loop()
{
  FLOW_LOG_INFO("Event_loop [" << *this << "]: Shutting down.  Callback-queue thread will be joined, then worker "
                "thread; tasks not yet executed by either will be dropped.");

  // C first: it only ever posts onto W, so once it is gone nothing new will arrive on W from it.
  m_callback_queue.stop();
  m_worker.stop();

  FLOW_LOG_TRACE("Event_loop [" << *this << "]: Threads joined.");
}

const std::string& Event_loop::nickname() const
{
  return m_nickname;
}

bool Event_loop::in_loop() const
{
  return m_worker.in_thread();
}

void Event_loop::post(Task&& task)
{
  m_worker.post(std::move(task));
}

void Event_loop::post_or_run(Task&& task)
{
  using flow::async::Synchronicity;

  m_worker.post(std::move(task), Synchronicity::S_OPPORTUNISTIC_SYNC_ELSE_ASYNC);
}

Task_engine* Event_loop::callback_queue()
{
  return m_callback_queue.task_engine().get();
}

std::ostream& operator<<(std::ostream& os, const Event_loop& val)
{
  return os << "ev_loop[" << val.nickname() << "]@" << static_cast<const void*>(&val);
}

// Event_loop_group implementations.

Event_loop_group::Event_loop_group(flow::log::Logger* logger_ptr, String_view nickname, size_t n_loops) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_next_idx(0)
{
  using boost::movelib::make_unique;
  using flow::util::ostream_op_string;

  assert((n_loops != 0) && "Need at least one loop.");

  m_loops.reserve(n_loops);
  for (size_t idx = 0; idx != n_loops; ++idx)
  {
    m_loops.emplace_back(make_unique<Event_loop>(get_logger(), ostream_op_string(nickname, idx)));
  }

  FLOW_LOG_INFO("Event_loop_group [" << nickname << "]: Started [" << n_loops << "] loops.");
}

Event_loop* Event_loop_group::next()
{
  return m_loops[m_next_idx++ % m_loops.size()].get();
}

size_t Event_loop_group::size() const
{
  return m_loops.size();
}

} // namespace netchan::util
