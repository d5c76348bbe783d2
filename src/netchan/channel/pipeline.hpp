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

#include "netchan/channel/channel_fwd.hpp"

namespace netchan::channel
{

// Types.

/**
 * The lifecycle events a channel fires into its pipeline, i.e., toward the user.  Any of them may be left empty.
 * Each is invoked from thread W of the channel's loop.
 */
struct Pipeline_handlers
{
  /// Activation completed.
  util::Task m_on_active;

  /// An active channel closed.
  util::Task m_on_inactive;

  /// (Listener only.) A connection was accepted, and its Child_channel is about to be registered.
  Function<void (const Child_channel_ptr& child)> m_on_child_accepted;

  /// The platform reported failure; the channel is about to close with that error.
  Task_err m_on_error;
}; // struct Pipeline_handlers

} // namespace netchan::channel
