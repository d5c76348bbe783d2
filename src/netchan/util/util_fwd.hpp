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

#include "netchan/util/native_handle.hpp"
#include "netchan/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>

/**
 * Flow-NetChan module containing miscellaneous general-use facilities that ubiquitously used by ~all
 * Flow-NetChan modules and/or do not fit into any other Flow-NetChan module.  Most notably it holds the
 * event loops (Event_loop, Event_loop_group) to which every channel is bound.
 */
namespace netchan::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Event_loop;
class Event_loop_group;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for the completion handler type used for all async ops: takes an #Error_code (success or not).
using Task_err = flow::async::Task_asio_err;

/// Short-hand for boost.asio `io_context`; a platform callback queue is one of these.
using Task_engine = flow::util::Task_engine;

} // namespace netchan::util
