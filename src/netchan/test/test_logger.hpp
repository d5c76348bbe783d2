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

#include "netchan/test/test_config.hpp"
#include <netchan/common.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/utility/base_from_member.hpp>

namespace netchan::test
{

/**
 * Console logger for tests: Flow's `Simple_ostream_logger`, with its own `Config` knowing both the Flow and
 * the netchan log components (prefixed `flow-` and `netchan-` in output), filtered at Test_config::m_sev
 * unless told otherwise.  Same component union indices as the link test uses.
 */
class Test_logger :
  private boost::base_from_member<flow::log::Config>, // Constructed before, and so usable by, the logger.
  public flow::log::Simple_ostream_logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity
   *        Lowest severity that will pass through.
   */
  explicit Test_logger(flow::log::Sev min_severity = Test_config::get_singleton().m_sev) :
    boost::base_from_member<flow::log::Config>(min_severity),
    flow::log::Simple_ostream_logger(&member)
  {
    using flow::log::Config;
    using flow::Flow_log_component;

    member.init_component_to_union_idx_mapping<Flow_log_component>
      (1000, Config::standard_component_payload_enum_sparse_length<Flow_log_component>());
    member.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    member.init_component_to_union_idx_mapping<Log_component>
      (2000, Config::standard_component_payload_enum_sparse_length<Log_component>());
    member.init_component_names<Log_component>(S_NETCHAN_LOG_COMPONENT_NAME_MAP, false, "netchan-");
  }
}; // class Test_logger

} // namespace netchan::test
