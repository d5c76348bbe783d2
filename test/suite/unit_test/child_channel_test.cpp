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

#include "netchan/channel/child_channel.hpp"
#include "netchan/channel/error.hpp"
#include "netchan/test/fake_platform.hpp"
#include "netchan/test/test_common_util.hpp"
#include "netchan/test/test_logger.hpp"
#include <flow/util/util.hpp>
#include <boost/asio/error.hpp>
#include <boost/chrono.hpp>
#include <gtest/gtest.h>

namespace netchan::channel::test
{

using netchan::test::Fake_platform_connection;
using netchan::test::Promised_err;
using netchan::test::Test_logger;
using netchan::test::sync_with_loop;
using netchan::test::wait_err;
using netchan::test::wait_until;
using platform::Connection_state;
using boost::asio::ip::make_address;

namespace
{

Child_channel_ptr make_child(Test_logger* logger, util::Event_loop* loop,
                             const std::shared_ptr<Fake_platform_connection>& connection,
                             const Child_parameters_configurator& configurator = Child_parameters_configurator())
{
  return Child_channel::create(logger, "child", loop, connection, platform::Stream_options(), configurator);
}

} // namespace (anon)

TEST(Child_channel, Register_becomes_active)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection
    = std::make_shared<Fake_platform_connection>(Socket_address(make_address("::1"), 1),
                                                 Socket_address(make_address("::1"), 2));
  const auto child = make_child(&logger, &loop, connection);
  EXPECT_FALSE(child->local_address());
  EXPECT_TRUE(child->native_handle().null());

  Promised_err active;
  Pipeline_handlers handlers;
  handlers.m_on_active = [handler = active.handler()]() { handler(Error_code()); };
  child->set_pipeline_handlers(std::move(handlers));

  Promised_err registered;
  child->async_register(registered.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&registered, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(wait_err(&active, &err_code));
  EXPECT_TRUE(child->is_active());
  EXPECT_EQ(*child->local_address(), Socket_address(make_address("::1"), 1));
  EXPECT_EQ(*child->remote_address(), Socket_address(make_address("::1"), 2));
  EXPECT_EQ(connection->n_starts(), 1u);

  Promised_err registered_again;
  child->async_register(registered_again.handler());
  ASSERT_TRUE(wait_err(&registered_again, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE);
  EXPECT_EQ(connection->n_starts(), 1u);

  Promised_err closed;
  child->async_close(closed.handler());
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_FALSE(err_code);
}

TEST(Child_channel, Registered_child_keeps_itself_alive)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>();
  auto child = make_child(&logger, &loop, connection);
  const std::weak_ptr<Child_channel> weak_child(child);

  Promised_err registered;
  child->async_register(registered.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&registered, &err_code));
  ASSERT_TRUE(sync_with_loop(&loop));

  child.reset();
  ASSERT_TRUE(sync_with_loop(&loop));
  const auto still_child = weak_child.lock();
  ASSERT_TRUE(still_child);
  EXPECT_TRUE(still_child->is_active());

  Promised_err closed;
  still_child->async_close(closed.handler());
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_EQ(connection->n_cancels(), 1u);
  ASSERT_TRUE(sync_with_loop(&loop));
  EXPECT_FALSE(still_child->is_active());
}

TEST(Child_channel, Released_after_close)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>();
  auto child = make_child(&logger, &loop, connection);
  const std::weak_ptr<Child_channel> weak_child(child);

  Promised_err registered;
  child->async_register(registered.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&registered, &err_code));

  Promised_err closed;
  child->async_close(closed.handler());
  ASSERT_TRUE(wait_err(&closed, &err_code));
  child.reset();
  EXPECT_TRUE(wait_until([&]() { return weak_child.expired(); }));
}

TEST(Child_channel, Connection_failure_closes)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>(std::nullopt, std::nullopt, false);
  const auto child = make_child(&logger, &loop, connection);

  Promised_err pipeline_error;
  Pipeline_handlers handlers;
  handlers.m_on_error = pipeline_error.handler();
  child->set_pipeline_handlers(std::move(handlers));
  Promised_err closed;
  child->async_wait_closed(closed.handler());

  Promised_err registered;
  child->async_register(registered.handler());
  ASSERT_TRUE(sync_with_loop(&loop));
  EXPECT_EQ(connection->n_starts(), 1u);
  EXPECT_FALSE(registered.ready());

  connection->notify_state(Connection_state::S_PREPARING);
  ASSERT_TRUE(sync_with_loop(&loop));
  EXPECT_FALSE(registered.ready());
  connection->notify_state(Connection_state::S_FAILED, boost::asio::error::connection_reset);

  Error_code err_code;
  ASSERT_TRUE(wait_err(&registered, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::connection_reset);
  ASSERT_TRUE(wait_err(&pipeline_error, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::connection_reset);
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(child->is_active());

  // A late readiness is ignored.
  connection->notify_state(Connection_state::S_READY);
  ASSERT_TRUE(sync_with_loop(&loop));
  EXPECT_FALSE(child->is_active());
  EXPECT_FALSE(child->local_address());
}

TEST(Child_channel, Configurator_modifies_options)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>();
  unsigned int n_configured = 0;
  const auto child = make_child(&logger, &loop, connection,
                                [&](platform::Protocol_options* options)
  {
    ++n_configured;
    std::get<platform::Stream_options>(*options).m_no_delay = true;
  });

  Promised_err registered;
  child->async_register(registered.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&registered, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(sync_with_loop(&loop));
  EXPECT_EQ(n_configured, 1u);

  bool no_delay = false;
  Promised_err checked;
  loop.post([&, handler = checked.handler()]()
  {
    no_delay = std::get<platform::Stream_options>(child->protocol_options0()).m_no_delay;
    handler(Error_code());
  });
  ASSERT_TRUE(wait_err(&checked, &err_code));
  EXPECT_TRUE(no_delay);

  Promised_err closed;
  child->async_close(closed.handler());
  ASSERT_TRUE(wait_err(&closed, &err_code));
}

TEST(Child_channel, Close_before_register)
{
  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>();
  const auto child = make_child(&logger, &loop, connection);

  Promised_err closed;
  child->async_close(closed.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(connection->n_cancels(), 1u);

  Promised_err registered;
  child->async_register(registered.handler());
  ASSERT_TRUE(wait_err(&registered, &err_code));
  EXPECT_EQ(err_code, error::Code::S_IO_ON_CLOSED_CHANNEL);
  EXPECT_EQ(connection->n_starts(), 0u);
}

TEST(Child_channel_DeathTest, Setup_notification_is_fatal)
{
  GTEST_FLAG_SET(death_test_style, "threadsafe"); // Loop threads are running.

  Test_logger logger;
  util::Event_loop loop(&logger, "child");
  const auto connection = std::make_shared<Fake_platform_connection>(std::nullopt, std::nullopt, false);
  const auto child = make_child(&logger, &loop, connection);

  Promised_err registered;
  child->async_register(registered.handler());
  ASSERT_TRUE(sync_with_loop(&loop));
  ASSERT_EQ(connection->n_starts(), 1u);

  // The platform must never go back to setup; that aborts the process (from the loop thread; so wait for it).
  EXPECT_DEATH({
                 connection->notify_state(Connection_state::S_SETUP);
                 flow::util::this_thread::sleep_for(boost::chrono::seconds(5));
               }, "");

  EXPECT_FALSE(registered.ready());
  Promised_err closed;
  child->async_close(closed.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_FALSE(err_code);
}

} // namespace netchan::channel::test
