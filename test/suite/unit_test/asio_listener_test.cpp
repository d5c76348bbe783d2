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

#include "netchan/channel/listener_channel.hpp"
#include "netchan/channel/child_channel.hpp"
#include "netchan/channel/error.hpp"
#include "netchan/platform/asio_listener.hpp"
#include "netchan/test/test_common_util.hpp"
#include "netchan/test/test_logger.hpp"
#include <flow/util/util.hpp>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <unistd.h>

namespace netchan::channel::test
{

using netchan::test::Promised_err;
using netchan::test::Promised_result;
using netchan::test::Test_logger;
using netchan::test::get_test_suite_name;
using netchan::test::wait_err;
using netchan::test::wait_until;
using platform::Host_port_endpoint;
using platform::Unix_endpoint;
using flow::util::ostream_op_string;
using std::get;

namespace
{

/// Fixture: real sockets via the default (boost.asio) platform listener.
class Asio_listener_test :
  public ::testing::Test
{
protected:
  Asio_listener_test() :
    m_loop(&m_logger, "lsn"),
    m_child_loops(&m_logger, "child", 2)
  {
  }

  Listener_channel_ptr make_channel(const platform::Protocol_options& protocol_options = platform::Stream_options())
  {
    Listener_channel::Config config;
    config.m_nickname = get_test_suite_name();
    config.m_protocol_options = protocol_options;
    config.m_child_loop_group = &m_child_loops;
    return Listener_channel::create(&m_logger, &m_loop, config);
  }

  Error_code activate(const Listener_channel_ptr& channel, const platform::Endpoint& target)
  {
    Promised_err bound;
    channel->async_activate(target, bound.handler());
    Error_code err_code = error::Code::S_END_SENTINEL;
    EXPECT_TRUE(wait_err(&bound, &err_code));
    return err_code;
  }

  void close(const Listener_channel_ptr& channel)
  {
    Promised_err closed;
    channel->async_close(closed.handler());
    Error_code err_code;
    EXPECT_TRUE(wait_err(&closed, &err_code));
    EXPECT_FALSE(err_code);
  }

  Test_logger m_logger;
  util::Event_loop m_loop;
  util::Event_loop_group m_child_loops;
}; // class Asio_listener_test

} // namespace (anon)

TEST_F(Asio_listener_test, Tcp_accept)
{
  using boost::asio::ip::tcp;

  const auto channel = make_channel();
  Promised_result<Child_channel_ptr> accepted;
  Pipeline_handlers handlers;
  handlers.m_on_child_accepted = accepted.handler();
  channel->set_pipeline_handlers(std::move(handlers));

  ASSERT_FALSE(activate(channel, Host_port_endpoint{ "127.0.0.1", 0 }));
  const auto local_address = channel->local_address();
  ASSERT_TRUE(local_address);
  ASSERT_TRUE(local_address->port());
  const auto port = *local_address->port();
  EXPECT_NE(port, 0);

  boost::asio::io_context client_context;
  tcp::socket client(client_context);
  client.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

  Promised_result<Child_channel_ptr>::Result result;
  ASSERT_TRUE(accepted.wait(&result));
  const auto child = get<0>(result);
  ASSERT_TRUE(child);
  EXPECT_TRUE(wait_until([&]() { return child->is_active(); }));
  EXPECT_FALSE(child->native_handle().null());
  EXPECT_EQ(child->local_address()->port(), port);
  EXPECT_EQ(*child->remote_address()->port(), client.local_endpoint().port());

  Promised_err child_closed;
  child->async_close(child_closed.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&child_closed, &err_code));
  close(channel);
}

TEST_F(Asio_listener_test, Unix_domain_accept)
{
  using boost::asio::local::stream_protocol;

  const fs::path path(ostream_op_string("/tmp/netchan_test_", ::getpid(), ".sock"));
  fs::remove(path);

  const auto channel = make_channel();
  Promised_result<Child_channel_ptr> accepted;
  Pipeline_handlers handlers;
  handlers.m_on_child_accepted = accepted.handler();
  channel->set_pipeline_handlers(std::move(handlers));

  ASSERT_FALSE(activate(channel, Unix_endpoint{ path }));
  ASSERT_TRUE(channel->local_address());
  EXPECT_EQ(ostream_op_string(*channel->local_address()), ostream_op_string("unix:", path.string()));

  boost::asio::io_context client_context;
  stream_protocol::socket client(client_context);
  client.connect(stream_protocol::endpoint(path.string()));

  Promised_result<Child_channel_ptr>::Result result;
  ASSERT_TRUE(accepted.wait(&result));
  const auto child = get<0>(result);
  EXPECT_TRUE(wait_until([&]() { return child->is_active(); }));
  EXPECT_FALSE(child->remote_address()); // Unnamed client.

  Promised_err child_closed;
  child->async_close(child_closed.handler());
  Error_code err_code;
  ASSERT_TRUE(wait_err(&child_closed, &err_code));
  close(channel);
  EXPECT_TRUE(wait_until([&]() { return !fs::exists(path); }));
}

TEST_F(Asio_listener_test, Unix_domain_path_reusable)
{
  const fs::path path(ostream_op_string("/tmp/netchan_test_reuse_", ::getpid(), ".sock"));
  fs::remove(path); // Leftover of an earlier crashed run, if any.

  // Closed explicitly: the socket file goes away with the listener.
  const auto channel = make_channel();
  ASSERT_FALSE(activate(channel, Unix_endpoint{ path }));
  EXPECT_TRUE(fs::exists(path));
  close(channel);
  EXPECT_TRUE(wait_until([&]() { return !fs::exists(path); }));

  // So the same path can be bound again.  This time just drop the channel without closing it.
  auto next_channel = make_channel();
  ASSERT_FALSE(activate(next_channel, Unix_endpoint{ path }));
  EXPECT_TRUE(fs::exists(path));
  next_channel.reset();
  EXPECT_TRUE(wait_until([&]() { return !fs::exists(path); }));

  // A live listener's file is not removed by a channel that fails to bind to it.
  const auto owner_channel = make_channel();
  ASSERT_FALSE(activate(owner_channel, Unix_endpoint{ path }));
  const auto clashing_channel = make_channel();
  EXPECT_EQ(activate(clashing_channel, Unix_endpoint{ path }), boost::asio::error::address_in_use);
  EXPECT_TRUE(fs::exists(path));
  close(owner_channel);
  EXPECT_TRUE(wait_until([&]() { return !fs::exists(path); }));
}

TEST_F(Asio_listener_test, Datagram_bind)
{
  const auto channel = make_channel(platform::Datagram_options());
  ASSERT_FALSE(activate(channel, Host_port_endpoint{ "127.0.0.1", 0 }));
  ASSERT_TRUE(channel->local_address());
  EXPECT_NE(*channel->local_address()->port(), 0);
  close(channel);

  const auto unix_channel = make_channel(platform::Datagram_options());
  EXPECT_EQ(activate(unix_channel, Unix_endpoint{ "/tmp/netchan_test_dgram.sock" }),
            error::Code::S_INVALID_ENDPOINT);
}

TEST_F(Asio_listener_test, Address_in_use)
{
  const auto channel = make_channel();
  ASSERT_FALSE(activate(channel, Host_port_endpoint{ "127.0.0.1", 0 }));
  const auto port = *channel->local_address()->port();

  const auto clashing_channel = make_channel();
  Promised_err closed;
  clashing_channel->async_wait_closed(closed.handler());
  EXPECT_EQ(activate(clashing_channel, Host_port_endpoint{ "127.0.0.1", port }),
            boost::asio::error::address_in_use);
  Error_code err_code;
  ASSERT_TRUE(wait_err(&closed, &err_code));
  EXPECT_FALSE(clashing_channel->is_active());

  close(channel);
}

TEST_F(Asio_listener_test, Default_factory)
{
  const auto channel = make_channel(); // No factory in its config.
  ASSERT_FALSE(activate(channel, Host_port_endpoint{ "127.0.0.1", 0 }));

  Promised_result<Error_code, platform::Platform_listener_ptr> handle;
  channel->async_get_option(option::Listener_handle(), handle.handler());
  Promised_result<Error_code, platform::Platform_listener_ptr>::Result result;
  ASSERT_TRUE(handle.wait(&result));
  EXPECT_FALSE(get<0>(result));
  EXPECT_TRUE(std::dynamic_pointer_cast<platform::Asio_listener>(get<1>(result)));
  close(channel);
}

TEST_F(Asio_listener_test, Symbolic_host_rejected)
{
  const auto channel = make_channel();
  EXPECT_EQ(activate(channel, Host_port_endpoint{ "localhost", 0 }), error::Code::S_INVALID_ENDPOINT);

  platform::Listener_parameters params;
  params.m_required_local_endpoint = Host_port_endpoint{ "localhost", 0 };
  Error_code err_code;
  const auto listener = platform::Asio_listener::create(&m_logger, params, &err_code);
  EXPECT_FALSE(listener);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ENDPOINT);
}

} // namespace netchan::channel::test
