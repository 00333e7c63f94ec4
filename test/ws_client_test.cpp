#include "client_connection_handlers/WsClient.hpp"
#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <memory>

namespace tcsim {

// create() hands out a shared owner, so the strand handlers can take shared_from_this().
TEST(WsClientTest, CreateReturnsSharedOwner) {
    boost::asio::io_context ioc;
    const std::shared_ptr<WsClient> client = WsClient::create(ioc);

    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client.use_count(), 1);
    EXPECT_EQ(client->shared_from_this(), client);
}

// Closing a client that never connected reports the close exactly once and leaves nothing queued.
TEST(WsClientTest, CloseBeforeConnectFiresCloseOnce) {
    boost::asio::io_context ioc;
    auto client = WsClient::create(ioc);

    int closes = 0;
    client->set_on_close([&closes] { ++closes; });

    client->close();
    client->cancel();
    client->send_text("ignored after close");
    ioc.run();

    EXPECT_EQ(closes, 1);
}

} // namespace tcsim
