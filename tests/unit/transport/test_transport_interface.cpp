/**
 * @file test_transport_interface.cpp
 * @brief Unit tests for transport configuration and backend selection
 */

#include <gtest/gtest.h>

#include <kcenon/chunk_upload/transport/transport_config.h>
#include <kcenon/chunk_upload/transport/transport_factory.h>
#include <kcenon/chunk_upload/transport/transport_interface.h>

#include <array>
#include <chrono>

namespace kcenon::chunk_upload::test {

// =============================================================================
// transport_config Tests
// =============================================================================

class TransportConfigTest : public ::testing::Test {};

TEST_F(TransportConfigTest, Defaults) {
    transport_config config;

    EXPECT_EQ(config.connect_timeout, std::chrono::milliseconds{30000});
    EXPECT_EQ(config.operation_timeout, std::chrono::milliseconds{60000});
    EXPECT_TRUE(config.keep_alive);
    EXPECT_TRUE(config.ftp_passive);
    EXPECT_EQ(config.sftp_host_key_policy, host_key_policy::accept_any);
    EXPECT_FALSE(config.known_hosts_path.has_value());
    EXPECT_EQ(config.sub_write_size, 1024u * 1024u);
}

TEST_F(TransportConfigTest, BuilderSetsFields) {
    auto config = transport_config_builder()
                      .with_connect_timeout(std::chrono::seconds{5})
                      .with_operation_timeout(std::chrono::seconds{120})
                      .with_keep_alive(false)
                      .with_ftp_passive(false)
                      .with_sub_write_size(65536)
                      .build();

    EXPECT_EQ(config.connect_timeout, std::chrono::milliseconds{5000});
    EXPECT_EQ(config.operation_timeout, std::chrono::milliseconds{120000});
    EXPECT_FALSE(config.keep_alive);
    EXPECT_FALSE(config.ftp_passive);
    EXPECT_EQ(config.sub_write_size, 65536u);
}

TEST_F(TransportConfigTest, KnownHostsSelectsStrictPolicy) {
    auto config = transport_config_builder().with_known_hosts("/home/deploy/.ssh/known_hosts").build();

    EXPECT_EQ(config.sftp_host_key_policy, host_key_policy::known_hosts);
    ASSERT_TRUE(config.known_hosts_path.has_value());
    EXPECT_EQ(*config.known_hosts_path, "/home/deploy/.ssh/known_hosts");
}

TEST_F(TransportConfigTest, PolicyNames) {
    EXPECT_STREQ(to_string(host_key_policy::accept_any), "accept_any");
    EXPECT_STREQ(to_string(host_key_policy::known_hosts), "known_hosts");
    EXPECT_STREQ(to_string(write_mode::create), "create");
    EXPECT_STREQ(to_string(write_mode::append), "append");
}

// =============================================================================
// Transport Factory Tests
// =============================================================================

class TransportFactoryTest : public ::testing::TestWithParam<transfer_protocol> {};

TEST_P(TransportFactoryTest, CreateMatchesAvailability) {
    const auto protocol = GetParam();

    auto created = create_transport(protocol, transport_config{});

    if (is_protocol_available(protocol)) {
        ASSERT_TRUE(created.has_value());
        ASSERT_NE(created.value(), nullptr);
        EXPECT_EQ(created.value()->protocol(), protocol);
    } else {
        ASSERT_FALSE(created.has_value());
        EXPECT_EQ(created.error().code, error_code::backend_unavailable);
    }
}

TEST_P(TransportFactoryTest, NewTransportIsNotConnected) {
    const auto protocol = GetParam();
    if (!is_protocol_available(protocol)) {
        GTEST_SKIP() << to_string(protocol) << " backend not compiled in";
    }

    auto created = create_transport(protocol, transport_config{});
    ASSERT_TRUE(created.has_value());
    auto& transport = *created.value();

    EXPECT_FALSE(transport.is_connected());

    std::array<std::byte, 4> data{};
    auto written = transport.write_chunk("/tmp/never.part", 0, data, write_mode::create);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::not_connected);

    auto reconnected = transport.reconnect();
    ASSERT_FALSE(reconnected.has_value());
    EXPECT_EQ(reconnected.error().code, error_code::not_connected);

    transport.close();
    EXPECT_FALSE(transport.is_connected());
}

TEST_P(TransportFactoryTest, SubWriteSizeOnlyForRandomAccess) {
    const auto protocol = GetParam();
    if (!is_protocol_available(protocol)) {
        GTEST_SKIP() << to_string(protocol) << " backend not compiled in";
    }

    auto created = create_transport(protocol, transport_config_builder().with_sub_write_size(4096).build());
    ASSERT_TRUE(created.has_value());

    auto sub = created.value()->preferred_sub_write_size();
    if (protocol == transfer_protocol::sftp) {
        EXPECT_EQ(sub, 4096u);
    } else {
        EXPECT_FALSE(sub.has_value());
    }
}

INSTANTIATE_TEST_SUITE_P(Protocols,
                         TransportFactoryTest,
                         ::testing::Values(transfer_protocol::ftp, transfer_protocol::sftp),
                         [](const ::testing::TestParamInfo<transfer_protocol>& info) {
                             return std::string(to_string(info.param));
                         });

}  // namespace kcenon::chunk_upload::test
