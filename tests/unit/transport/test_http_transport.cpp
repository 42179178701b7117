/**
 * @file test_http_transport.cpp
 * @brief Unit tests for transport error classification and responses
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_upload/transport/http_transport.h>

namespace kcenon::bulk_upload::test {

TEST(ClassifyTransportErrorTest, NoResponseKinds) {
    EXPECT_EQ(classify_transport_error(error_code::connection_timeout),
              upload_failure_kind::timeout);
    EXPECT_EQ(classify_transport_error(error_code::connection_refused),
              upload_failure_kind::connection_refused);
    EXPECT_EQ(classify_transport_error(error_code::connection_lost),
              upload_failure_kind::connection_lost);
    EXPECT_EQ(classify_transport_error(error_code::connection_failed),
              upload_failure_kind::connection_lost);
}

TEST(ClassifyTransportErrorTest, LocalFailuresAreNotConnectivityLoss) {
    auto kind = classify_transport_error(error_code::transport_unavailable);
    EXPECT_EQ(kind, upload_failure_kind::transport_error);
    EXPECT_FALSE(is_connectivity_loss(kind));

    EXPECT_EQ(classify_transport_error(error_code::internal_error),
              upload_failure_kind::transport_error);
}

TEST(ClassifyNetworkErrorTest, ClientCodesMapToTransportErrors) {
    EXPECT_EQ(classify_network_error(network_error_codes::connection_refused, false),
              error_code::connection_refused);
    EXPECT_EQ(classify_network_error(network_error_codes::connection_timeout, false),
              error_code::connection_timeout);
    for (int code : {network_error_codes::connection_failed,
                     network_error_codes::connection_closed,
                     network_error_codes::send_failed,
                     network_error_codes::receive_failed}) {
        EXPECT_EQ(classify_network_error(code, false), error_code::connection_lost) << code;
        EXPECT_EQ(classify_network_error(code, true), error_code::connection_lost) << code;
    }
}

TEST(ClassifyNetworkErrorTest, RefusedBeforeDeadlineIsNotTimeout) {
    EXPECT_EQ(classify_transport_error(
                  classify_network_error(network_error_codes::connection_refused, false)),
              upload_failure_kind::connection_refused);
    EXPECT_EQ(classify_transport_error(
                  classify_network_error(network_error_codes::connection_refused, true)),
              upload_failure_kind::connection_refused);
}

TEST(ClassifyNetworkErrorTest, UnknownCodeFallsBackOnDeadline) {
    EXPECT_EQ(classify_network_error(-1, false), error_code::request_failed);
    EXPECT_EQ(classify_network_error(-1, true), error_code::connection_timeout);

    auto kind = classify_transport_error(error_code::request_failed);
    EXPECT_EQ(kind, upload_failure_kind::transport_error);
    EXPECT_FALSE(is_connectivity_loss(kind));
}

TEST(HttpResponseTest, SuccessRange) {
    http_response response;
    response.status_code = 200;
    EXPECT_TRUE(response.is_success());
    response.status_code = 204;
    EXPECT_TRUE(response.is_success());
    response.status_code = 299;
    EXPECT_TRUE(response.is_success());
    response.status_code = 301;
    EXPECT_FALSE(response.is_success());
    response.status_code = 403;
    EXPECT_FALSE(response.is_success());
    response.status_code = 0;
    EXPECT_FALSE(response.is_success());
}

TEST(HttpResponseTest, BodyString) {
    http_response response;
    response.body = {'o', 'k'};
    EXPECT_EQ(response.get_body_string(), "ok");
}

TEST(NetworkHttpTransportTest, DefaultTimeout) {
    network_http_transport transport;
    EXPECT_EQ(transport.timeout(), std::chrono::milliseconds(30000));
}

TEST(NetworkHttpTransportTest, CustomTimeout) {
    network_http_transport transport(std::chrono::milliseconds(1500));
    EXPECT_EQ(transport.timeout(), std::chrono::milliseconds(1500));
}

}  // namespace kcenon::bulk_upload::test
