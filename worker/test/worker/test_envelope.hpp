#pragma once

#include <worker/envelope.hpp>

#include <gtest/gtest.h>

namespace Worker::Test
{
    class EnvelopeTests : public ::testing::Test
    {};

    TEST_F(EnvelopeTests, EncodedFrameCarriesEventAndData)
    {
        const auto frame = nlohmann::json::parse(encodeEnvelope("cancel_operation", nlohmann::json::object()));

        EXPECT_EQ(frame["event"], "cancel_operation");
        EXPECT_TRUE(frame["data"].is_object());
        EXPECT_TRUE(frame["data"].empty());
    }

    TEST_F(EnvelopeTests, DecodesEventAndPayload)
    {
        const auto envelope = decodeEnvelope(R"({"event": "progress_update", "data": {"current": 3, "total": 9}})");

        ASSERT_TRUE(envelope.has_value());
        EXPECT_EQ(envelope->event, "progress_update");
        EXPECT_EQ(envelope->data["total"], 9);
    }

    TEST_F(EnvelopeTests, MissingOrNullDataIsAnEmptyObject)
    {
        const auto withoutData = decodeEnvelope(R"({"event": "operation_cancelled"})");
        const auto withNull = decodeEnvelope(R"({"event": "operation_cancelled", "data": null})");

        ASSERT_TRUE(withoutData.has_value());
        ASSERT_TRUE(withNull.has_value());
        EXPECT_TRUE(withoutData->data.is_object());
        EXPECT_TRUE(withNull->data.is_object());
    }

    TEST_F(EnvelopeTests, GarbageIsRejected)
    {
        EXPECT_FALSE(decodeEnvelope("not json").has_value());
        EXPECT_FALSE(decodeEnvelope("[1, 2]").has_value());
        EXPECT_FALSE(decodeEnvelope(R"({"data": {}})").has_value());
        EXPECT_FALSE(decodeEnvelope(R"({"event": 5})").has_value());
    }

    TEST_F(EnvelopeTests, InvalidUtf8CannotBeEncoded)
    {
        nlohmann::json payload = nlohmann::json::object();
        payload["paths"] = nlohmann::json::array({std::string{"\xff\xfe"}});

        EXPECT_THROW(encodeEnvelope("start_operation", payload), nlohmann::json::type_error);
    }
}
