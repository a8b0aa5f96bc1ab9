#pragma once

#include <worker/reply_decoding.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/login.hpp>
#include <shared_data/preview_file.hpp>
#include <shared_data/worker_status.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace Worker::Test
{
    class ReplyDecodingTests : public ::testing::Test
    {};

    TEST_F(ReplyDecodingTests, SuccessfulStatusPassesBodyThrough)
    {
        const auto json = interpretHttpResponse(200, R"({"status": "success", "message": "Connected to: Pixel"})");

        ASSERT_TRUE(json.has_value());
        const auto status = decodePlainReply<SharedData::WorkerStatus>(*json);
        ASSERT_TRUE(status.has_value());
        EXPECT_TRUE(status->usable());
        EXPECT_EQ(status->message, "Connected to: Pixel");
    }

    TEST_F(ReplyDecodingTests, ErrorStatusWithMessageIsWorkerError)
    {
        const auto json =
            interpretHttpResponse(401, R"({"success": false, "message": "Invalid user ID or account expired."})");

        ASSERT_FALSE(json.has_value());
        EXPECT_EQ(json.error().type, ApiErrorType::WorkerError);
        EXPECT_EQ(json.error().httpStatus.value_or(0), 401u);
        EXPECT_EQ(json.error().userMessage(), "Invalid user ID or account expired.");
    }

    TEST_F(ReplyDecodingTests, ErrorStatusWithErrorMemberIsWorkerError)
    {
        const auto json = interpretHttpResponse(400, R"({"error": "Path is required"})");

        ASSERT_FALSE(json.has_value());
        EXPECT_EQ(json.error().type, ApiErrorType::WorkerError);
        EXPECT_EQ(json.error().extraInfo.value_or(""), "Path is required");
    }

    TEST_F(ReplyDecodingTests, ErrorStatusWithoutJsonIsHttpError)
    {
        const auto json = interpretHttpResponse(502, "<html>Bad Gateway</html>");

        ASSERT_FALSE(json.has_value());
        EXPECT_EQ(json.error().type, ApiErrorType::HttpError);
        EXPECT_EQ(json.error().httpStatus.value_or(0), 502u);
    }

    TEST_F(ReplyDecodingTests, SuccessStatusWithoutJsonIsInvalidResponse)
    {
        const auto json = interpretHttpResponse(200, "ok");

        ASSERT_FALSE(json.has_value());
        EXPECT_EQ(json.error().type, ApiErrorType::InvalidResponse);
    }

    TEST_F(ReplyDecodingTests, ListingArrayDecodes)
    {
        const auto listing = decodePlainReply<std::vector<SharedData::DirectoryEntry>>(nlohmann::json::parse(R"([
            {"name": "DCIM/", "size": "-", "is_dir": true},
            {"name": "a.jpg", "size": "1.2 MB", "is_dir": false}
        ])"));

        ASSERT_TRUE(listing.has_value());
        ASSERT_EQ(listing->size(), 2u);
        EXPECT_TRUE(listing->at(0).isDirectory);
        EXPECT_EQ(listing->at(1).size, "1.2 MB");
    }

    TEST_F(ReplyDecodingTests, ErrorObjectInsteadOfPayloadIsWorkerError)
    {
        const auto listing =
            decodePlainReply<std::vector<SharedData::DirectoryEntry>>(nlohmann::json{{"error", "No device"}});

        ASSERT_FALSE(listing.has_value());
        EXPECT_EQ(listing.error().type, ApiErrorType::WorkerError);
        EXPECT_EQ(listing.error().userMessage(), "No device");
    }

    TEST_F(ReplyDecodingTests, LoginSuccessCarriesUserAndInfo)
    {
        const auto login = decodeErrorOrSuccess<SharedData::Login>(nlohmann::json::parse(R"({
            "success": true,
            "user": "alice",
            "info": {"plan": "basic", "container": "user-alice-1", "created": "2024-05-01T10:00:00+00:00",
                     "expiry": "2024-05-02T10:00:00+00:00", "limit_gb": 10}
        })"));

        ASSERT_TRUE(login.has_value());
        EXPECT_EQ(login->user, "alice");
        ASSERT_TRUE(login->info.has_value());
        EXPECT_EQ(login->info->plan, "basic");
        EXPECT_EQ(login->info->createdDate(), "2024-05-01");
    }

    TEST_F(ReplyDecodingTests, PreviewFailureUsesErrorMember)
    {
        const auto preview = decodeErrorOrSuccess<SharedData::PreviewFile>(
            nlohmann::json{{"success", false}, {"error", "Failed to pull /sdcard/a.jpg for preview."}});

        ASSERT_FALSE(preview.has_value());
        EXPECT_EQ(preview.error().type, ApiErrorType::WorkerError);
        EXPECT_EQ(preview.error().userMessage(), "Failed to pull /sdcard/a.jpg for preview.");
    }

    TEST_F(ReplyDecodingTests, SuccessWithMissingPayloadIsInvalidResponse)
    {
        const auto preview = decodeErrorOrSuccess<SharedData::PreviewFile>(nlohmann::json{{"success", true}});

        ASSERT_FALSE(preview.has_value());
        EXPECT_EQ(preview.error().type, ApiErrorType::InvalidResponse);
    }
}
