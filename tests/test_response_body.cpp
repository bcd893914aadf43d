#include <gtest/gtest.h>
#include "meshgate/response_body.hpp"

using namespace meshgate;
using json = nlohmann::json;

class ResponseBodyTest : public ::testing::Test {};

TEST_F(ResponseBodyTest, DecodeJSON) {
    auto body = ResponseBody::decode(R"({"message": "Hello", "data": [1, 2, 3]})");

    ASSERT_TRUE(body.is_object());
    EXPECT_EQ(body["message"], "Hello");
    EXPECT_EQ(body["data"].size(), 3);
}

TEST_F(ResponseBodyTest, DecodeJSONArray) {
    auto body = ResponseBody::decode("[1, 2, 3]");
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body[2], 3);
}

TEST_F(ResponseBodyTest, InvalidJSONStaysText) {
    auto body = ResponseBody::decode("{invalid json}");
    ASSERT_TRUE(body.is_string());
    EXPECT_EQ(body, "{invalid json}");
}

TEST_F(ResponseBodyTest, EmptyBody) {
    auto body = ResponseBody::decode("");
    ASSERT_TRUE(body.is_string());
    EXPECT_EQ(ResponseBody::encode(body), "");
    EXPECT_EQ(ResponseBody::encode(json(nullptr)), "");
}

TEST_F(ResponseBodyTest, EncodeText) {
    std::string html = "<html><body>Test</body></html>";
    EXPECT_EQ(ResponseBody::encode(json(html)), html);
}

TEST_F(ResponseBodyTest, EncodeJSON) {
    json body = {{"ok", true}};
    EXPECT_EQ(ResponseBody::encode(body), R"({"ok":true})");
}

TEST_F(ResponseBodyTest, ContentTypeForJSON) {
    EXPECT_EQ(ResponseBody::content_type_for(json::object(), "text/html"), "application/json");
    EXPECT_EQ(ResponseBody::content_type_for(json::array(), ""), "application/json");
}

TEST_F(ResponseBodyTest, ContentTypeForText) {
    EXPECT_EQ(ResponseBody::content_type_for(json("hi"), "text/html; charset=utf-8"),
              "text/html; charset=utf-8");
    EXPECT_EQ(ResponseBody::content_type_for(json("hi"), ""), "text/plain");
    // Text that failed to parse must not be labelled as JSON
    EXPECT_EQ(ResponseBody::content_type_for(json("{bad"), "application/json"), "text/plain");
}

TEST_F(ResponseBodyTest, ContentTypeWithCharset) {
    EXPECT_EQ(ResponseBody::get_content_type_main("Text/HTML; charset=utf-8"), "text/html");
    EXPECT_EQ(ResponseBody::get_content_type_main("application/json"), "application/json");
}

TEST_F(ResponseBodyTest, FormatTimestamp) {
    auto time = std::chrono::system_clock::time_point{std::chrono::milliseconds{1700000000123}};
    EXPECT_EQ(format_timestamp(time), "2023-11-14T22:13:20.123Z");
}
