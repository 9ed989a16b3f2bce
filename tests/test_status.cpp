#include <gtest/gtest.h>
#include "Status.hpp"
#include "models.hpp"

using namespace http_pipeline;

TEST(StatusTest, ClassifiesByRange) {
    EXPECT_EQ(classify(200), StatusClass::Success);
    EXPECT_EQ(classify(204), StatusClass::Success);
    EXPECT_EQ(classify(299), StatusClass::Success);
    EXPECT_EQ(classify(301), StatusClass::Redirection);
    EXPECT_EQ(classify(399), StatusClass::Redirection);
    EXPECT_EQ(classify(400), StatusClass::ClientError);
    EXPECT_EQ(classify(499), StatusClass::ClientError);
    EXPECT_EQ(classify(500), StatusClass::ServerError);
    EXPECT_EQ(classify(599), StatusClass::ServerError);
}

TEST(StatusTest, OutOfRangeIsUnexpected) {
    EXPECT_EQ(classify(0), StatusClass::Unexpected);
    EXPECT_EQ(classify(100), StatusClass::Unexpected);
    EXPECT_EQ(classify(199), StatusClass::Unexpected);
    EXPECT_EQ(classify(600), StatusClass::Unexpected);
    EXPECT_EQ(classify(-1), StatusClass::Unexpected);
}

TEST(StatusTest, RangesAreHalfOpen) {
    Status successful = Status::successful();
    EXPECT_TRUE(successful.contains(200));
    EXPECT_TRUE(successful.contains(299));
    EXPECT_FALSE(successful.contains(300));
    EXPECT_FALSE(successful.contains(199));

    Status ok = Status::ok();
    EXPECT_TRUE(ok.contains(200));
    EXPECT_FALSE(ok.contains(201));
}

TEST(StatusTest, UnionContainsBothSides) {
    Status merged = Status::ok() | Status::code(404, "Not Found");
    EXPECT_TRUE(merged.contains(200));
    EXPECT_TRUE(merged.contains(404));
    EXPECT_FALSE(merged.contains(201));
    EXPECT_EQ(merged.description, "OK | Not Found");
}

TEST(MimeTypeTest, EssenceIgnoresCaseAndParameters) {
    MimeType withCharset{"Application/JSON; charset=utf-8"};
    EXPECT_EQ(withCharset.essence(), "application/json");
    EXPECT_EQ(withCharset, MimeType::json());
    EXPECT_NE(MimeType::text(), MimeType::json());
}

TEST(HeaderTest, TagsDeriveHeaders) {
    EXPECT_EQ(Header::contentType(MimeType::json()), (Header{"Content-Type", "application/json"}));
    EXPECT_EQ(Header::accept(MimeType::text()), (Header{"Accept", "text/plain"}));
    EXPECT_EQ(Header::authorization("Bearer x"), (Header{"Authorization", "Bearer x"}));
}

TEST(HeaderTest, LookupIsCaseInsensitive) {
    HttpRequest request;
    request.headers = {{"content-type", "text/plain"}, {"X-Dup", "1"}, {"x-dup", "2"}};

    EXPECT_EQ(request.headerValue("Content-Type"), std::optional<std::string>("text/plain"));
    EXPECT_EQ(request.headerValue("X-DUP"), std::optional<std::string>("1"));
    EXPECT_FALSE(request.headerValue("Accept").has_value());
}

TEST(HeaderTest, SetReplacesAllDuplicates) {
    HttpRequest request;
    request.headers = {{"A", "1"}, {"X-Dup", "1"}, {"B", "2"}, {"x-dup", "2"}};

    request.setHeader("X-DUP", "3");

    ASSERT_EQ(request.headers.size(), 3u);
    EXPECT_EQ(request.headers[1], (Header{"X-Dup", "3"}));
    EXPECT_EQ(request.headers[2].name, "B");

    request.setHeader("C", "4");
    EXPECT_EQ(request.headers.back(), (Header{"C", "4"}));
}

TEST(HttpRequestTest, MethodLookup) {
    EXPECT_EQ(HttpRequest::method2Enum("get"), HttpRequest::GET);
    EXPECT_EQ(HttpRequest::method2Enum("DELETE"), HttpRequest::DELETE);
    EXPECT_EQ(HttpRequest::method2Enum("OPTIONS"), HttpRequest::OTHER);
    EXPECT_EQ(HttpRequest::MethodStr[HttpRequest::PATCH], "PATCH");
}

TEST(HttpClientOptionsTest, Defaults) {
    const HttpClientOptions& options = HttpClientOptions::getDefault();
    EXPECT_EQ(options.maxRetryCount, 5u);
    EXPECT_FLOAT_EQ(options.timeout, 30.0f);
    EXPECT_FLOAT_EQ(options.requestPolicy().timeout, 30.0f);
}
