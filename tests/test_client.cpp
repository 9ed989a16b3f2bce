#include <gtest/gtest.h>
#include "HttpClient.hpp"
#include "MockTransport.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>

using namespace http_pipeline;
using http_pipeline::test::LambdaInterceptor;
using http_pipeline::test::MockTransport;

namespace {

struct Widget {
    std::string name;
    int size = 0;
};

Json::Value widgetToJson(const Widget& widget) {
    Json::Value v;
    v["name"] = widget.name;
    v["size"] = widget.size;
    return v;
}

Widget widgetFromJson(const Json::Value& v) {
    if (!v.isObject() || !v["name"].isString())
        throw std::runtime_error("not a widget");
    return Widget{v["name"].asString(), v["size"].asInt()};
}

} // namespace

TEST(HttpClientFetchTest, EchoRoundTrip) {
    auto transport = std::make_shared<MockTransport>(MockTransport::echo());
    HttpClient client(transport);

    Widget widget = client.fetch("https://example.test/widgets", "POST",
        Payload::json<Widget>(Widget{"gear", 3}, widgetToJson),
        parsers::json<Widget>(widgetFromJson));

    EXPECT_EQ(widget.name, "gear");
    EXPECT_EQ(widget.size, 3);
}

TEST(HttpClientFetchTest, DerivesContentTypeAndAccept) {
    auto transport = std::make_shared<MockTransport>(MockTransport::echo());
    HttpClient client(transport);

    Json::Value body;
    body["k"] = "v";
    client.fetch("https://example.test/things", "PUT", Payload::json(body), parsers::json());

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].methodName, "PUT");
    EXPECT_EQ(requests[0].headerValue("Content-Type"), std::optional<std::string>("application/json"));
    EXPECT_EQ(requests[0].headerValue("Accept"), std::optional<std::string>("application/json"));
    EXPECT_EQ(requests[0].body, std::optional<std::string>(R"({"k":"v"})"));
}

TEST(HttpClientFetchTest, EmptyPayloadSendsNoBodyNorContentType) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, "plain"));
    HttpClient client(transport);

    std::string text = client.fetch("https://example.test/text", "GET", Payload::empty(), parsers::text());

    EXPECT_EQ(text, "plain");
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_FALSE(requests[0].body.has_value());
    EXPECT_FALSE(requests[0].headerValue("Content-Type").has_value());
    EXPECT_EQ(requests[0].headerValue("Accept"), std::optional<std::string>("text/plain"));
}

TEST(HttpClientFetchTest, DiscardParserSendsNoAccept) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(204));
    HttpClient client(transport);

    client.fetch("https://example.test/things/1", "DELETE", Payload::empty(), parsers::discard());

    EXPECT_FALSE(transport->requests()[0].headerValue("Accept").has_value());
}

TEST(HttpClientFetchTest, EmptyStatusCodeYieldsNothing) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(204));
    HttpClient client(transport);

    std::optional<Json::Value> result = client.fetch("https://example.test/things/1", "GET", Payload::empty(),
        parsers::json(), std::set<long>{204});

    EXPECT_FALSE(result.has_value());
}

TEST(HttpClientFetchTest, NonEmptyStatusStillDecodes) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, R"({"name":"bolt","size":1})"));
    HttpClient client(transport);

    std::optional<Widget> result = client.fetch("https://example.test/things/1", "GET", Payload::empty(),
        parsers::json<Widget>(widgetFromJson), std::set<long>{204});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->name, "bolt");
}

TEST(HttpClientFetchTest, ClientErrorBodyCanBeParsed) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(404, R"({"message":"Not Found"})"));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/missing", "GET", Payload::empty(), parsers::json());
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        ASSERT_EQ(e.kind(), HttpError::Kind::ClientError);
        EXPECT_EQ(e.response()->status, 404);
        EXPECT_EQ(e.parsed(parsers::json(), client.codecs())["message"].asString(), "Not Found");
    }
    EXPECT_EQ(transport->callCount(), 1u);
}

TEST(HttpClientFetchTest, ServerErrorIsNotRetriedByDefault) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(503));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/busy", "GET", Payload::empty(), parsers::discard());
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::ServerError);
    }
    EXPECT_EQ(transport->callCount(), 1u);
}

TEST(HttpClientFetchTest, UnregisteredPayloadMimeIsEncodingError) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/x", "POST", Payload::encoded(MimeType{"application/cbor"}, Json::Value()),
            parsers::discard());
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::EncodingError);
    }
    EXPECT_EQ(transport->callCount(), 0u);
}

TEST(HttpClientFetchTest, MalformedBodyIsDecodingError) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, "<html>"));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/x", "GET", Payload::empty(), parsers::json());
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::DecodingError);
        EXPECT_TRUE(e.cause() != nullptr);
    }
}

TEST(HttpClientFetchTest, MapperFailureIsDecodingError) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, R"([1,2])"));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/x", "GET", Payload::empty(), parsers::json<Widget>(widgetFromJson));
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::DecodingError);
        EXPECT_EQ(describe(e.cause()), "not a widget");
    }
}

TEST(HttpClientFetchTest, SuccessOutsideExpectationIsUnexpectedResponse) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(202, "queued"));
    HttpClient client(transport);

    try {
        client.fetch("https://example.test/x", "POST", Payload::text("job"), parsers::text(Status::ok()));
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::UnexpectedResponse);
        EXPECT_EQ(e.response()->body, "queued");
    }
}

TEST(HttpClientFetchTest, CodecOverridesBeatDefaults) {
    class LenientCodec : public Codec {
    public:
        MimeType mimeType() const override { return MimeType::json(); }
        std::string encode(const Json::Value&) const override { return "{}"; }
        Json::Value decode(std::string_view bytes) const override { return Json::Value(std::string(bytes)); }
    };

    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, "not json"));
    CodecRegistry codecs;
    codecs.add(std::make_shared<LenientCodec>());
    HttpClient client(transport, {}, {}, HttpClientOptions::getDefault(), codecs);

    Json::Value value = client.fetch("https://example.test/x", "GET", Payload::empty(), parsers::json());
    EXPECT_EQ(value.asString(), "not json");
}

TEST(HttpClientSubmitTest, FutureDeliversResponse) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(200, "async"));
    HttpClient client(transport);

    HttpRequest request;
    request.url = "https://example.test/async";
    auto call = client.submit(request);

    EXPECT_EQ(call->future.get().body, "async");
    EXPECT_FALSE(call->isCancelled());
}

TEST(HttpClientSubmitTest, CancelDuringRetryAfterSleep) {
    auto transport = std::make_shared<MockTransport>(MockTransport::always(503));
    auto firstProcess = std::make_shared<std::promise<void>>();
    auto signalled = std::make_shared<bool>(false);

    auto backingOff = std::make_shared<LambdaInterceptor>();
    backingOff->onProcess = [firstProcess, signalled](HttpResponse&, const Context&) {
        if (!*signalled) {
            *signalled = true;
            firstProcess->set_value();
        }
        return Evaluation::retryAfter(30);
    };

    HttpClient client(transport);
    HttpRequest request;
    request.url = "https://example.test/slow";

    auto start = std::chrono::steady_clock::now();
    auto call = client.submit(request, {backingOff});

    firstProcess->get_future().wait();
    call->cancel();

    try {
        call->future.get();
        FAIL() << "Expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.kind(), HttpError::Kind::Canceled);
    }
    EXPECT_TRUE(call->isCancelled());
    EXPECT_EQ(transport->callCount(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(HttpClientSubmitTest, ConcurrentCallsShareOneClient) {
    auto transport = std::make_shared<MockTransport>([](const HttpRequest& request, uint32_t) {
        return MockTransport::respond(200, request.url);
    });
    HttpClient client(transport);

    std::vector<std::shared_ptr<HttpClient::PendingCall>> calls;
    for (int i = 0; i < 8; ++i) {
        HttpRequest request;
        request.url = "https://example.test/" + std::to_string(i);
        calls.push_back(client.submit(request));
    }

    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(calls[i]->future.get().body, "https://example.test/" + std::to_string(i));
    EXPECT_EQ(transport->callCount(), 8u);
}
