#include <gtest/gtest.h>

#include "rpc/dispatcher.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace taskbridge;

namespace {

class EchoMethod final : public rpc::MethodHandler {
public:
    const char* name() const override { return "echo"; }

    json handle(rpc::MethodContext& ctx) override {
        ++calls;
        return json{{"params", ctx.params}, {"hasId", ctx.id.has_value()}};
    }

    int calls = 0;
};

class CountMethod final : public rpc::MethodHandler {
public:
    const char* name() const override { return "count"; }

    json handle(rpc::MethodContext& ctx) override {
        auto limit = optional_int_param(ctx, "limit");
        return json{{"limit", limit ? json(*limit) : json(nullptr)}};
    }
};

const Response& as_response(const std::optional<Envelope>& envelope) {
    EXPECT_TRUE(envelope.has_value());
    EXPECT_TRUE(std::holds_alternative<Response>(*envelope));
    return std::get<Response>(*envelope);
}

} // namespace

TEST(Dispatcher, RoutesRequestAndEchoesId) {
    rpc::Dispatcher dispatcher;
    dispatcher.register_handler(std::make_unique<EchoMethod>());

    auto reply = dispatcher.handle_frame(R"({"id":"abc","method":"echo","params":{"x":1}})");
    const auto& response = as_response(reply);

    EXPECT_EQ(std::get<std::string>(response.id), "abc");
    ASSERT_TRUE(response.result.has_value());
    EXPECT_EQ((*response.result)["params"]["x"], 1);
    EXPECT_EQ((*response.result)["hasId"], true);
}

TEST(Dispatcher, UnknownMethodIsMethodNotFound) {
    rpc::Dispatcher dispatcher;

    auto reply = dispatcher.handle_frame(R"({"id":7,"method":"bogus"})");
    const auto& response = as_response(reply);

    EXPECT_EQ(std::get<int64_t>(response.id), 7);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, error_code::kMethodNotFound);
    EXPECT_EQ(response.error->message, "Method not found: bogus");
}

TEST(Dispatcher, HandlerExceptionBecomesInternalError) {
    rpc::Dispatcher dispatcher;
    dispatcher.register_handler("explode", [](const json&) -> json { throw std::runtime_error("sensor offline"); });

    auto reply = dispatcher.handle_frame(R"({"id":4,"method":"explode"})");
    const auto& response = as_response(reply);

    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, error_code::kInternalError);
    EXPECT_EQ(response.error->message, "Internal error: sensor offline");

    // The dispatcher keeps serving afterwards.
    dispatcher.register_handler("ping", [](const json&) { return json("pong"); });
    auto next = dispatcher.handle_frame(R"({"id":5,"method":"ping"})");
    EXPECT_EQ(*as_response(next).result, "pong");
}

TEST(Dispatcher, RpcErrorKeepsItsCode) {
    rpc::Dispatcher dispatcher;
    dispatcher.register_handler(std::make_unique<CountMethod>());

    auto reply = dispatcher.handle_frame(R"({"id":6,"method":"count","params":{"limit":"ten"}})");
    const auto& response = as_response(reply);

    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, error_code::kInvalidParams);
}

TEST(Dispatcher, RequestsWithoutIdProduceNoOutput) {
    rpc::Dispatcher dispatcher;
    auto echo = std::make_unique<EchoMethod>();
    EchoMethod* echo_ptr = echo.get();
    dispatcher.register_handler(std::move(echo));

    EXPECT_FALSE(dispatcher.handle_frame(R"({"id":null,"method":"echo"})").has_value());
    EXPECT_FALSE(dispatcher.handle_frame(R"({"id":null,"method":"missing"})").has_value());
    EXPECT_EQ(echo_ptr->calls, 1);
}

TEST(Dispatcher, NotificationOfKnownMethodRunsForSideEffect) {
    rpc::Dispatcher dispatcher;
    auto echo = std::make_unique<EchoMethod>();
    EchoMethod* echo_ptr = echo.get();
    dispatcher.register_handler(std::move(echo));

    EXPECT_FALSE(dispatcher.handle_frame(R"({"method":"echo","params":{}})").has_value());
    EXPECT_EQ(echo_ptr->calls, 1);
}

TEST(Dispatcher, NotificationsReachSubscribersOnly) {
    rpc::Dispatcher dispatcher;
    auto echo = std::make_unique<EchoMethod>();
    EchoMethod* echo_ptr = echo.get();
    dispatcher.register_handler(std::move(echo));

    std::vector<json> seen;
    dispatcher.subscribe("echo", [&seen](const json& params) { seen.push_back(params); });

    EXPECT_FALSE(dispatcher.handle_frame(R"({"method":"echo","params":{"n":1}})").has_value());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]["n"], 1);
    EXPECT_EQ(echo_ptr->calls, 0);
}

TEST(Dispatcher, InboundResponsesAreDiscarded) {
    rpc::Dispatcher dispatcher;
    EXPECT_FALSE(dispatcher.handle_frame(R"({"id":1,"result":{"ok":true}})").has_value());
}

TEST(Dispatcher, UndecodableFrameWithoutIdBecomesErrorNotification) {
    rpc::Dispatcher dispatcher;

    auto reply = dispatcher.handle_frame("not json");
    ASSERT_TRUE(reply.has_value());
    ASSERT_TRUE(std::holds_alternative<Notification>(*reply));

    const auto& notification = std::get<Notification>(*reply);
    EXPECT_EQ(notification.method, "error");
    EXPECT_EQ(notification.params["code"], error_code::kParseError);
}

TEST(Dispatcher, ShapeErrorWithIdBecomesErrorResponse) {
    rpc::Dispatcher dispatcher;

    auto reply = dispatcher.handle_frame(R"({"id":12,"method":"echo","params":"scalar"})");
    const auto& response = as_response(reply);

    EXPECT_EQ(std::get<int64_t>(response.id), 12);
    EXPECT_EQ(response.error->code, error_code::kInvalidRequest);
}

TEST(Dispatcher, MethodsAreListedInRegistrationOrder) {
    rpc::Dispatcher dispatcher;
    dispatcher.register_handler("b", [](const json&) { return json(); });
    dispatcher.register_handler("a", [](const json&) { return json(); });
    dispatcher.register_handler("b", [](const json&) { return json(1); });

    EXPECT_EQ(dispatcher.methods(), (std::vector<std::string>{"b", "a"}));
    auto reply = dispatcher.handle_frame(R"({"id":1,"method":"b"})");
    EXPECT_EQ(*as_response(reply).result, 1);
}
