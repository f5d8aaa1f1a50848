#include <gtest/gtest.h>

#include "backends/countdown_service.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <thread>

using namespace taskbridge;
using namespace taskbridge::testing;

namespace {

class CountdownFixture : public ::testing::Test {
protected:
    CountdownFixture() : notifier_(recorder_.writer()), task_("countdown", notifier_) {
        config_.default_duration_s = 3;
        config_.tick_period = 10ms;
        service_ = std::make_unique<backends::CountdownService>(task_, notifier_, config_);
        backends::register_countdown_methods(dispatcher_, *service_);
    }

    ~CountdownFixture() override {
        task_.stop();
    }

    Response call(const std::string& frame) {
        auto reply = dispatcher_.handle_frame(frame);
        EXPECT_TRUE(reply.has_value());
        return std::get<Response>(*reply);
    }

    bool completed() {
        return recorder_.wait_for([](const FrameRecorder& r) { return !r.timer_events("complete").empty(); });
    }

    FrameRecorder recorder_;
    Notifier notifier_;
    supervisor::PeriodicTask task_;
    config::CountdownConfig config_;
    std::unique_ptr<backends::CountdownService> service_;
    rpc::Dispatcher dispatcher_;
};

} // namespace

TEST_F(CountdownFixture, StartCountsDownToCompletion) {
    auto response = call(R"({"id":1,"method":"start","params":{"duration":5}})");

    EXPECT_EQ(std::get<int64_t>(response.id), 1);
    EXPECT_EQ(*response.result, (json{{"success", true}, {"remaining", 5}}));

    ASSERT_TRUE(completed());
    auto ticks = recorder_.timer_events("tick");
    ASSERT_EQ(ticks.size(), 5u);
    for (size_t i = 0; i < ticks.size(); ++i) {
        EXPECT_EQ(ticks[i]["remaining"], static_cast<int64_t>(4 - i));
        EXPECT_EQ(ticks[i]["total"], 5);
    }

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(recorder_.timer_events("tick").size(), 5u);
    EXPECT_EQ(recorder_.timer_events("complete").size(), 1u);
    EXPECT_EQ(recorder_.lines().size(), 6u);
}

TEST_F(CountdownFixture, SecondStartWhileRunningIsRejected) {
    auto first = call(R"({"id":1,"method":"start","params":{"duration":4}})");
    auto second = call(R"({"id":2,"method":"start","params":{"duration":9}})");

    EXPECT_EQ(*first.result, (json{{"success", true}, {"remaining", 4}}));
    EXPECT_EQ(*second.result, (json{{"success", false}, {"error", "Timer already running"}}));

    ASSERT_TRUE(completed());
    auto ticks = recorder_.timer_events("tick");
    ASSERT_EQ(ticks.size(), 4u);
    for (size_t i = 1; i < ticks.size(); ++i) {
        EXPECT_LT(ticks[i]["remaining"].get<int64_t>(), ticks[i - 1]["remaining"].get<int64_t>());
        EXPECT_EQ(ticks[i]["total"], 4);
    }
}

TEST_F(CountdownFixture, PauseStopsTicksAndKeepsRemaining) {
    call(R"({"id":1,"method":"start","params":{"duration":1000}})");
    ASSERT_TRUE(recorder_.wait_for([](const FrameRecorder& r) { return r.timer_events("tick").size() >= 2; }));

    auto paused = call(R"({"id":2,"method":"pause"})");
    ASSERT_TRUE(paused.result.has_value());
    EXPECT_EQ((*paused.result)["success"], true);

    auto ticks_at_pause = recorder_.timer_events("tick");
    int64_t remaining = (*paused.result)["remaining"];
    EXPECT_EQ(ticks_at_pause.back()["remaining"], remaining);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(recorder_.timer_events("tick").size(), ticks_at_pause.size());

    auto status = call(R"({"id":3,"method":"getStatus"})");
    EXPECT_EQ((*status.result)["isRunning"], false);
    EXPECT_EQ((*status.result)["remaining"], remaining);
}

TEST_F(CountdownFixture, PauseWhenIdleReportsNotRunning) {
    auto response = call(R"({"id":1,"method":"pause"})");
    EXPECT_EQ(*response.result, (json{{"success", false}, {"error", "Timer not running"}}));
}

TEST_F(CountdownFixture, ResetRestoresDurationAndEmitsEvent) {
    call(R"({"id":1,"method":"start","params":{"duration":100}})");
    ASSERT_TRUE(recorder_.wait_for([](const FrameRecorder& r) { return r.timer_events("tick").size() >= 1; }));

    auto response = call(R"({"id":2,"method":"reset"})");
    EXPECT_EQ(*response.result, (json{{"success", true}, {"remaining", 100}}));

    auto resets = recorder_.timer_events("reset");
    ASSERT_EQ(resets.size(), 1u);
    EXPECT_EQ(resets[0]["remaining"], 100);

    auto status = call(R"({"id":3,"method":"getStatus"})");
    EXPECT_EQ((*status.result)["isRunning"], false);
    EXPECT_TRUE((*status.result)["startTime"].is_null());
}

TEST_F(CountdownFixture, StartWithoutDurationResumesFromConfiguredDuration) {
    auto response = call(R"({"id":1,"method":"start"})");
    EXPECT_EQ((*response.result)["remaining"], 3);

    auto status = call(R"({"id":2,"method":"getStatus"})");
    EXPECT_EQ((*status.result)["isRunning"], true);
    EXPECT_EQ((*status.result)["duration"], 3);
    EXPECT_TRUE((*status.result)["startTime"].is_string());

    ASSERT_TRUE(completed());
}

TEST_F(CountdownFixture, NonPositiveDurationIsInvalidParams) {
    auto response = call(R"({"id":1,"method":"start","params":{"duration":0}})");
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, error_code::kInvalidParams);

    auto text = call(R"({"id":2,"method":"start","params":{"duration":"five"}})");
    ASSERT_TRUE(text.error.has_value());
    EXPECT_EQ(text.error->code, error_code::kInvalidParams);
    EXPECT_FALSE(task_.is_active());
}
