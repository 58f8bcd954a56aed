#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "fetch_orchestrator.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;

namespace {
FetchTimings fast_timings() {
    FetchTimings timings;
    timings.connect_timeout = 200ms;
    timings.grace_period = 10ms;
    timings.poll_interval = 5ms;
    timings.max_polls = 30;
    return timings;
}

// Waits until the collector has seen at least count events of type.
bool wait_for_events(EventCollector& collector, const std::string& type, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (collector.of_type(type).size() >= count) return true;
        std::this_thread::sleep_for(1ms);
    }
    return false;
}
}  // namespace

class FetchOrchestratorTest : public ::testing::Test {
   protected:
    TempDir transfers;
    EventBus bus;
    EventCollector collector{bus};
    SessionState state{bus, test_settings("resources", transfers.path())};

    void TearDown() override {
        if (auto file = state.accepted_file()) {
            std::error_code ec;
            fs::remove(*file, ec);
        }
    }
};

TEST_F(FetchOrchestratorTest, GivesUpAfterThirtyPolls) {
    FakeIrcClient client;
    FetchOrchestrator orchestrator(state, client, fast_timings());

    FetchStatus status = orchestrator.run("!get dune");

    EXPECT_EQ(status, FetchStatus::Failed);
    std::vector<std::string> expected{"fetch-status", "connection status", "bot status", "message out", "fetch-status"};
    expected.insert(expected.end(), 30, "poll");
    expected.push_back("fetch-status");
    expected.push_back("server quit");
    EXPECT_EQ(collector.types(), expected);

    auto statuses = collector.of_type("fetch-status");
    EXPECT_EQ(statuses[0].data, "initialising");
    EXPECT_EQ(statuses[1].data, "fetching");
    EXPECT_EQ(statuses[2].data, "failed");
    EXPECT_EQ(collector.of_type("connection status")[0].data, "connected");
    EXPECT_EQ(collector.of_type("bot status")[0].data, true);
    EXPECT_EQ(collector.of_type("server quit")[0].data, "executed");
    EXPECT_TRUE(collector.of_type("poll")[0].data["status"].is_null());
    EXPECT_EQ(client.quit_calls(), 1);
}

TEST_F(FetchOrchestratorTest, PollReportsElapsedSeconds) {
    FakeIrcClient client;
    FetchTimings timings = fast_timings();
    timings.poll_interval = 1000ms;
    timings.max_polls = 2;
    FetchOrchestrator orchestrator(state, client, timings);

    orchestrator.run("!get dune");

    auto polls = collector.of_type("poll");
    ASSERT_EQ(polls.size(), 2u);
    EXPECT_EQ(polls[0].data["elapsed"], 0);
    EXPECT_EQ(polls[1].data["elapsed"], 1);
}

TEST_F(FetchOrchestratorTest, PollStatusNamesTheAcceptedFile) {
    json before = poll_event_data(std::chrono::seconds(4), state);
    EXPECT_EQ(before["elapsed"], 4);
    EXPECT_TRUE(before["status"].is_null());

    fs::path accepted = transfers.path() / "dune.epub";
    ASSERT_TRUE(state.record_accepted_file(accepted));

    json after = poll_event_data(std::chrono::seconds(6), state);
    EXPECT_EQ(after["elapsed"], 6);
    EXPECT_EQ(after["status"], accepted.string());
}

TEST_F(FetchOrchestratorTest, SendsRequestToConfiguredChannel) {
    FakeIrcClient client;
    FetchTimings timings = fast_timings();
    timings.max_polls = 1;
    FetchOrchestrator orchestrator(state, client, timings);

    orchestrator.run("!get dune");

    ASSERT_EQ(client.messages().size(), 1u);
    EXPECT_EQ(client.messages()[0].first, "#books");
    EXPECT_EQ(client.messages()[0].second, "!get dune");
    EXPECT_EQ(collector.of_type("message out")[0].data, (json{{"message", "!get dune"}, {"channel", "#books"}}));
    EXPECT_EQ(state.fetch_status(), FetchStatus::Failed);
}

TEST_F(FetchOrchestratorTest, AcceptedOfferEndsPollingEarly) {
    FakeIrcClient client;
    FetchTimings timings = fast_timings();
    timings.poll_interval = 50ms;
    FetchOrchestrator orchestrator(state, client, timings);

    std::thread offerer([&] {
        ASSERT_TRUE(wait_for_events(collector, "poll", 3));
        client.deliver(make_offer("Dune.epub", "spice"));
    });
    FetchStatus status = orchestrator.run("dune");
    offerer.join();

    EXPECT_EQ(status, FetchStatus::Completed);
    auto polls = collector.of_type("poll").size();
    EXPECT_GE(polls, 3u);
    EXPECT_LE(polls, 5u);
    EXPECT_EQ(collector.of_type("accepted-file-transfer").size(), 1u);
    EXPECT_EQ(collector.of_type("fetch-status").back().data, "completed");
    EXPECT_EQ(collector.types().back(), "server quit");
    EXPECT_EQ(read_file(transfers.path() / "Dune.epub"), "spice");
}

TEST_F(FetchOrchestratorTest, OfferAcceptedBeforePollingSkipsPolls) {
    FakeIrcClient client;
    client.on_message = [&client](const std::string&) { client.deliver(make_offer("dune.txt", "x")); };
    FetchOrchestrator orchestrator(state, client, fast_timings());

    EXPECT_EQ(orchestrator.run("dune"), FetchStatus::Completed);
    EXPECT_TRUE(collector.of_type("poll").empty());
}

TEST_F(FetchOrchestratorTest, UnmatchedOffersDoNotCompleteTheFetch) {
    FakeIrcClient client;
    client.on_message = [&client](const std::string&) { client.deliver(make_offer("other.txt", "x")); };
    FetchTimings timings = fast_timings();
    timings.max_polls = 3;
    FetchOrchestrator orchestrator(state, client, timings);

    EXPECT_EQ(orchestrator.run("dune"), FetchStatus::Failed);
    EXPECT_EQ(collector.of_type("unexpected-file-transfer").size(), 1u);
    EXPECT_EQ(collector.of_type("poll").size(), 3u);
}

TEST_F(FetchOrchestratorTest, ConnectErrorAbortsTheRequest) {
    FakeIrcClient client(FakeIrcClient::Connect::Fail);
    FetchOrchestrator orchestrator(state, client, fast_timings());

    EXPECT_EQ(orchestrator.run("dune"), FetchStatus::Failed);

    EXPECT_EQ(collector.types(), (std::vector<std::string>{"fetch-status", "connection error", "bot status",
                                                           "fetch-status", "server quit"}));
    EXPECT_EQ(collector.of_type("connection error")[0].data, "connection refused");
    EXPECT_EQ(collector.of_type("bot status")[0].data, false);
    EXPECT_TRUE(client.messages().empty());
}

TEST_F(FetchOrchestratorTest, ConnectTimeoutIsUnresolvedAndBounded) {
    FakeIrcClient client(FakeIrcClient::Connect::Hang);
    FetchTimings timings = fast_timings();
    timings.connect_timeout = 100ms;
    FetchOrchestrator orchestrator(state, client, timings);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(orchestrator.run("dune"), FetchStatus::Failed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    auto connection = collector.of_type("connection status");
    ASSERT_EQ(connection.size(), 1u);
    EXPECT_EQ(connection[0].data, "unresolved");
    EXPECT_TRUE(client.messages().empty());
    EXPECT_TRUE(collector.of_type("poll").empty());
}

TEST_F(FetchOrchestratorTest, QuitErrorIsReported) {
    FakeIrcClient client;
    client.quit_error = "socket closed";
    FetchTimings timings = fast_timings();
    timings.max_polls = 1;
    FetchOrchestrator orchestrator(state, client, timings);

    orchestrator.run("dune");

    EXPECT_EQ(collector.types().back(), "close error");
    EXPECT_EQ(collector.of_type("close error")[0].data, "socket closed");
    EXPECT_TRUE(collector.of_type("server quit").empty());
}

TEST_F(FetchOrchestratorTest, CancelStopsPolling) {
    FakeIrcClient client;
    FetchTimings timings = fast_timings();
    timings.poll_interval = 10s;
    FetchOrchestrator orchestrator(state, client, timings);

    std::thread canceller([&] {
        ASSERT_TRUE(wait_for_events(collector, "poll", 1));
        orchestrator.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    FetchStatus status = orchestrator.run("dune");
    canceller.join();

    EXPECT_EQ(status, FetchStatus::Failed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(collector.of_type("poll").size(), 1u);
    EXPECT_EQ(collector.of_type("fetch-cancelled")[0].data, "polling");
    EXPECT_EQ(collector.types().back(), "server quit");
}
