#include "streaming/streaming_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "events/event_emitter.hpp"
#include "mocks/fake_frame_source.hpp"
#include "mocks/mock_command_transport.hpp"

using namespace lcdlink;
using namespace lcdlink::tests;
using namespace std::chrono_literals;

class StreamingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        handle = make_test_handle("/dev/hidraw0", "SN0");
        controller = std::make_unique<control::DeviceController>(transport, 200ms);
        emitter = std::make_shared<events::EventEmitter>(1000);

        ON_CALL(transport, send_command(_, _, _))
            .WillByDefault(Invoke([this](device::DeviceHandle &, const protocol::CommandRequest &request,
                                         std::chrono::milliseconds) {
                std::lock_guard<std::mutex> lock(mutex);
                commands.push_back(request.command + "=" + request.payload.dump());
                return ok_result();
            }));
        ON_CALL(transport, send_file(_, _, _, _))
            .WillByDefault(Invoke([this](device::DeviceHandle &, const std::vector<uint8_t> &, protocol::FileType,
                                         uint8_t transfer_id) {
                std::lock_guard<std::mutex> lock(mutex);
                sent_ids.push_back(transfer_id);
                return ok_result();
            }));
    }

    std::unique_ptr<streaming::StreamingEngine> make_engine(streaming::StreamingConfig config = {}) {
        return std::make_unique<streaming::StreamingEngine>(*controller, config, emitter);
    }

    std::vector<std::string> command_log() {
        std::lock_guard<std::mutex> lock(mutex);
        return commands;
    }

    NiceMock<MockCommandTransport> transport;
    std::shared_ptr<device::DeviceHandle> handle;
    std::unique_ptr<control::DeviceController> controller;
    std::shared_ptr<events::EventEmitter> emitter;

    std::mutex mutex;
    std::vector<std::string> commands;
    std::vector<uint8_t> sent_ids;
};

// ============================================================================
// Enable / Disable
// ============================================================================

TEST_F(StreamingEngineTest, EnableSendsSetupInOrder) {
    auto engine = make_engine();

    auto result = engine->enable(*handle);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(command_log(), (std::vector<std::string>{"displayInSleep={\"enable\":false}",
                                                       "realtimeDisplay={\"enable\":true}",
                                                       "brightness={\"value\":80}", "timeout={\"value\":60}"}));
    EXPECT_EQ(engine->state("/dev/hidraw0"), streaming::StreamState::STREAMING);
    EXPECT_EQ(handle->session().brightness, 80);
    EXPECT_EQ(handle->session().keep_alive_timeout_s, 60);
}

TEST_F(StreamingEngineTest, EnableWithoutWakeSkipsDisplayInSleep) {
    streaming::StreamingConfig config;
    config.wake_before_enable = false;
    auto engine = make_engine(config);

    ASSERT_TRUE(engine->enable(*handle).ok());
    auto log = command_log();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0], "realtimeDisplay={\"enable\":true}");
}

TEST_F(StreamingEngineTest, EnableStopsAtFirstFailure) {
    EXPECT_CALL(transport, send_command(_, _, _))
        .WillOnce(Return(ok_result()))
        .WillOnce(Return(failed_result(transport::TransportError::COMMAND_REJECTED, "status 500")));
    auto engine = make_engine();

    auto result = engine->enable(*handle);

    EXPECT_EQ(result.error, transport::TransportError::COMMAND_REJECTED);
    EXPECT_EQ(result.error_message, "status 500");
    EXPECT_EQ(engine->state("/dev/hidraw0"), streaming::StreamState::IDLE);
}

TEST_F(StreamingEngineTest, DisableReturnsToIdleEvenOnFailure) {
    EXPECT_CALL(transport, send_command(_, _, _))
        .WillOnce(Return(failed_result(transport::TransportError::TIMEOUT, "no answer")));
    auto engine = make_engine();

    engine->disable(*handle);

    EXPECT_EQ(engine->state("/dev/hidraw0"), streaming::StreamState::IDLE);
}

// ============================================================================
// Frame pump
// ============================================================================

TEST_F(StreamingEngineTest, DisplayedLagsSentByBufferDepth) {
    auto engine = make_engine();
    FakeFrameSource source(5);
    sync::CancellationSource cancel;

    std::vector<std::string> timeline;
    streaming::StreamCallbacks callbacks;
    callbacks.on_frame_sent = [&timeline](const streaming::Frame &frame, uint8_t) {
        timeline.push_back("sent" + std::to_string(frame.index));
    };
    callbacks.on_frame_displayed = [&timeline](const streaming::Frame &frame, uint8_t) {
        timeline.push_back("shown" + std::to_string(frame.index));
    };

    auto result = engine->pump(*handle, source, 0ms, cancel.token(), callbacks);

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::COMPLETED);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.frames_sent, 5u);
    EXPECT_EQ(result.frames_displayed, 5u);
    EXPECT_EQ(timeline, (std::vector<std::string>{"sent0", "sent1", "sent2", "shown0", "sent3", "shown1", "sent4",
                                                  "shown2", "shown3", "shown4"}));

    // Completed pumps leave real-time display on
    EXPECT_TRUE(command_log().empty());
    EXPECT_FALSE(handle->session().streaming_active);
}

TEST_F(StreamingEngineTest, DisplayedReportsCarrySentTransferIds) {
    auto engine = make_engine();
    FakeFrameSource source(4);
    sync::CancellationSource cancel;

    std::vector<std::pair<uint64_t, uint8_t>> sent;
    std::vector<std::pair<uint64_t, uint8_t>> shown;
    streaming::StreamCallbacks callbacks;
    callbacks.on_frame_sent = [&sent](const streaming::Frame &frame, uint8_t id) { sent.emplace_back(frame.index, id); };
    callbacks.on_frame_displayed = [&shown](const streaming::Frame &frame, uint8_t id) {
        shown.emplace_back(frame.index, id);
    };

    engine->pump(*handle, source, 0ms, cancel.token(), callbacks);

    EXPECT_EQ(sent, shown);
    EXPECT_EQ(sent_ids, (std::vector<uint8_t>{4, 5, 6, 7}));
}

TEST_F(StreamingEngineTest, TransferIdsWrapAndNeverUseReserved) {
    auto engine = make_engine();
    FakeFrameSource source(120);
    sync::CancellationSource cancel;

    engine->pump(*handle, source, 0ms, cancel.token());

    ASSERT_EQ(sent_ids.size(), 120u);
    for (uint8_t id : sent_ids) {
        EXPECT_GE(id, 4);
        EXPECT_LE(id, 59);
    }
    EXPECT_EQ(sent_ids[55], 59);
    EXPECT_EQ(sent_ids[56], 4);
}

TEST_F(StreamingEngineTest, EmitsFrameDisplayedEvents) {
    auto sub = emitter->subscribe(events::EventFilter::for_device("/dev/hidraw0"));
    auto engine = make_engine();
    FakeFrameSource source(3);
    sync::CancellationSource cancel;

    engine->pump(*handle, source, 0ms, cancel.token());

    for (uint64_t i = 0; i < 3; ++i) {
        auto evt = sub->try_pop();
        ASSERT_TRUE(evt.has_value());
        const auto &shown = std::get<events::FrameDisplayedEvent>(*evt);
        EXPECT_EQ(shown.frame_index, i);
        EXPECT_EQ(shown.transfer_id, 4 + i);
    }
    EXPECT_FALSE(sub->try_pop().has_value());
}

TEST_F(StreamingEngineTest, PacesFramesToInterval) {
    auto engine = make_engine();
    FakeFrameSource source(4);
    sync::CancellationSource cancel;

    const auto start = std::chrono::steady_clock::now();
    auto result = engine->pump(*handle, source, 50ms, cancel.token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.frames_sent, 4u);
    EXPECT_GE(elapsed, 140ms);
    EXPECT_LT(elapsed, 1000ms);
}

TEST_F(StreamingEngineTest, SlowSendDoesNotBurstLaterFrames) {
    using clock = std::chrono::steady_clock;
    std::vector<clock::time_point> send_times;
    EXPECT_CALL(transport, send_file(_, _, _, _))
        .Times(8)
        .WillRepeatedly(Invoke([&](device::DeviceHandle &, const std::vector<uint8_t> &, protocol::FileType,
                                   uint8_t) {
            send_times.push_back(clock::now());
            if (send_times.size() == 2) {
                // Channel held by another command for several intervals
                std::this_thread::sleep_for(300ms);
            }
            return ok_result();
        }));
    auto engine = make_engine();
    FakeFrameSource source(8);
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 50ms, cancel.token());

    EXPECT_EQ(result.frames_sent, 8u);
    ASSERT_EQ(send_times.size(), 8u);
    // After the stall, frames resume one interval apart instead of catching up back-to-back
    for (size_t i = 3; i < send_times.size(); ++i) {
        EXPECT_GE(send_times[i] - send_times[i - 1], 40ms) << "frame " << i;
    }
}

TEST_F(StreamingEngineTest, CancelDrainsAndDisables) {
    auto engine = make_engine();
    FakeFrameSource source(-1);
    sync::CancellationSource cancel;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(60ms);
        cancel.cancel();
    });
    auto result = engine->pump(*handle, source, 10ms, cancel.token());
    canceller.join();

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::CANCELLED);
    EXPECT_TRUE(result.ok());
    EXPECT_GT(result.frames_sent, 0u);
    EXPECT_EQ(result.frames_displayed, result.frames_sent);
    EXPECT_EQ(command_log(), (std::vector<std::string>{"realtimeDisplay={\"enable\":false}"}));
    EXPECT_EQ(engine->state("/dev/hidraw0"), streaming::StreamState::CANCELLED);
}

TEST_F(StreamingEngineTest, SingleFrameFailureIsSkipped) {
    int call = 0;
    EXPECT_CALL(transport, send_file(_, _, _, _))
        .Times(4)
        .WillRepeatedly(Invoke([&](device::DeviceHandle &, const std::vector<uint8_t> &, protocol::FileType,
                                   uint8_t transfer_id) {
            sent_ids.push_back(transfer_id);
            return call++ == 1 ? failed_result(transport::TransportError::IO_ERROR, "short write") : ok_result();
        }));
    auto engine = make_engine();
    FakeFrameSource source(4);
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::COMPLETED);
    EXPECT_EQ(result.frames_sent, 3u);
    EXPECT_EQ(result.frames_failed, 1u);
    EXPECT_EQ(result.frames_displayed, 3u);
    EXPECT_EQ(result.last_error, transport::TransportError::IO_ERROR);
    // The failed id is not reused for the next frame
    EXPECT_EQ(sent_ids, (std::vector<uint8_t>{4, 5, 6, 7}));
}

TEST_F(StreamingEngineTest, AbortsWhenDeviceDisappears) {
    int call = 0;
    EXPECT_CALL(transport, send_file(_, _, _, _))
        .WillRepeatedly(Invoke([&](device::DeviceHandle &, const std::vector<uint8_t> &, protocol::FileType,
                                   uint8_t) {
            return call++ < 2 ? ok_result()
                              : failed_result(transport::TransportError::DEVICE_UNAVAILABLE, "detached");
        }));
    auto engine = make_engine();
    FakeFrameSource source(-1);
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::ABORTED);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.frames_sent, 2u);
    EXPECT_EQ(result.frames_displayed, 2u);
    EXPECT_EQ(result.error_message, "detached");
}

TEST_F(StreamingEngineTest, AbortsAfterConsecutiveFailures) {
    EXPECT_CALL(transport, send_file(_, _, _, _))
        .Times(3)
        .WillRepeatedly(Return(failed_result(transport::TransportError::TIMEOUT, "stalled")));
    auto engine = make_engine();
    FakeFrameSource source(-1);
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::ABORTED);
    EXPECT_EQ(result.frames_failed, 3u);
    EXPECT_EQ(result.frames_sent, 0u);
}

TEST_F(StreamingEngineTest, SecondSessionOnSameHandleIsBusy) {
    ASSERT_TRUE(handle->try_begin_streaming());
    EXPECT_CALL(transport, send_file(_, _, _, _)).Times(0);
    EXPECT_CALL(transport, send_command(_, _, _)).Times(0);
    auto engine = make_engine();
    FakeFrameSource source(3);
    sync::CancellationSource cancel;

    EXPECT_EQ(engine->pump(*handle, source, 0ms, cancel.token()).outcome, streaming::StreamOutcome::BUSY);
    EXPECT_EQ(engine->stream(*handle, source, 0ms, cancel.token()).outcome, streaming::StreamOutcome::BUSY);
    EXPECT_EQ(source.opened(), 0);

    handle->end_streaming();
}

TEST_F(StreamingEngineTest, SourceOpenFailure) {
    auto engine = make_engine();
    FakeFrameSource source(3);
    source.set_fail_open(true);
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::SOURCE_FAILED);
    EXPECT_NE(result.error_message.find("fake(3)"), std::string::npos);
}

TEST_F(StreamingEngineTest, SourceReadFailureDrainsSentFrames) {
    auto engine = make_engine();
    FakeFrameSource source(3, "unreadable frame");
    sync::CancellationSource cancel;

    auto result = engine->pump(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::SOURCE_FAILED);
    EXPECT_EQ(result.error_message, "unreadable frame");
    EXPECT_EQ(result.frames_sent, 3u);
    EXPECT_EQ(result.frames_displayed, 3u);
}

// ============================================================================
// Full session
// ============================================================================

TEST_F(StreamingEngineTest, StreamEnablesPumpsAndDisables) {
    auto engine = make_engine();
    FakeFrameSource source(2);
    sync::CancellationSource cancel;

    auto result = engine->stream(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::COMPLETED);
    auto log = command_log();
    ASSERT_EQ(log.size(), 5u);
    EXPECT_EQ(log[1], "realtimeDisplay={\"enable\":true}");
    EXPECT_EQ(log.back(), "realtimeDisplay={\"enable\":false}");
    EXPECT_EQ(engine->state("/dev/hidraw0"), streaming::StreamState::IDLE);
    EXPECT_FALSE(handle->session().streaming_active);
}

TEST_F(StreamingEngineTest, StreamReportsEnableFailure) {
    EXPECT_CALL(transport, send_command(_, _, _))
        .WillOnce(Return(failed_result(transport::TransportError::TIMEOUT, "asleep")));
    EXPECT_CALL(transport, send_file(_, _, _, _)).Times(0);
    auto engine = make_engine();
    FakeFrameSource source(2);
    sync::CancellationSource cancel;

    auto result = engine->stream(*handle, source, 0ms, cancel.token());

    EXPECT_EQ(result.outcome, streaming::StreamOutcome::ENABLE_FAILED);
    EXPECT_EQ(result.last_error, transport::TransportError::TIMEOUT);
    EXPECT_EQ(source.opened(), 0);
}

TEST_F(StreamingEngineTest, InvalidWindowFallsBackToDefaults) {
    streaming::StreamingConfig config;
    config.ids = streaming::TransferIdWindow{4, 5};
    config.buffer_depth = 3;
    auto engine = make_engine(config);

    EXPECT_EQ(engine->config().buffer_depth, streaming::kDefaultBufferDepth);
    EXPECT_EQ(engine->config().ids.first_rotating, 4);
    EXPECT_EQ(engine->config().ids.last_rotating, 59);
}

TEST(StreamOutcomeTest, ToString) {
    EXPECT_STREQ(streaming::stream_outcome_to_string(streaming::StreamOutcome::ABORTED), "ABORTED");
    EXPECT_STREQ(streaming::stream_state_to_string(streaming::StreamState::DISABLING), "DISABLING");
}
