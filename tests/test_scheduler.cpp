#include "acquisition/scheduler.hpp"
#include "acquisition/events.hpp"
#include "instrument/registry.hpp"
#include "storage/measurement_store.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <thread>

using namespace benchlog;
using benchlog::fake::FakeInstrument;
using benchlog::fake::FakeTransport;
using benchlog::fake::RecordingSink;
using std::chrono::milliseconds;

namespace {

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus.subscribe(&sink);
        bus.subscribe(&store);
    }
    void TearDown() override {
        bus.unsubscribe(&store);
        bus.unsubscribe(&sink);
    }

    std::shared_ptr<FakeInstrument> add_device(InstrumentRegistry& reg, const std::string& name,
                                               const std::string& function = "DC Voltage",
                                               int samples = 1) {
        std::string address = "FAKE::" + name;
        auto inst = transport.add(address);
        DeviceConfig c;
        c.name = name;
        c.address = address;
        c.function = function;
        c.sample_count = samples;
        c.user_label = name + " label";
        EXPECT_NE(reg.add_or_update(c), Error::ConfigError);
        EXPECT_EQ(reg.connect(name, address), Error::Ok);
        return inst;
    }

    FakeTransport transport;
    EventBus bus;
    RecordingSink sink;
    MeasurementStore store;
};

} // namespace

TEST(ParseReading, AcceptsScpiNumbers) {
    double v = 0;
    EXPECT_TRUE(parse_reading("+5.123456789E+00", v));
    EXPECT_DOUBLE_EQ(v, 5.123456789);
    EXPECT_TRUE(parse_reading("  -1.5e-3\r\n", v));
    EXPECT_DOUBLE_EQ(v, -1.5e-3);
    EXPECT_TRUE(parse_reading("42", v));
    EXPECT_DOUBLE_EQ(v, 42.0);
}

TEST(ParseReading, RejectsNonNumeric) {
    double v = 7;
    EXPECT_FALSE(parse_reading("", v));
    EXPECT_FALSE(parse_reading("ERR", v));
    EXPECT_FALSE(parse_reading("5.0 V", v));
    EXPECT_FALSE(parse_reading("nan", v));
    EXPECT_FALSE(parse_reading("inf", v));
    EXPECT_DOUBLE_EQ(v, 7);
}

TEST_F(SchedulerTest, StartWithoutDevicesFails) {
    InstrumentRegistry reg(transport, bus, 1.0);
    AcquisitionScheduler sched(reg, bus, 1.0);
    EXPECT_EQ(sched.start(100), Error::NoDevicesConfigured);
    EXPECT_FALSE(sched.running());

    // Configured but not connected is not enough
    DeviceConfig c;
    c.name = "DMM1";
    c.function = "DC Voltage";
    reg.add_or_update(c);
    EXPECT_EQ(sched.start(100), Error::NoDevicesConfigured);
}

TEST_F(SchedulerTest, StopWhileIdleIsNoOp) {
    InstrumentRegistry reg(transport, bus, 1.0);
    AcquisitionScheduler sched(reg, bus, 1.0);
    sched.stop();
    EXPECT_FALSE(sched.running());
}

TEST_F(SchedulerTest, RecordsMeasurementsWithUnitAndLabel) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto inst = add_device(reg, "DMM1");
    inst->set_default_reply("+1.250000000E+00");

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "DMM1", 3, milliseconds(3000)));
    sched.stop();

    auto log = store.query(std::string("DMM1"));
    ASSERT_GE(log.size(), 3u);
    EXPECT_EQ(log[0].status, MeasurementStatus::Ok);
    EXPECT_DOUBLE_EQ(log[0].value, 1.25);
    EXPECT_EQ(log[0].unit, "V");
    EXPECT_EQ(log[0].function, "DC Voltage");
    EXPECT_EQ(log[0].user_label, "DMM1 label");
    EXPECT_GE(sched.get_stats().ticks, 3u);
}

TEST_F(SchedulerTest, NonNumericReplyIsErrorMeasurement) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto inst = add_device(reg, "DMM1");
    inst->queue_replies({"ERR", ""});

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "DMM1", 2, milliseconds(3000)));
    sched.stop();

    auto log = store.query(std::string("DMM1"));
    ASSERT_GE(log.size(), 2u);
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(log[i].status, MeasurementStatus::Error);
        EXPECT_DOUBLE_EQ(log[i].value, 0.0);
        EXPECT_EQ(log[i].unit, "");
    }
    EXPECT_GE(sink.count(EventType::DeviceError, "DMM1"), 2u);

    bool saw_raw = false;
    for (const auto& e : sink.events()) {
        if (e.type == EventType::DeviceError && e.message.find("'ERR'") != std::string::npos) {
            saw_raw = true;
        }
    }
    EXPECT_TRUE(saw_raw);
    EXPECT_TRUE(sched.get_stats().parse_errors >= 2);
    // ERROR points never reach the cache
    EXPECT_EQ(store.recent_series("DMM1").size(), log.size() - 2);
}

TEST_F(SchedulerTest, TransportFailureEmitsErrorOnlyAndKeepsDevice) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto inst = add_device(reg, "DMM1");
    inst->set_status(QueryStatus::IOFailure);

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::DeviceError, "DMM1", 2, milliseconds(3000)));

    EXPECT_EQ(sink.count(EventType::MeasurementRecorded, "DMM1"), 0u);
    EXPECT_EQ(reg.list_connected().count("DMM1"), 1u);

    // Transient fault heals on a later tick
    inst->set_status(QueryStatus::Ok);
    EXPECT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "DMM1", 1, milliseconds(3000)));
    sched.stop();
}

TEST_F(SchedulerTest, SlowDeviceDoesNotDelayOthers) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto slow = add_device(reg, "SLOW");
    auto fast = add_device(reg, "FAST");
    slow->set_latency_ms(5000);   // Times out against the 1 s budget

    AcquisitionScheduler sched(reg, bus, 1.0);
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_EQ(sched.start(100), Error::Ok);

    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "FAST", 3, milliseconds(2000)));
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_LT(elapsed, milliseconds(900));
    EXPECT_EQ(sink.count(EventType::MeasurementRecorded, "SLOW"), 0u);

    // The slow device's timeout surfaces as an error event, not a measurement
    EXPECT_TRUE(sink.wait_for(EventType::DeviceError, "SLOW", 1, milliseconds(3000)));
    sched.stop();

    // Skipped ticks for SLOW are counted, never overlapped
    EXPECT_GE(sched.get_stats().overruns, 1u);
}

TEST_F(SchedulerTest, SampleAveraging) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto inst = add_device(reg, "AVG", "DC Voltage", 4);
    inst->queue_replies({"1.0", "2.0", "3.0", "6.0"});
    inst->set_default_reply("10.0");

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(200), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "AVG", 1, milliseconds(3000)));
    sched.stop();

    auto log = store.query(std::string("AVG"));
    ASSERT_GE(log.size(), 1u);
    EXPECT_DOUBLE_EQ(log[0].value, 3.0);
}

TEST_F(SchedulerTest, NothingPublishedAfterStop) {
    InstrumentRegistry reg(transport, bus, 2.0);
    auto inst = add_device(reg, "DMM1");
    inst->set_latency_ms(300);

    AcquisitionScheduler sched(reg, bus, 2.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    // First poll is in flight
    std::this_thread::sleep_for(milliseconds(100));
    sched.stop();

    size_t at_stop = sink.events().size();
    std::this_thread::sleep_for(milliseconds(600));
    EXPECT_EQ(sink.events().size(), at_stop);
    EXPECT_GE(sched.get_stats().discarded, 1u);
}

TEST_F(SchedulerTest, PicksUpDevicesAddedWhileRunning) {
    InstrumentRegistry reg(transport, bus, 1.0);
    add_device(reg, "FIRST");

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "FIRST", 1, milliseconds(3000)));

    add_device(reg, "LATE");
    EXPECT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "LATE", 1, milliseconds(3000)));

    // Disabled devices drop out on the next tick
    DeviceConfig c;
    ASSERT_TRUE(reg.get_config("FIRST", c));
    c.enabled = false;
    reg.add_or_update(c);
    std::this_thread::sleep_for(milliseconds(200));
    size_t first_count = sink.count(EventType::MeasurementRecorded, "FIRST");
    std::this_thread::sleep_for(milliseconds(300));
    EXPECT_EQ(sink.count(EventType::MeasurementRecorded, "FIRST"), first_count);
    sched.stop();
}

TEST_F(SchedulerTest, StartWhileRunningUpdatesInterval) {
    InstrumentRegistry reg(transport, bus, 1.0);
    add_device(reg, "DMM1");

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(1000), Error::Ok);
    EXPECT_EQ(sched.start(250), Error::Ok);
    EXPECT_TRUE(sched.running());
    EXPECT_EQ(sched.interval_ms(), 250);
    EXPECT_EQ(sched.start(0), Error::ConfigError);
    sched.stop();
    EXPECT_FALSE(sched.running());
}

TEST_F(SchedulerTest, ShorterIntervalTakesEffectImmediately) {
    InstrumentRegistry reg(transport, bus, 1.0);
    add_device(reg, "DMM1");

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(5000), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "DMM1", 1, milliseconds(2000)));
    std::this_thread::sleep_for(milliseconds(200));

    // Old deadline is ~4.8 s away; the new cadence must not wait for it
    ASSERT_EQ(sched.start(100), Error::Ok);
    EXPECT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "DMM1", 6, milliseconds(1500)));
    sched.stop();
    EXPECT_GE(sched.get_stats().ticks, 6u);
}

TEST_F(SchedulerTest, AveragingHugeReadingsStaysFinite) {
    InstrumentRegistry reg(transport, bus, 1.0);
    auto inst = add_device(reg, "BIG", "DC Voltage", 3);
    inst->queue_replies({"1.7E+308", "1.7E+308", "1.7E+308"});

    AcquisitionScheduler sched(reg, bus, 1.0);
    ASSERT_EQ(sched.start(500), Error::Ok);
    ASSERT_TRUE(sink.wait_for(EventType::MeasurementRecorded, "BIG", 1, milliseconds(3000)));
    sched.stop();

    auto log = store.query(std::string("BIG"));
    ASSERT_GE(log.size(), 1u);
    EXPECT_EQ(log[0].status, MeasurementStatus::Ok);
    EXPECT_TRUE(std::isfinite(log[0].value));
    EXPECT_NEAR(log[0].value / 1.7e308, 1.0, 1e-12);
}

TEST_F(SchedulerTest, DisconnectDuringPollFailsFast) {
    InstrumentRegistry reg(transport, bus, 5.0);
    auto inst = add_device(reg, "DMM1");
    inst->set_latency_ms(4000);

    AcquisitionScheduler sched(reg, bus, 5.0);
    ASSERT_EQ(sched.start(50), Error::Ok);
    std::this_thread::sleep_for(milliseconds(100));

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(reg.disconnect("DMM1"), Error::Ok);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, milliseconds(1000));
    sched.stop();
}
