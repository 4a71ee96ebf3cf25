#include "acquisition/events.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace benchlog;
using benchlog::fake::RecordingSink;

TEST(Events, TypeNames) {
    EXPECT_STREQ(event_type_name(EventType::MeasurementRecorded), "measurement");
    EXPECT_STREQ(event_type_name(EventType::DeviceError), "error");
    EXPECT_STREQ(event_type_name(EventType::DeviceConnected), "connected");
    EXPECT_STREQ(event_type_name(EventType::DeviceDisconnected), "disconnected");
}

TEST(Events, MeasurementEventCarriesDeviceAndTime) {
    Measurement m;
    m.timestamp = now_timestamp();
    m.device_name = "DMM1";
    m.function = "DC Voltage";
    m.value = 1.5;
    m.unit = "V";

    Event e = make_measurement_event(m);
    EXPECT_EQ(e.type, EventType::MeasurementRecorded);
    EXPECT_EQ(e.device_name, "DMM1");
    EXPECT_EQ(e.timestamp, m.timestamp);
    EXPECT_DOUBLE_EQ(e.measurement.value, 1.5);

    Event d = make_device_event(EventType::DeviceError, "DMM2", "timeout");
    EXPECT_EQ(d.type, EventType::DeviceError);
    EXPECT_EQ(d.device_name, "DMM2");
    EXPECT_EQ(d.message, "timeout");
}

TEST(EventBus, FansOutToAllSinks) {
    EventBus bus;
    RecordingSink a, b;
    bus.subscribe(&a);
    bus.subscribe(&b);
    bus.subscribe(&a);   // Duplicate subscribe is ignored
    EXPECT_EQ(bus.subscriber_count(), 2u);

    bus.publish(make_device_event(EventType::DeviceConnected, "DMM1", "id"));
    EXPECT_EQ(a.events().size(), 1u);
    EXPECT_EQ(b.events().size(), 1u);

    bus.unsubscribe(&a);
    bus.publish(make_device_event(EventType::DeviceDisconnected, "DMM1", ""));
    EXPECT_EQ(a.events().size(), 1u);
    EXPECT_EQ(b.events().size(), 2u);

    bus.unsubscribe(&a);   // Not subscribed: no-op
    bus.unsubscribe(&b);
    EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST(EventBus, ConcurrentPublishers) {
    EventBus bus;
    RecordingSink sink;
    bus.subscribe(&sink);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bus, t] {
            for (int i = 0; i < 250; ++i) {
                bus.publish(make_device_event(EventType::DeviceError,
                                              "DMM" + std::to_string(t), "x"));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(sink.events().size(), 1000u);
    EXPECT_EQ(sink.count(EventType::DeviceError, "DMM3"), 250u);
    bus.unsubscribe(&sink);
}

TEST(ConsoleEventLog, HandlesEveryType) {
    ConsoleEventLog log(true);
    Measurement m;
    m.device_name = "DMM1";
    m.function = "DC Voltage";
    m.unit = "V";
    log.on_event(make_measurement_event(m));
    m.status = MeasurementStatus::Error;
    log.on_event(make_measurement_event(m));
    log.on_event(make_device_event(EventType::DeviceError, "DMM1", "timeout"));
    log.on_event(make_device_event(EventType::DeviceConnected, "DMM1", "ID"));
    log.on_event(make_device_event(EventType::DeviceDisconnected, "DMM1", ""));
}
