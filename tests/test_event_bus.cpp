#include "EventBus.hpp"
#include "Logger.hpp"
#include "TestSupport.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace UrSerial;
using TestSupport::check;

namespace {

ReadEvent eventOf(const std::vector<uint8_t>& bytes) {
    ReadEvent event;
    event.size = bytes.size();
    event.data = bytes;
    return event;
}

void testDelivery() {
    std::cout << "\n1. Testing delivery:" << std::endl;

    EventBus bus;
    std::vector<uint8_t> first;
    std::vector<uint8_t> second;
    auto a = bus.subscribe("plugin-serialport-read-/dev/ttyUSB0",
                           [&](const ReadEvent& e) { first = e.data; });
    auto b = bus.subscribe("plugin-serialport-read-/dev/ttyUSB0",
                           [&](const ReadEvent& e) { second = e.data; });

    check(bus.subscriberCount("plugin-serialport-read-/dev/ttyUSB0") == 2, "Two subscribers on one channel");
    check(a->channel() == "plugin-serialport-read-/dev/ttyUSB0", "Subscription reports its channel");
    check(bus.publish(readChannelName("/dev/ttyUSB0"), eventOf({1, 2, 3})) == 2, "publish reaches both");
    check(first == std::vector<uint8_t>({1, 2, 3}) && second == first, "Both handlers got the payload");
    check(bus.publish(readChannelName("/dev/ttyUSB1"), eventOf({9})) == 0, "Other channels are isolated");
}

void testCancel() {
    std::cout << "\n2. Testing cancellation:" << std::endl;

    EventBus bus;
    int count = 0;
    auto subscription = bus.subscribe("chan", [&](const ReadEvent&) { count++; });

    bus.publish("chan", eventOf({1}));
    subscription->cancel();
    subscription->cancel();
    bus.publish("chan", eventOf({1}));

    check(count == 1, "No delivery after cancel");
    check(!subscription->isActive(), "Subscription inactive");
    check(bus.subscriberCount() == 0, "Subscriber removed from the bus");

    {
        auto scoped = bus.subscribe("chan", [&](const ReadEvent&) { count++; });
        check(bus.subscriberCount("chan") == 1, "Scoped subscription registered");
    }
    check(bus.subscriberCount("chan") == 0, "Destroying a subscription cancels it");
}

void testHandlerFailure() {
    std::cout << "\n3. Testing handler failure isolation:" << std::endl;

    EventBus bus;
    int healthy = 0;
    auto failing = bus.subscribe("chan", [](const ReadEvent&) { throw std::runtime_error("boom"); });
    auto ok = bus.subscribe("chan", [&](const ReadEvent&) { healthy++; });

    check(bus.publish("chan", eventOf({1})) == 1, "Throwing handler is not counted as delivered");
    check(healthy == 1, "Other handlers still run");
    check(failing->isActive(), "Throwing handler stays subscribed");
}

void testSelfCancel() {
    std::cout << "\n4. Testing cancel from inside a handler:" << std::endl;

    EventBus bus;
    std::unique_ptr<Subscription> subscription;
    int count = 0;
    subscription = bus.subscribe("chan", [&](const ReadEvent&) {
        count++;
        subscription->cancel();
    });

    bus.publish("chan", eventOf({1}));
    bus.publish("chan", eventOf({1}));
    check(count == 1, "Handler cancelled itself without deadlock");
    check(bus.subscriberCount() == 0, "Self-cancelled subscriber removed");
}

void testCancelWaitsForDelivery() {
    std::cout << "\n5. Testing cancel during a delivery on another thread:" << std::endl;

    EventBus bus;
    std::atomic<bool> started(false);
    std::atomic<bool> finished(false);
    auto subscription = bus.subscribe("chan", [&](const ReadEvent&) {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished.store(true);
    });

    std::thread publisher([&] { bus.publish("chan", eventOf({1})); });
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    subscription->cancel();
    const bool finishedBeforeReturn = finished.load();
    publisher.join();

    check(finishedBeforeReturn, "cancel returns only after the running handler finished");
}

void testOutlivingBus() {
    std::cout << "\n6. Testing subscription outliving its bus:" << std::endl;

    std::unique_ptr<Subscription> subscription;
    {
        EventBus bus;
        subscription = bus.subscribe("chan", [](const ReadEvent&) {});
    }
    subscription->cancel();
    check(!subscription->isActive(), "Cancel after the bus is gone is harmless");
}

} // namespace

int main() {
    std::cout << "=== Testing EventBus ===" << std::endl;
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    testDelivery();
    testCancel();
    testHandlerFailure();
    testSelfCancel();
    testCancelWaitsForDelivery();
    testOutlivingBus();

    return TestSupport::finish("EventBus");
}
