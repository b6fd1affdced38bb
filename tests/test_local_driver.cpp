#include "EventBus.hpp"
#include "LocalDriver.hpp"
#include "Logger.hpp"
#include "SerialSession.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <limits>
#include <mutex>
#include <poll.h>
#include <thread>
#include <unistd.h>

using namespace UrSerial;
using TestSupport::check;

namespace {

// Master side of a pseudo terminal; the slave path stands in for a serial device
class PseudoTerminal {
public:
    PseudoTerminal() {
        master_ = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0 || grantpt(master_) != 0 || unlockpt(master_) != 0) {
            throw std::runtime_error("Failed to allocate a pseudo terminal");
        }
        const char* name = ptsname(master_);
        if (name == nullptr) {
            throw std::runtime_error("Failed to resolve the pseudo terminal slave");
        }
        slavePath_ = name;
    }

    ~PseudoTerminal() {
        if (master_ >= 0) {
            ::close(master_);
        }
    }

    const std::string& slavePath() const { return slavePath_; }

    void send(const std::string& data) {
        if (::write(master_, data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
            throw std::runtime_error("Failed to write to the pseudo terminal");
        }
    }

    std::string receive(std::size_t expected, int timeoutMs = 2000) {
        std::string result;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (result.size() < expected && std::chrono::steady_clock::now() < deadline) {
            struct pollfd pfd = {master_, POLLIN, 0};
            if (poll(&pfd, 1, 50) > 0 && (pfd.revents & POLLIN)) {
                char buffer[256];
                ssize_t n = ::read(master_, buffer, sizeof(buffer));
                if (n > 0) {
                    result.append(buffer, static_cast<std::size_t>(n));
                }
            }
        }
        return result;
    }

private:
    int master_ = -1;
    std::string slavePath_;
};

// Collects read events delivered on the reader thread
class EventSink {
public:
    void add(const ReadEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        text_.append(event.data.begin(), event.data.begin() + event.size);
    }

    std::string text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

    bool waitFor(const std::string& expected, int timeoutMs = 2000) const {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (std::chrono::steady_clock::now() < deadline) {
            if (text() == expected) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return text() == expected;
    }

private:
    mutable std::mutex mutex_;
    std::string text_;
};

int remoteCode(std::future<json> future) {
    try {
        future.get();
    } catch (const RemoteError& e) {
        return e.code();
    }
    return 0;
}

json openParams(const std::string& path) {
    return {
        {"path", path},
        {"baudRate", 9600},
        {"dataBits", 8},
        {"flowControl", nullptr},
        {"parity", nullptr},
        {"stopBits", 1},
        {"timeout", 50}
    };
}

void testCommandErrors(LocalDriver& driver) {
    std::cout << "\n1. Testing command errors:" << std::endl;

    check(remoteCode(driver.call("reboot")) == ErrorCode::kMethodNotFound, "Unknown command rejected");
    check(remoteCode(driver.call(Commands::kOpen, {{"baudRate", 9600}})) == ErrorCode::kInvalidParams,
          "open without a path rejected");
    check(remoteCode(driver.call(Commands::kOpen, openParams("/dev/does-not-exist"))) == ErrorCode::kOpenFailed,
          "Missing device fails to open");
    check(remoteCode(driver.call(Commands::kClose, {{"path", "/dev/does-not-exist"}})) == ErrorCode::kPortNotOpened,
          "close of a port never opened");
    check(remoteCode(driver.call(Commands::kRead, {{"path", "/dev/does-not-exist"}})) == ErrorCode::kPortNotFound,
          "read of a port never opened");
    check(remoteCode(driver.call(Commands::kCancelRead, {{"path", "/dev/does-not-exist"}})) == ErrorCode::kPortNotFound,
          "cancel_read of a port never opened");
    check(remoteCode(driver.call(Commands::kForceClose, {{"path", "/dev/does-not-exist"}})) == 0,
          "force_close of a port never opened succeeds");
}

void testOpenWriteClose(LocalDriver& driver, PseudoTerminal& pty) {
    std::cout << "\n2. Testing open, write and close:" << std::endl;
    const std::string path = pty.slavePath();

    check(remoteCode(driver.call(Commands::kOpen, openParams(path))) == 0, "Pseudo terminal opened");
    check(driver.openPorts() == std::vector<std::string>({path}), "Port tracked as open");
    check(remoteCode(driver.call(Commands::kOpen, openParams(path))) == ErrorCode::kPortAlreadyOpen,
          "Second open rejected");

    check(driver.call(Commands::kWrite, {{"path", path}, {"value", "hi"}}).get() == 2, "write returns byte count");
    check(pty.receive(2) == "hi", "Text reached the device");

    check(driver.call(Commands::kWriteBinary, {{"path", path}, {"value", {0x41, 0x00, 0xff}}}).get() == 3,
          "write_binary returns byte count");
    check(pty.receive(3) == std::string("A\0\xff", 3), "Bytes reached the device");
    check(remoteCode(driver.call(Commands::kWriteBinary, {{"path", path}, {"value", {1, 256}}})) ==
          ErrorCode::kInvalidParams, "Out of range byte rejected");

    check(remoteCode(driver.call(Commands::kClose, {{"path", path}})) == 0, "close succeeds");
    check(driver.openPorts().empty(), "Port released");
    check(remoteCode(driver.call(Commands::kClose, {{"path", path}})) == ErrorCode::kPortNotOpened,
          "Second close rejected");
    check(remoteCode(driver.call(Commands::kWrite, {{"path", path}, {"value", "x"}})) == ErrorCode::kPortNotFound,
          "write after close rejected");
}

void testReadLoop(LocalDriver& driver, EventBus& bus, PseudoTerminal& pty) {
    std::cout << "\n3. Testing the read loop:" << std::endl;
    const std::string path = pty.slavePath();

    EventSink sink;
    auto subscription = bus.subscribe(readChannelName(path), [&](const ReadEvent& e) { sink.add(e); });

    driver.call(Commands::kOpen, openParams(path)).get();

    const uint64_t hugeSize = std::numeric_limits<uint64_t>::max();
    check(remoteCode(driver.call(Commands::kRead, {{"path", path}, {"size", hugeSize}})) ==
          ErrorCode::kInvalidParams, "read with a maximal chunk size rejected");
    check(remoteCode(driver.call(Commands::kRead, {{"path", path}, {"size", uint64_t(1) << 40}})) ==
          ErrorCode::kInvalidParams, "read with an oversized chunk size rejected");
    check(remoteCode(driver.call(Commands::kRead, {{"path", path}, {"timeout", uint64_t(1) << 32}})) ==
          ErrorCode::kInvalidParams, "read with a timeout beyond the int range rejected");
    check(remoteCode(driver.call(Commands::kRead, {{"path", path}, {"timeout", -5}})) ==
          ErrorCode::kInvalidParams, "read with a negative timeout rejected");
    check(!driver.isReading(path), "Rejected reads start no reader");

    driver.call(Commands::kRead, {{"path", path}, {"timeout", 50}, {"size", 64}}).get();
    check(driver.isReading(path), "Reader started");
    check(remoteCode(driver.call(Commands::kRead, {{"path", path}})) == 0, "Second read is acknowledged");

    pty.send("hello");
    check(sink.waitFor("hello"), "Received data published on the read channel");

    driver.call(Commands::kCancelRead, {{"path", path}}).get();
    check(!driver.isReading(path), "Reader stopped by cancel_read");
    check(remoteCode(driver.call(Commands::kCancelRead, {{"path", path}})) == 0, "cancel_read without a reader is fine");

    pty.send("late");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    check(sink.text() == "hello", "No events after cancel_read");

    driver.call(Commands::kRead, {{"path", path}}).get();
    driver.call(Commands::kForceClose, {{"path", path}}).get();
    check(driver.openPorts().empty() && !driver.isReading(path), "force_close stops the reader and releases the port");
}

void testCloseAll(LocalDriver& driver, PseudoTerminal& first, PseudoTerminal& second) {
    std::cout << "\n4. Testing close_all:" << std::endl;

    driver.call(Commands::kOpen, openParams(first.slavePath())).get();
    driver.call(Commands::kOpen, openParams(second.slavePath())).get();
    driver.call(Commands::kRead, {{"path", first.slavePath()}}).get();
    check(driver.openPorts().size() == 2, "Two ports open");

    driver.call(Commands::kCloseAll).get();
    check(driver.openPorts().empty(), "close_all released every port");
}

void testAvailablePorts(LocalDriver& driver) {
    std::cout << "\n5. Testing available_ports:" << std::endl;

    // Without a usable udev the driver reports an I/O failure instead of an empty list
    json ports;
    int code = 0;
    try {
        ports = driver.call(Commands::kAvailablePorts).get();
    } catch (const RemoteError& e) {
        code = e.code();
    }

    if (code != 0) {
        check(code == ErrorCode::kIoFailure, "Enumeration failure reported as an I/O failure");
        return;
    }
    check(ports.is_array(), "available_ports returns a list");
    std::vector<std::string> names = ports.get<std::vector<std::string>>();
    check(std::is_sorted(names.begin(), names.end()), "Port names are sorted");
}

void testSessionOverDriver(LocalDriver& driver, EventBus& bus, PseudoTerminal& pty) {
    std::cout << "\n6. Testing a session over the local driver:" << std::endl;

    SerialportOptions options;
    options.path = pty.slavePath();
    options.baudRate = 9600;
    SerialSession session(options, driver, bus);

    std::mutex mutex;
    std::string received;
    session.open();

    ReadOptions oversized;
    oversized.size = std::numeric_limits<std::size_t>::max();
    bool rejected = false;
    try {
        session.read(oversized);
    } catch (const RemoteError& e) {
        rejected = e.code() == ErrorCode::kInvalidParams;
    }
    check(rejected && !driver.isReading(pty.slavePath()), "Session read with an oversized chunk fails cleanly");

    session.listen([&](const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        received += text;
    });
    session.read();

    check(session.write("ping") == 4, "Session write accepted");
    check(pty.receive(4) == "ping", "Session write reached the device");

    pty.send("pong");
    bool gotReply = false;
    for (int i = 0; i < 200 && !gotReply; ++i) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gotReply = received == "pong";
        }
        if (!gotReply) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    check(gotReply, "Session listener received the device reply");

    session.close();
    check(!session.isOpen() && driver.openPorts().empty(), "Session close released the port");
    check(bus.subscriberCount() == 0, "Session close released the listener");

    SerialportOptions missing = options;
    missing.path = "/dev/does-not-exist";
    SerialSession failing(missing, driver, bus);
    bool openFailed = false;
    try {
        failing.open();
    } catch (const RemoteError& e) {
        openFailed = e.code() == ErrorCode::kOpenFailed;
    }
    check(openFailed && !failing.isOpen(), "Driver open failure surfaces through the session");
}

} // namespace

int main() {
    std::cout << "=== Testing LocalDriver ===" << std::endl;
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    try {
        EventBus bus;
        LocalDriver driver(bus);
        PseudoTerminal first;
        PseudoTerminal second;

        testCommandErrors(driver);
        testOpenWriteClose(driver, first);
        testReadLoop(driver, bus, first);
        testCloseAll(driver, first, second);
        testAvailablePorts(driver);
        testSessionOverDriver(driver, bus, second);
    } catch (const std::exception& e) {
        std::cout << "✗ Unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    return TestSupport::finish("LocalDriver");
}
