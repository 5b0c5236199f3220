#include <gtest/gtest.h>
#include "citadel/transport/stdio_transport.hpp"
#include "citadel/codec.hpp"
#include "citadel/error.hpp"
#include <unistd.h>
#include <condition_variable>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace citadel;
using namespace std::chrono_literals;

namespace {

// Two transports wired back to back through a pair of pipes.
class TransportPair {
public:
    TransportPair() {
        if (::pipe(a_to_b_) < 0 || ::pipe(b_to_a_) < 0) {
            throw std::runtime_error("pipe failed");
        }
        a_ = std::make_unique<StdioTransport>(b_to_a_[0], a_to_b_[1]);
        b_ = std::make_unique<StdioTransport>(a_to_b_[0], b_to_a_[1]);
    }

    StdioTransport& a() { return *a_; }
    StdioTransport& b() { return *b_; }

private:
    int a_to_b_[2];
    int b_to_a_[2];
    std::unique_ptr<StdioTransport> a_;
    std::unique_ptr<StdioTransport> b_;
};

struct Inbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Envelope> envelopes;
    int errors = 0;

    MessageCallback on_message() {
        return [this](Envelope env) {
            std::lock_guard<std::mutex> lock(mutex);
            envelopes.push_back(std::move(env));
            cv.notify_all();
        };
    }

    ErrorCallback on_error() {
        return [this](std::exception_ptr) {
            std::lock_guard<std::mutex> lock(mutex);
            ++errors;
            cv.notify_all();
        };
    }

    bool wait(size_t n) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 2s, [&] { return envelopes.size() >= n; });
    }
};

} // anonymous namespace

TEST(StdioTransport, SendAndReceive) {
    TransportPair pair;
    Inbox inbox;

    std::thread b_thread([&] { pair.b().start(inbox.on_message()); });
    std::thread a_thread([&] { pair.a().start([](Envelope) {}); });
    for (int i = 0; i < 200 && !pair.a().is_connected(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(pair.a().is_connected());

    pair.a().send(Request{RequestId{int64_t{1}}, "ping", std::nullopt});
    pair.a().send(Notification{"notifications/initialized", std::nullopt});
    ASSERT_TRUE(inbox.wait(2));

    EXPECT_EQ(std::get<Request>(inbox.envelopes[0]).method, "ping");
    EXPECT_EQ(std::get<Notification>(inbox.envelopes[1]).method, "notifications/initialized");

    pair.a().shutdown();
    pair.b().shutdown();
    a_thread.join();
    b_thread.join();
}

TEST(StdioTransport, MalformedLineIsReportedAndSkipped) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    int sink[2];
    ASSERT_EQ(::pipe(sink), 0);
    StdioTransport t(fds[0], sink[1]);
    Inbox inbox;

    std::thread reader([&] { t.start(inbox.on_message(), inbox.on_error()); });

    std::string data = "not json\n{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}\n";
    ASSERT_EQ(::write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    ASSERT_TRUE(inbox.wait(1));
    EXPECT_EQ(inbox.errors, 1);
    EXPECT_TRUE(std::holds_alternative<Response>(inbox.envelopes[0]));

    t.shutdown();
    reader.join();
    ::close(fds[1]);
    ::close(sink[0]);
}

TEST(StdioTransport, EndOfStreamEndsStart) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    int sink[2];
    ASSERT_EQ(::pipe(sink), 0);
    StdioTransport t(fds[0], sink[1]);

    std::thread reader([&] { t.start([](Envelope) {}); });
    ::close(fds[1]);
    reader.join();
    EXPECT_FALSE(t.is_connected());
    ::close(sink[0]);
}

TEST(StdioTransport, SendAfterShutdownThrows) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StdioTransport t(fds[0], fds[1]);
    EXPECT_FALSE(t.is_connected());
    t.shutdown();
    EXPECT_THROW(t.send(Notification{"x", std::nullopt}), TransportError);
}
