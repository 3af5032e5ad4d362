#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "network/connection_pool.hpp"
#include "common/error.hpp"
#include "fake_connection.hpp"
#include "test_utils.hpp"

using namespace fdfs::network;
using fdfs::test::FakeConnection;

namespace {

// Counts closes in storage that outlives the connection itself
class CountingConnection : public FakeConnection {
public:
    CountingConnection(const std::string& address, std::atomic<int>& closes)
        : FakeConnection(address)
        , closes_(closes) {}

    void close() override {
        if (is_open()) {
            ++closes_;
        }
        FakeConnection::close();
    }

private:
    std::atomic<int>& closes_;
};

} // namespace

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
        dial_count_ = 0;
    }

    Dialer counting_dialer() {
        return [this](const std::string& address) -> std::unique_ptr<Connection> {
            ++dial_count_;
            return std::make_unique<FakeConnection>(address);
        };
    }

    std::atomic<int> dial_count_{0};
};

TEST_F(ConnectionPoolTest, DialsUpToCapacity) {
    ConnectionPool pool("127.0.0.1:22122", 2, counting_dialer());

    auto first = pool.acquire();
    auto second = pool.acquire();

    EXPECT_NE(first, nullptr);
    EXPECT_NE(second, nullptr);
    EXPECT_EQ(dial_count_.load(), 2);
    EXPECT_EQ(pool.live_count(), 2u);
    EXPECT_THROW(pool.acquire(), fdfs::PoolExhausted);

    pool.release(std::move(first));
    pool.release(std::move(second));
}

TEST_F(ConnectionPoolTest, ReleasedConnectionIsReused) {
    ConnectionPool pool("127.0.0.1:22122", 2, counting_dialer());

    auto connection = pool.acquire();
    Connection* raw = connection.get();
    pool.release(std::move(connection));
    EXPECT_EQ(pool.idle_count(), 1u);

    auto again = pool.acquire();
    EXPECT_EQ(again.get(), raw);
    EXPECT_EQ(dial_count_.load(), 1);
    pool.release(std::move(again));
}

TEST_F(ConnectionPoolTest, DiscardClosesAndFreesSlot) {
    ConnectionPool pool("127.0.0.1:22122", 1, counting_dialer());

    auto connection = pool.acquire();
    pool.discard(std::move(connection));

    EXPECT_EQ(pool.live_count(), 0u);
    EXPECT_EQ(pool.idle_count(), 0u);

    auto fresh = pool.acquire();
    EXPECT_EQ(dial_count_.load(), 2);
    pool.release(std::move(fresh));
}

TEST_F(ConnectionPoolTest, ClosedIdleConnectionIsDropped) {
    ConnectionPool pool("127.0.0.1:22122", 1, counting_dialer());

    auto connection = pool.acquire();
    Connection& ref = *connection;
    pool.release(std::move(connection));
    ref.close();

    auto fresh = pool.acquire();
    EXPECT_TRUE(fresh->is_open());
    EXPECT_EQ(dial_count_.load(), 2);
    EXPECT_EQ(pool.live_count(), 1u);
    pool.release(std::move(fresh));
}

TEST_F(ConnectionPoolTest, DialFailureFreesReservedSlot) {
    ConnectionPool pool("127.0.0.1:22122", 1, [](const std::string& address) -> std::unique_ptr<Connection> {
        throw fdfs::DialFailed(address, "connection refused");
    });

    EXPECT_THROW(pool.acquire(), fdfs::DialFailed);
    EXPECT_EQ(pool.live_count(), 0u);
    EXPECT_THROW(pool.acquire(), fdfs::DialFailed);
}

TEST_F(ConnectionPoolTest, ForeignDialerErrorsBecomeDialFailed) {
    ConnectionPool pool("127.0.0.1:22122", 1, [](const std::string&) -> std::unique_ptr<Connection> {
        throw std::runtime_error("resolver exploded");
    });

    EXPECT_THROW(pool.acquire(), fdfs::DialFailed);
    EXPECT_EQ(pool.live_count(), 0u);
}

TEST_F(ConnectionPoolTest, DestroyClosesIdleAndRefusesAcquire) {
    std::atomic<int> closes{0};
    ConnectionPool pool("127.0.0.1:22122", 2, [&closes](const std::string& address) -> std::unique_ptr<Connection> {
        return std::make_unique<CountingConnection>(address, closes);
    });

    auto idle = pool.acquire();
    auto lent = pool.acquire();
    pool.release(std::move(idle));

    pool.destroy();
    EXPECT_EQ(closes.load(), 1);
    EXPECT_EQ(pool.idle_count(), 0u);
    EXPECT_THROW(pool.acquire(), fdfs::PoolExhausted);

    // Connections coming back after teardown are closed, not kept
    pool.release(std::move(lent));
    EXPECT_EQ(closes.load(), 2);
    EXPECT_EQ(pool.live_count(), 0u);
}

TEST_F(ConnectionPoolTest, InvalidConstructionIsConfigError) {
    EXPECT_THROW(ConnectionPool("127.0.0.1:22122", 0, counting_dialer()), fdfs::ConfigError);
    EXPECT_THROW(ConnectionPool("no-port", 1, counting_dialer()), fdfs::ConfigError);
    EXPECT_THROW(ConnectionPool("host:99999", 1, counting_dialer()), fdfs::ConfigError);
}

TEST_F(ConnectionPoolTest, PooledConnectionDiscardsUnlessReleased) {
    ConnectionPool pool("127.0.0.1:22122", 1, counting_dialer());

    {
        PooledConnection lease(pool, pool.acquire());
        EXPECT_TRUE(lease->is_open());
    }
    EXPECT_EQ(pool.live_count(), 0u);
    EXPECT_EQ(pool.idle_count(), 0u);

    {
        PooledConnection lease(pool, pool.acquire());
        lease.release();
    }
    EXPECT_EQ(pool.live_count(), 1u);
    EXPECT_EQ(pool.idle_count(), 1u);
}

// Concurrent borrowers never push the pool past its capacity
TEST_F(ConnectionPoolTest, ConcurrentAcquireRespectsCapacity) {
    const std::size_t capacity = 4;
    const int num_threads = 16;
    const int operations_per_thread = 50;
    ConnectionPool pool("127.0.0.1:22122", capacity, counting_dialer());

    std::atomic<int> outstanding{0};
    std::atomic<int> max_outstanding{0};
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < operations_per_thread; ++j) {
                try {
                    auto connection = pool.acquire();
                    int now = ++outstanding;
                    int seen = max_outstanding.load();
                    while (now > seen && !max_outstanding.compare_exchange_weak(seen, now)) {
                    }
                    EXPECT_LE(pool.live_count(), capacity);
                    std::this_thread::sleep_for(std::chrono::microseconds(100));
                    --outstanding;
                    ++successes;
                    pool.release(std::move(connection));
                } catch (const fdfs::PoolExhausted&) {
                    std::this_thread::yield();
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_GT(successes.load(), 0);
    EXPECT_LE(max_outstanding.load(), static_cast<int>(capacity));
    EXPECT_LE(dial_count_.load(), static_cast<int>(capacity));
    EXPECT_LE(pool.live_count(), capacity);
}
