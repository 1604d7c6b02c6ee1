#include <gtest/gtest.h>

#include "WriteQueue.h"

#include <condition_variable>
#include <future>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <thread>

using namespace ChatStorage;

namespace {

// Output buffer whose writes block until the gate is opened
class GatedBuffer : public std::streambuf {
public:
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    std::string contents() {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_;
    }

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return open_; });
        data_.append(s, static_cast<std::size_t>(n));
        return n;
    }

    int_type overflow(int_type c) override {
        if (traits_type::eq_int_type(c, traits_type::eof())) {
            return traits_type::not_eof(c);
        }
        char ch = traits_type::to_char_type(c);
        return xsputn(&ch, 1) == 1 ? c : traits_type::eof();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
    std::string data_;
};

// Output buffer that rejects every write
class BrokenBuffer : public std::streambuf {
protected:
    std::streamsize xsputn(const char*, std::streamsize) override { return 0; }
    int_type overflow(int_type) override { return traits_type::eof(); }
};

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

template <typename Pred>
bool eventually(Pred pred, int timeoutMs = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST(WriteQueueTest, WritesChunksInOrder) {
    auto stream = std::make_unique<std::ostringstream>();
    std::ostringstream* raw = stream.get();
    WriteQueue queue(std::move(stream), 1024, 256, "ordered");
    std::atomic<bool> cancelled{false};

    ASSERT_TRUE(queue.enqueue(bytes("alpha-"), cancelled).ok());
    ASSERT_TRUE(queue.enqueue(bytes("beta-"), cancelled).ok());
    ASSERT_TRUE(queue.enqueue(bytes("gamma"), cancelled).ok());
    ASSERT_TRUE(queue.flush(std::chrono::milliseconds(2000)).ok());

    EXPECT_EQ(raw->str(), "alpha-beta-gamma");
    EXPECT_EQ(queue.writtenBytes(), 16u);
    EXPECT_EQ(queue.pendingBytes(), 0u);
}

TEST(WriteQueueTest, PausesAtHighWaterAndResumesAtLowWater) {
    GatedBuffer gate;
    WriteQueue queue(std::make_unique<std::ostream>(&gate), 10, 4, "gated");
    std::atomic<bool> cancelled{false};

    ASSERT_TRUE(queue.enqueue(bytes("123456"), cancelled).ok());
    ASSERT_TRUE(queue.enqueue(bytes("7890ab"), cancelled).ok());
    EXPECT_TRUE(queue.intakePaused());

    auto blocked = std::async(std::launch::async, [&]() { return queue.enqueue(bytes("cd"), cancelled); });
    EXPECT_EQ(blocked.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);

    gate.open();
    auto resumed = blocked.get();
    EXPECT_TRUE(resumed.ok());
    ASSERT_TRUE(queue.flush(std::chrono::milliseconds(2000)).ok());
    EXPECT_FALSE(queue.intakePaused());
    EXPECT_EQ(gate.contents(), "1234567890abcd");
}

TEST(WriteQueueTest, CancelReleasesBlockedProducer) {
    GatedBuffer gate;
    WriteQueue queue(std::make_unique<std::ostream>(&gate), 4, 1, "cancel");
    std::atomic<bool> cancelled{false};

    ASSERT_TRUE(queue.enqueue(bytes("abcd"), cancelled).ok());
    ASSERT_TRUE(queue.intakePaused());

    auto blocked = std::async(std::launch::async, [&]() { return queue.enqueue(bytes("ef"), cancelled); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancelled = true;

    auto result = blocked.get();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);

    gate.open();
    queue.close();
}

TEST(WriteQueueTest, FlushTimesOutWhileWriterIsStuck) {
    GatedBuffer gate;
    WriteQueue queue(std::make_unique<std::ostream>(&gate), 1024, 256, "stuck");
    std::atomic<bool> cancelled{false};

    ASSERT_TRUE(queue.enqueue(bytes("payload"), cancelled).ok());
    auto flushed = queue.flush(std::chrono::milliseconds(150));
    ASSERT_FALSE(flushed.ok());
    EXPECT_EQ(flushed.error().code, ErrorCode::Timeout);

    gate.open();
    EXPECT_TRUE(queue.flush(std::chrono::milliseconds(2000)).ok());
}

TEST(WriteQueueTest, WriteFailureIsReported) {
    BrokenBuffer broken;
    WriteQueue queue(std::make_unique<std::ostream>(&broken), 1024, 256, "broken");
    std::atomic<bool> cancelled{false};

    ASSERT_TRUE(queue.enqueue(bytes("lost"), cancelled).ok());
    auto flushed = queue.flush(std::chrono::milliseconds(2000));
    ASSERT_FALSE(flushed.ok());
    EXPECT_EQ(flushed.error().code, ErrorCode::FileIOError);

    ASSERT_TRUE(eventually([&]() { return !queue.enqueue(bytes("more"), cancelled).ok(); }));
}

TEST(WriteQueueTest, EnqueueAfterCloseIsRejected) {
    WriteQueue queue(std::make_unique<std::ostringstream>(), 1024, 256, "closed");
    std::atomic<bool> cancelled{false};
    queue.close();
    queue.close();

    auto result = queue.enqueue(bytes("late"), cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
}
