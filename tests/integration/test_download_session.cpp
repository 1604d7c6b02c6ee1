#include <gtest/gtest.h>

#include "DownloadSession.h"
#include "FakeServer.h"
#include "LocalFileAccess.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <streambuf>
#include <thread>

using namespace ChatStorage;
using ChatStorage::test_support::FakePeer;
using ChatStorage::test_support::FakeServer;

namespace {

struct DownloadRequest {
    std::mutex mutex;
    Json::Value meta;
    Json::Value ready;
};

// Forwards to another stream, sleeping on every write to imitate a slow disk
class ThrottledBuffer : public std::streambuf {
public:
    ThrottledBuffer(std::unique_ptr<std::ostream> inner, std::chrono::milliseconds delay)
        : inner_(std::move(inner)), delay_(delay) {}

protected:
    std::streamsize xsputn(const char* data, std::streamsize count) override {
        std::this_thread::sleep_for(delay_);
        inner_->write(data, count);
        return inner_->good() ? count : 0;
    }
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        inner_->put(traits_type::to_char_type(ch));
        return inner_->good() ? ch : traits_type::eof();
    }
    int sync() override {
        inner_->flush();
        return inner_->good() ? 0 : -1;
    }

private:
    std::unique_ptr<std::ostream> inner_;
    std::chrono::milliseconds delay_;
};

class ThrottledStream : public std::ostream {
public:
    ThrottledStream(std::unique_ptr<std::ostream> inner, std::chrono::milliseconds delay)
        : std::ostream(nullptr), buffer_(std::move(inner), delay) {
        rdbuf(&buffer_);
    }

private:
    ThrottledBuffer buffer_;
};

class SlowDiskFileAccess : public LocalFileAccess {
public:
    Result<std::unique_ptr<std::ostream>> openForWriteAt(const std::string& path, uint64_t offset) override {
        auto out = LocalFileAccess::openForWriteAt(path, offset);
        if (!out) {
            return out.error();
        }
        return std::unique_ptr<std::ostream>(
            std::make_unique<ThrottledStream>(std::move(out.value()), std::chrono::milliseconds(5)));
    }
};

class DownloadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::ERROR);
        dir_ = std::filesystem::temp_directory_path() /
               ("chatstorage_download_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        remote_.resize(200000);
        for (std::size_t i = 0; i < remote_.size(); ++i) {
            remote_[i] = static_cast<char>((i * 131) % 251);
        }
        target_ = (dir_ / "fetched.bin").string();

        options_.requestTimeoutMs = 2000;
        options_.idleTimeoutMs = 2000;
        options_.progressIntervalMs = 0;
        options_.writeHighWater = 16 * 1024;
        options_.writeLowWater = 4 * 1024;

        connOptions_.name = "download-test";
        connOptions_.heartbeatIntervalMs = 0;
        connOptions_.maxReconnectAttempts = 0;
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::INFO);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    // Answers one download request the way the download endpoint does
    FakeServer::Handler serve(DownloadRequest& seen, std::size_t chunk = 8192) {
        return [this, &seen, chunk](FakePeer& peer) {
            auto request = peer.expect(FrameType::Meta);
            if (!request) return;
            Json::Value meta = parseEnvelope(*request)->raw;
            {
                std::lock_guard<std::mutex> lock(seen.mutex);
                seen.meta = meta;
            }
            peer.sendJson(FrameType::Meta, "{\"fileSize\":" + std::to_string(remote_.size()) + "}");

            auto ready = peer.expect(FrameType::Ack);
            if (!ready) return;
            {
                std::lock_guard<std::mutex> lock(seen.mutex);
                seen.ready = parseEnvelope(*ready)->raw;
            }

            std::size_t offset = static_cast<std::size_t>(jsonInt64(meta["startOffset"]));
            while (offset < remote_.size()) {
                std::size_t n = std::min(chunk, remote_.size() - offset);
                peer.send(Frame::fromString(FrameType::Data, remote_.substr(offset, n)));
                offset += n;
            }
            peer.sendJson(FrameType::End, "{}");
            peer.readFrame(std::chrono::milliseconds(500));
        };
    }

    VoidResult runDownload(FakeServer& server, TransferTask& task, std::atomic<bool>& cancelled,
                           IFileAccess* files = nullptr) {
        Connection connection(connOptions_);
        VoidResult result = Ok();
        {
            Correlator correlator(connection);
            auto connected = connection.connect("127.0.0.1", server.port());
            if (!connected) {
                return connected;
            }
            DownloadSession session(correlator, files ? *files : files_, options_);
            result = session.run(task, cancelled, nullptr);
            connection.disconnect();
        }
        return result;
    }

    std::string readTarget() {
        std::ifstream in(target_, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
    std::string remote_;
    std::string target_;
    LocalFileAccess files_;
    TransferOptions options_;
    ConnectionOptions connOptions_;
};

} // namespace

TEST_F(DownloadSessionTest, FullDownloadThroughSmallWriteQueue) {
    DownloadRequest seen;
    FakeServer server(serve(seen));

    SlowDiskFileAccess slowDisk;
    const uint64_t pausesBefore = MetricsCollector::instance().getTransferMetrics().backpressurePauses;

    TransferTask task = TransferTask::makeDownload(77, "fetched.bin", target_, 0, 3);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled, &slowDisk);
    ASSERT_TRUE(result.ok()) << result.error().toString();

    EXPECT_GT(MetricsCollector::instance().getTransferMetrics().backpressurePauses, pausesBefore);
    EXPECT_EQ(readTarget(), remote_);
    EXPECT_EQ(task.totalSize, remote_.size());
    EXPECT_EQ(task.transferredBytes, remote_.size());

    std::lock_guard<std::mutex> lock(seen.mutex);
    EXPECT_EQ(jsonInt64(seen.meta["fileId"]), 77);
    EXPECT_EQ(seen.meta["taskId"].asString(), task.taskId);
    EXPECT_EQ(jsonInt64(seen.meta["startOffset"]), 0);
    EXPECT_EQ(seen.ready["status"].asString(), "ready");
    EXPECT_EQ(seen.ready["taskId"].asString(), task.taskId);
}

TEST_F(DownloadSessionTest, ResumesFromPartialFileOnDisk) {
    std::ofstream(target_, std::ios::binary) << remote_.substr(0, 60000);

    DownloadRequest seen;
    FakeServer server(serve(seen));

    TransferTask task = TransferTask::makeDownload(77, "fetched.bin", target_, remote_.size(), 3);
    task.setTransferred(1000);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled);
    ASSERT_TRUE(result.ok()) << result.error().toString();

    EXPECT_EQ(readTarget(), remote_);
    std::lock_guard<std::mutex> lock(seen.mutex);
    EXPECT_EQ(jsonInt64(seen.meta["startOffset"]), 60000);
}

TEST_F(DownloadSessionTest, OversizedPartialFileRestarts) {
    std::ofstream(target_, std::ios::binary) << remote_ << "trailing garbage";

    DownloadRequest seen;
    FakeServer server(serve(seen));

    TransferTask task = TransferTask::makeDownload(77, "fetched.bin", target_, remote_.size(), 3);
    std::atomic<bool> cancelled{false};
    ASSERT_TRUE(runDownload(server, task, cancelled).ok());
    EXPECT_EQ(readTarget(), remote_);
    std::lock_guard<std::mutex> lock(seen.mutex);
    EXPECT_EQ(jsonInt64(seen.meta["startOffset"]), 0);
}

TEST_F(DownloadSessionTest, ErrorResponseFailsDownload) {
    FakeServer server([](FakePeer& peer) {
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::FileResponse, "{\"code\":404,\"msg\":\"file not found\"}");
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeDownload(5, "x.bin", target_, 0, 3);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ServerError);
    EXPECT_EQ(result.error().serverCode, 404);
}

TEST_F(DownloadSessionTest, ShortStreamIsRejected) {
    FakeServer server([this](FakePeer& peer) {
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::Meta, "{\"fileSize\":" + std::to_string(remote_.size()) + "}");
        if (!peer.expect(FrameType::Ack)) return;
        peer.send(Frame::fromString(FrameType::Data, remote_.substr(0, 1000)));
        peer.sendJson(FrameType::End, "{}");
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeDownload(5, "x.bin", target_, 0, 3);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidResponse);
}

TEST_F(DownloadSessionTest, SilentServerTimesOut) {
    options_.idleTimeoutMs = 300;
    FakeServer server([this](FakePeer& peer) {
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::Meta, "{\"fileSize\":" + std::to_string(remote_.size()) + "}");
        peer.expect(FrameType::Ack);
        peer.readFrame(std::chrono::milliseconds(2000));
    });

    TransferTask task = TransferTask::makeDownload(5, "x.bin", target_, 0, 3);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
}

TEST_F(DownloadSessionTest, DroppedConnectionIsConnectionLost) {
    FakeServer server([this](FakePeer& peer) {
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::Meta, "{\"fileSize\":" + std::to_string(remote_.size()) + "}");
        if (!peer.expect(FrameType::Ack)) return;
        peer.send(Frame::fromString(FrameType::Data, remote_.substr(0, 5000)));
        peer.close();
    });

    TransferTask task = TransferTask::makeDownload(5, "x.bin", target_, 0, 3);
    std::atomic<bool> cancelled{false};
    auto result = runDownload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ConnectionLost);
}

TEST_F(DownloadSessionTest, CancelKeepsPartialFile) {
    std::atomic<bool> cancelled{false};
    FakeServer server([this, &cancelled](FakePeer& peer) {
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::Meta, "{\"fileSize\":" + std::to_string(remote_.size()) + "}");
        if (!peer.expect(FrameType::Ack)) return;
        peer.send(Frame::fromString(FrameType::Data, remote_.substr(0, 4000)));
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancelled = true;
        peer.readFrame(std::chrono::milliseconds(1000));
    });

    TransferTask task = TransferTask::makeDownload(5, "x.bin", target_, 0, 3);
    auto result = runDownload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(readTarget(), remote_.substr(0, 4000));
}
