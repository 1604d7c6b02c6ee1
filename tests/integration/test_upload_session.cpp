#include <gtest/gtest.h>

#include "FakeServer.h"
#include "Fingerprint.h"
#include "LocalFileAccess.h"
#include "Logger.h"
#include "UploadSession.h"

#include <filesystem>
#include <fstream>
#include <map>

using namespace ChatStorage;
using ChatStorage::test_support::FakePeer;
using ChatStorage::test_support::FakeServer;

namespace {

// What the fake upload endpoint saw
struct UploadLog {
    std::mutex mutex;
    Json::Value resumeCheck;
    Json::Value meta;
    Json::Value end;
    std::string data;
    int dataFrames{0};
};

Json::Value parseBody(const Frame& frame) {
    auto envelope = parseEnvelope(frame);
    return envelope ? envelope->raw : Json::Value();
}

// Receives Data frames until End; returns the End frame
std::optional<Frame> collectData(FakePeer& peer, UploadLog& log) {
    while (auto frame = peer.readFrame()) {
        if (frame->type == FrameType::Data) {
            std::lock_guard<std::mutex> lock(log.mutex);
            log.data.append(frame->payload.begin(), frame->payload.end());
            log.dataFrames++;
        } else if (frame->type == FrameType::End) {
            std::lock_guard<std::mutex> lock(log.mutex);
            log.end = parseBody(*frame);
            return frame;
        }
    }
    return std::nullopt;
}

class RecordingObserver : public TransferObserver {
public:
    void onProgress(uint64_t transferred, uint64_t, const std::string&) override { last = transferred; calls++; }
    std::atomic<uint64_t> last{0};
    std::atomic<int> calls{0};
};

class UploadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::ERROR);
        dir_ = std::filesystem::temp_directory_path() /
               ("chatstorage_upload_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        content_.resize(50000);
        for (std::size_t i = 0; i < content_.size(); ++i) {
            content_[i] = static_cast<char>('a' + (i * 7) % 26);
        }
        path_ = (dir_ / "Holiday.PNG").string();
        std::ofstream(path_, std::ios::binary) << content_;

        options_.chunkSize = 4096;
        options_.requestTimeoutMs = 2000;
        options_.progressIntervalMs = 0;

        connOptions_.name = "upload-test";
        connOptions_.heartbeatIntervalMs = 0;
        connOptions_.maxReconnectAttempts = 0;
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::INFO);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    VoidResult runUpload(FakeServer& server, TransferTask& task, std::atomic<bool>& cancelled,
                         TransferObserver* observer = nullptr) {
        Connection connection(connOptions_);
        VoidResult result = Ok();
        {
            Correlator correlator(connection);
            auto connected = connection.connect("127.0.0.1", server.port());
            if (!connected) {
                return connected;
            }
            UploadSession session(correlator, files_, options_);
            result = session.run(task, cancelled, observer);
            serverTaskId_ = session.serverTaskId();
            connection.disconnect();
        }
        return result;
    }

    std::filesystem::path dir_;
    std::string content_;
    std::string path_;
    LocalFileAccess files_;
    TransferOptions options_;
    ConnectionOptions connOptions_;
    std::string serverTaskId_;
};

} // namespace

TEST_F(UploadSessionTest, NewUploadSendsWholeFile) {
    UploadLog log;
    FakeServer server([&](FakePeer& peer) {
        auto check = peer.expect(FrameType::ResumeCheck);
        if (!check) return;
        {
            std::lock_guard<std::mutex> lock(log.mutex);
            log.resumeCheck = parseBody(*check);
        }
        peer.sendJson(FrameType::ResumeAck, "{\"status\":\"new\"}");

        auto meta = peer.expect(FrameType::Meta);
        if (!meta) return;
        {
            std::lock_guard<std::mutex> lock(log.mutex);
            log.meta = parseBody(*meta);
        }
        peer.sendJson(FrameType::Ack, "{\"status\":\"ready\",\"taskId\":\"srv-42\"}");

        if (collectData(peer, log)) {
            peer.sendJson(FrameType::Ack, "{\"status\":\"success\"}");
        }
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 5, 11);
    std::atomic<bool> cancelled{false};
    RecordingObserver observer;
    auto result = runUpload(server, task, cancelled, &observer);
    ASSERT_TRUE(result.ok()) << result.error().toString();

    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_EQ(log.data, content_);
    EXPECT_EQ(log.dataFrames, 13);
    EXPECT_EQ(log.resumeCheck["md5"].asString(), Fingerprint::ofFileName("Holiday.PNG"));
    EXPECT_EQ(log.resumeCheck["fileName"].asString(), "Holiday.PNG");
    EXPECT_EQ(log.resumeCheck["fileType"].asString(), "png");
    EXPECT_EQ(jsonInt64(log.resumeCheck["fileSize"]), 50000);
    EXPECT_EQ(jsonInt64(log.resumeCheck["dirId"]), 5);
    EXPECT_EQ(jsonInt64(log.resumeCheck["userId"]), 11);
    EXPECT_EQ(log.resumeCheck["taskId"].asString(), task.taskId);
    EXPECT_EQ(log.meta["md5"], log.resumeCheck["md5"]);
    EXPECT_EQ(log.end["taskId"].asString(), "srv-42");

    EXPECT_EQ(serverTaskId_, "srv-42");
    EXPECT_EQ(task.transferredBytes, 50000u);
    EXPECT_DOUBLE_EQ(task.progress, 1.0);
    EXPECT_EQ(observer.last.load(), 50000u);
}

TEST_F(UploadSessionTest, ResumeStartsAtServerOffset) {
    UploadLog log;
    FakeServer server([&](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        peer.sendJson(FrameType::ResumeAck, "{\"data\":{\"status\":\"resume\",\"taskId\":\"srv-7\",\"uploadedSize\":30000}}");
        if (collectData(peer, log)) {
            peer.sendJson(FrameType::Ack, "{\"status\":\"success\"}");
        }
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 5, 11);
    std::atomic<bool> cancelled{false};
    auto result = runUpload(server, task, cancelled);
    ASSERT_TRUE(result.ok()) << result.error().toString();

    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_EQ(log.data, content_.substr(30000));
    EXPECT_EQ(log.end["taskId"].asString(), "srv-7");
    EXPECT_EQ(task.transferredBytes, 50000u);
}

TEST_F(UploadSessionTest, FullyUploadedFileOnlySendsEnd) {
    UploadLog log;
    FakeServer server([&](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        peer.sendJson(FrameType::ResumeAck, "{\"status\":\"resume\",\"uploadedSize\":50000}");
        if (collectData(peer, log)) {
            peer.sendJson(FrameType::Ack, "{\"status\":\"success\"}");
        }
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 1, 1);
    std::atomic<bool> cancelled{false};
    ASSERT_TRUE(runUpload(server, task, cancelled).ok());
    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_EQ(log.dataFrames, 0);
}

TEST_F(UploadSessionTest, ServerRefusalIsServerError) {
    FakeServer server([](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        peer.sendJson(FrameType::ResumeAck, "{\"code\":403,\"msg\":\"quota exceeded\"}");
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 1, 1);
    std::atomic<bool> cancelled{false};
    auto result = runUpload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ServerError);
    EXPECT_EQ(result.error().serverCode, 403);
    EXPECT_EQ(result.error().message, "quota exceeded");
}

TEST_F(UploadSessionTest, MetaNotReadyFails) {
    FakeServer server([](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        peer.sendJson(FrameType::ResumeAck, "{\"status\":\"new\"}");
        if (!peer.expect(FrameType::Meta)) return;
        peer.sendJson(FrameType::Ack, "{\"status\":\"busy\"}");
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 1, 1);
    std::atomic<bool> cancelled{false};
    auto result = runUpload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ServerError);
}

TEST_F(UploadSessionTest, UnconfirmedEndFails) {
    UploadLog log;
    FakeServer server([&](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        peer.sendJson(FrameType::ResumeAck, "{\"status\":\"resume\",\"uploadedSize\":0}");
        if (collectData(peer, log)) {
            peer.sendJson(FrameType::Ack, "{\"status\":\"error\",\"message\":\"checksum mismatch\"}");
        }
        peer.readFrame(std::chrono::milliseconds(500));
    });

    TransferTask task = TransferTask::makeUpload(path_, 1, 1);
    std::atomic<bool> cancelled{false};
    auto result = runUpload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().message.find("checksum mismatch"), std::string::npos);
}

TEST_F(UploadSessionTest, CancelStopsStreaming) {
    std::atomic<bool> cancelled{false};
    UploadLog log;
    FakeServer server([&](FakePeer& peer) {
        if (!peer.expect(FrameType::ResumeCheck)) return;
        cancelled = true;
        peer.sendJson(FrameType::ResumeAck, "{\"status\":\"resume\",\"uploadedSize\":0}");
        collectData(peer, log);
    });

    TransferTask task = TransferTask::makeUpload(path_, 1, 1);
    auto result = runUpload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_LT(task.transferredBytes, 50000u);
}

TEST_F(UploadSessionTest, MissingFileFailsBeforeHandshake) {
    FakeServer server([](FakePeer& peer) { peer.readFrame(std::chrono::milliseconds(300)); });

    TransferTask task = TransferTask::makeUpload((dir_ / "absent.bin").string(), 1, 1);
    std::atomic<bool> cancelled{false};
    auto result = runUpload(server, task, cancelled);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
}

TEST_F(UploadSessionTest, InterruptedUploadResumesFromStoredBytes) {
    constexpr std::size_t kStoredBeforeDrop = 5 * 4096;

    // Server side state keyed by fingerprint, kept across connections
    std::mutex mutex;
    std::map<std::string, std::string> stored;
    std::vector<std::string> fingerprints;
    std::vector<int64_t> offeredOffsets;

    FakeServer server([&](FakePeer& peer) {
        auto check = peer.expect(FrameType::ResumeCheck);
        if (!check) return;
        const std::string md5 = parseBody(*check)["md5"].asString();

        std::size_t have = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            fingerprints.push_back(md5);
            have = stored[md5].size();
            offeredOffsets.push_back(static_cast<int64_t>(have));
        }
        if (have == 0) {
            peer.sendJson(FrameType::ResumeAck, "{\"status\":\"new\"}");
            if (!peer.expect(FrameType::Meta)) return;
            peer.sendJson(FrameType::Ack, "{\"status\":\"ready\",\"taskId\":\"srv-9\"}");
        } else {
            peer.sendJson(FrameType::ResumeAck, "{\"status\":\"resume\",\"taskId\":\"srv-9\",\"uploadedSize\":" +
                                                    std::to_string(have) + "}");
        }

        while (auto frame = peer.readFrame()) {
            if (frame->type == FrameType::Data) {
                std::lock_guard<std::mutex> lock(mutex);
                std::string& bytes = stored[md5];
                bytes.append(frame->payload.begin(), frame->payload.end());
                if (have == 0 && bytes.size() >= kStoredBeforeDrop) {
                    break;
                }
            } else if (frame->type == FrameType::End) {
                peer.sendJson(FrameType::Ack, "{\"status\":\"success\"}");
                peer.readFrame(std::chrono::milliseconds(500));
                return;
            }
        }
        peer.close();
    });

    TransferTask task = TransferTask::makeUpload(path_, 5, 11);
    std::atomic<bool> cancelled{false};
    auto interrupted = runUpload(server, task, cancelled);
    ASSERT_FALSE(interrupted.ok());

    auto resumed = runUpload(server, task, cancelled);
    ASSERT_TRUE(resumed.ok()) << resumed.error().toString();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(fingerprints.size(), 2u);
    EXPECT_EQ(fingerprints[0], fingerprints[1]);
    ASSERT_EQ(offeredOffsets.size(), 2u);
    EXPECT_EQ(offeredOffsets[0], 0);
    EXPECT_EQ(offeredOffsets[1], static_cast<int64_t>(kStoredBeforeDrop));
    EXPECT_EQ(stored[fingerprints[0]], content_);
    EXPECT_EQ(task.transferredBytes, 50000u);
}
