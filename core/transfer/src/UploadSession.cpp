#include "UploadSession.h"
#include "Fingerprint.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace ChatStorage {

namespace {

// Handshake fields arrive at the top level; some servers nest them in data
const Json::Value& handshakeField(const Envelope& envelope, const char* key) {
    if (envelope.raw.isObject() && envelope.raw.isMember(key)) {
        return envelope.raw[key];
    }
    if (envelope.data.isObject() && envelope.data.isMember(key)) {
        return envelope.data[key];
    }
    static const Json::Value null;
    return null;
}

std::string handshakeString(const Envelope& envelope, const char* key) {
    const Json::Value& value = handshakeField(envelope, key);
    if (value.isString()) return value.asString();
    if (value.isNumeric()) return std::to_string(jsonInt64(value));
    return "";
}

Error asConnectionLost(const Error& error) {
    if (error.code == ErrorCode::NotConnected || error.code == ErrorCode::SendFailed ||
        error.code == ErrorCode::ConnectionClosed) {
        return Error{ErrorCode::ConnectionLost, error.message, "UploadSession"};
    }
    return error;
}

} // namespace

std::string fileExtension(const std::string& fileName) {
    auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= fileName.size()) {
        return "";
    }
    std::string ext = fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

UploadSession::UploadSession(Correlator& correlator, IFileAccess& files, TransferOptions options)
    : correlator_(correlator), files_(files), options_(options) {}

Json::Value UploadSession::describeFile(const TransferTask& task, uint64_t fileSize) const {
    Json::Value body;
    body["md5"] = task.fingerprint;
    body["fileName"] = task.fileName;
    body["fileSize"] = static_cast<Json::UInt64>(fileSize);
    body["fileType"] = fileExtension(task.fileName);
    body["dirId"] = static_cast<Json::Int64>(task.targetDirId);
    body["userId"] = static_cast<Json::Int64>(task.userId);
    body["taskId"] = task.taskId;
    return body;
}

VoidResult UploadSession::run(TransferTask& task, const std::atomic<bool>& cancelled, TransferObserver* observer) {
    auto& logger = Logger::instance();

    auto size = files_.size(task.localPath);
    if (!size) {
        return size.error();
    }
    const uint64_t fileSize = size.value();
    task.totalSize = fileSize;
    task.fingerprint = Fingerprint::ofFileName(task.fileName);
    serverTaskId_ = task.taskId;

    if (cancelled.load()) {
        return Error{ErrorCode::Cancelled, "cancelled before handshake", "UploadSession"};
    }

    auto offset = negotiateOffset(task, fileSize);
    if (!offset) {
        return offset.error();
    }
    uint64_t start = std::min(offset.value(), fileSize);
    task.setTransferred(start);

    logger.log(LogLevel::INFO, "Uploading " + task.fileName + " (" + std::to_string(fileSize) + " bytes) from offset " +
               std::to_string(start) + ", server task " + serverTaskId_, "UploadSession");

    ProgressReporter reporter(observer, options_.progressIntervalMs, start);
    reporter.update(start, fileSize, true);

    if (start < fileSize) {
        auto streamed = streamData(task, start, fileSize, cancelled, reporter);
        if (!streamed) {
            return streamed;
        }
    }

    if (cancelled.load()) {
        return Error{ErrorCode::Cancelled, "cancelled before end frame", "UploadSession"};
    }

    auto finished = finish();
    if (!finished) {
        return finished;
    }

    task.setTransferred(fileSize);
    reporter.update(fileSize, fileSize, true);
    logger.log(LogLevel::INFO, "Upload of " + task.fileName + " confirmed by server", "UploadSession");
    return Ok();
}

Result<uint64_t> UploadSession::negotiateOffset(const TransferTask& task, uint64_t fileSize) {
    const auto timeout = std::chrono::milliseconds(options_.requestTimeoutMs);
    const Json::Value body = describeFile(task, fileSize);

    auto reply = correlator_.sendAndAwait(makeJsonFrame(FrameType::ResumeCheck, body),
                                          {FrameType::ResumeAck}, timeout);
    if (!reply) {
        return reply.error();
    }
    auto envelope = parseEnvelope(reply.value());
    if (!envelope) {
        return envelope.error();
    }
    if (!envelope->ok) {
        return envelope->toError();
    }

    const std::string status = handshakeString(envelope.value(), "status");
    if (status == "resume") {
        std::string echoed = handshakeString(envelope.value(), "taskId");
        if (!echoed.empty()) {
            serverTaskId_ = echoed;
        }
        int64_t uploaded = jsonInt64(handshakeField(envelope.value(), "uploadedSize"), 0);
        return static_cast<uint64_t>(uploaded < 0 ? 0 : uploaded);
    }

    if (status != "new") {
        Error err = Error::server(envelope->code,
                                  "unexpected resume status '" + status + "'" +
                                  (envelope->message.empty() ? "" : ": " + envelope->message));
        err.component = "UploadSession";
        return err;
    }

    auto ack = correlator_.sendAndAwait(makeJsonFrame(FrameType::Meta, body), {FrameType::Ack}, timeout);
    if (!ack) {
        return ack.error();
    }
    auto ackEnvelope = parseEnvelope(ack.value());
    if (!ackEnvelope) {
        return ackEnvelope.error();
    }
    if (!ackEnvelope->ok || handshakeString(ackEnvelope.value(), "status") != "ready") {
        Error err = ackEnvelope->toError();
        err.message = "server not ready: " + err.message;
        err.component = "UploadSession";
        return err;
    }
    std::string assigned = handshakeString(ackEnvelope.value(), "taskId");
    if (!assigned.empty()) {
        serverTaskId_ = assigned;
    }
    return uint64_t{0};
}

VoidResult UploadSession::streamData(TransferTask& task, uint64_t offset, uint64_t fileSize,
                                     const std::atomic<bool>& cancelled, ProgressReporter& reporter) {
    auto input = files_.openForRead(task.localPath, offset);
    if (!input) {
        return input.error();
    }
    std::istream& in = *input.value();
    Connection& connection = correlator_.connection();
    auto& metrics = MetricsCollector::instance();

    std::vector<uint8_t> buffer(options_.chunkSize);
    uint64_t sent = offset;

    while (sent < fileSize) {
        if (cancelled.load()) {
            return Error{ErrorCode::Cancelled, "cancelled at " + std::to_string(sent), "UploadSession"};
        }
        if (!connection.isConnected()) {
            return Error{ErrorCode::ConnectionLost, "transfer connection dropped", "UploadSession"};
        }
        // No write space: retry in the next slice instead of blocking in send()
        if (!connection.hasSpaceAvailable()) {
            connection.awaitWritable(std::chrono::milliseconds(config::WAIT_SLICE_MS));
            continue;
        }

        std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), fileSize - sent));
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            return Error{ErrorCode::FileIOError, task.localPath + " ended at " + std::to_string(sent) +
                         " of " + std::to_string(fileSize) + " bytes", "UploadSession"};
        }

        Frame frame(FrameType::Data, std::vector<uint8_t>(buffer.begin(), buffer.begin() + got));
        auto result = correlator_.send(frame);
        if (!result) {
            return asConnectionLost(result.error());
        }

        sent += got;
        metrics.addBytesUploaded(got);
        task.setTransferred(sent);
        reporter.update(sent, fileSize);
    }

    LOG_DEBUG_COMP_IF("Streamed " + std::to_string(sent - offset) + " bytes of " + task.fileName, "UploadSession");
    return Ok();
}

VoidResult UploadSession::finish() {
    Json::Value body;
    body["taskId"] = serverTaskId_;

    auto reply = correlator_.sendAndAwait(makeJsonFrame(FrameType::End, body), {FrameType::Ack},
                                          std::chrono::milliseconds(options_.requestTimeoutMs));
    if (!reply) {
        return reply.error();
    }
    auto envelope = parseEnvelope(reply.value());
    if (!envelope) {
        return envelope.error();
    }
    if (!envelope->ok || handshakeString(envelope.value(), "status") != "success") {
        Error err = envelope->toError();
        err.message = "upload not confirmed: " + err.message;
        err.component = "UploadSession";
        return err;
    }
    return Ok();
}

} // namespace ChatStorage
