#include "FrameCodec.h"
#include "Constants.h"
#include <cstdio>

namespace ChatStorage {

bool isKnownFrameType(uint8_t code) {
    switch (static_cast<FrameType>(code)) {
        case FrameType::Meta:
        case FrameType::Data:
        case FrameType::End:
        case FrameType::Ack:
        case FrameType::ResumeCheck:
        case FrameType::ResumeAck:
        case FrameType::Heartbeat:
        case FrameType::DirCreateReq:
        case FrameType::DirDeleteReq:
        case FrameType::DirUpdateReq:
        case FrameType::DirMoveReq:
        case FrameType::DirResponse:
        case FrameType::DirListReq:
        case FrameType::DirFileMeta:
        case FrameType::DirFileData:
        case FrameType::DirFileEnd:
        case FrameType::DirFileAck:
        case FrameType::UserRegisterReq:
        case FrameType::UserLoginReq:
        case FrameType::UserChangePwdReq:
        case FrameType::UserLogoutReq:
        case FrameType::UserResponse:
        case FrameType::FriendListReq:
        case FrameType::SearchUserReq:
        case FrameType::AddFriendReq:
        case FrameType::PendingRequestsReq:
        case FrameType::HandleFriendReq:
        case FrameType::FileListReq:
        case FrameType::FileDeleteReq:
        case FrameType::FileDetailReq:
        case FrameType::FileResponse:
            return true;
    }
    return false;
}

const char* frameTypeName(FrameType type) {
    switch (type) {
        case FrameType::Meta: return "Meta";
        case FrameType::Data: return "Data";
        case FrameType::End: return "End";
        case FrameType::Ack: return "Ack";
        case FrameType::ResumeCheck: return "ResumeCheck";
        case FrameType::ResumeAck: return "ResumeAck";
        case FrameType::Heartbeat: return "Heartbeat";
        case FrameType::DirCreateReq: return "DirCreateReq";
        case FrameType::DirDeleteReq: return "DirDeleteReq";
        case FrameType::DirUpdateReq: return "DirUpdateReq";
        case FrameType::DirMoveReq: return "DirMoveReq";
        case FrameType::DirResponse: return "DirResponse";
        case FrameType::DirListReq: return "DirListReq";
        case FrameType::DirFileMeta: return "DirFileMeta";
        case FrameType::DirFileData: return "DirFileData";
        case FrameType::DirFileEnd: return "DirFileEnd";
        case FrameType::DirFileAck: return "DirFileAck";
        case FrameType::UserRegisterReq: return "UserRegisterReq";
        case FrameType::UserLoginReq: return "UserLoginReq";
        case FrameType::UserChangePwdReq: return "UserChangePwdReq";
        case FrameType::UserLogoutReq: return "UserLogoutReq";
        case FrameType::UserResponse: return "UserResponse";
        case FrameType::FriendListReq: return "FriendListReq";
        case FrameType::SearchUserReq: return "SearchUserReq";
        case FrameType::AddFriendReq: return "AddFriendReq";
        case FrameType::PendingRequestsReq: return "PendingRequestsReq";
        case FrameType::HandleFriendReq: return "HandleFriendReq";
        case FrameType::FileListReq: return "FileListReq";
        case FrameType::FileDeleteReq: return "FileDeleteReq";
        case FrameType::FileDetailReq: return "FileDetailReq";
        case FrameType::FileResponse: return "FileResponse";
    }
    return "Unknown";
}

std::vector<uint8_t> FrameCodec::encode(const Frame& frame) {
    const auto length = static_cast<uint32_t>(frame.payload.size());

    std::vector<uint8_t> out;
    out.reserve(config::FRAME_HEADER_SIZE + frame.payload.size());
    out.push_back(static_cast<uint8_t>(config::FRAME_MAGIC >> 8));
    out.push_back(static_cast<uint8_t>(config::FRAME_MAGIC & 0xFF));
    out.push_back(static_cast<uint8_t>(frame.type));
    out.push_back(frame.flags);
    out.push_back(static_cast<uint8_t>((length >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(length & 0xFF));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

bool FrameCodec::hasMagic(const uint8_t* data, std::size_t size) {
    return size >= 2 &&
           data[0] == static_cast<uint8_t>(config::FRAME_MAGIC >> 8) &&
           data[1] == static_cast<uint8_t>(config::FRAME_MAGIC & 0xFF);
}

std::optional<uint32_t> FrameCodec::peekLength(const uint8_t* data, std::size_t size) {
    if (size < config::FRAME_HEADER_SIZE) {
        return std::nullopt;
    }
    return (static_cast<uint32_t>(data[4]) << 24) |
           (static_cast<uint32_t>(data[5]) << 16) |
           (static_cast<uint32_t>(data[6]) << 8) |
           static_cast<uint32_t>(data[7]);
}

Result<Frame> FrameCodec::decode(const uint8_t* data, std::size_t size) {
    if (size < config::FRAME_HEADER_SIZE) {
        return Error{ErrorCode::TruncatedHeader,
                     "need " + std::to_string(config::FRAME_HEADER_SIZE) + " bytes, have " + std::to_string(size),
                     "FrameCodec"};
    }
    if (!hasMagic(data, size)) {
        return Error{ErrorCode::BadMagic, "unexpected frame magic", "FrameCodec"};
    }
    if (!isKnownFrameType(data[2])) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%02X", data[2]);
        return Error{ErrorCode::UnknownType, std::string("type byte ") + hex, "FrameCodec"};
    }

    const uint32_t length = *peekLength(data, size);
    if (size - config::FRAME_HEADER_SIZE < length) {
        return Error{ErrorCode::TruncatedPayload,
                     "declared " + std::to_string(length) + " bytes, have " +
                         std::to_string(size - config::FRAME_HEADER_SIZE),
                     "FrameCodec"};
    }

    const uint8_t* body = data + config::FRAME_HEADER_SIZE;
    return Frame(static_cast<FrameType>(data[2]), std::vector<uint8_t>(body, body + length), data[3]);
}

std::string FrameCodec::describe(const Frame& frame) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned>(frame.type));
    return std::string(frameTypeName(frame.type)) + "(" + hex + ") flags=" +
           std::to_string(frame.flags) + " len=" + std::to_string(frame.payload.size());
}

} // namespace ChatStorage
