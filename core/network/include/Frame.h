#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <set>
#include <utility>

namespace ChatStorage {

/**
 * @brief Single-byte frame type codes shared with the server.
 *
 * Adding a code is a protocol change; FrameCodec rejects bytes outside
 * this set with ErrorCode::UnknownType.
 */
enum class FrameType : uint8_t {
    // Transfer handshake and streaming
    Meta = 0x01,
    Data = 0x02,
    End = 0x03,
    Ack = 0x04,
    ResumeCheck = 0x05,
    ResumeAck = 0x06,

    Heartbeat = 0x0F,

    // Directories
    DirCreateReq = 0x10,
    DirDeleteReq = 0x11,
    DirUpdateReq = 0x12,
    DirMoveReq = 0x13,
    DirResponse = 0x14,
    DirListReq = 0x15,

    // Directory upload (reserved by the server, not sent by this client)
    DirFileMeta = 0x20,
    DirFileData = 0x21,
    DirFileEnd = 0x22,
    DirFileAck = 0x23,

    // Users and friends
    UserRegisterReq = 0x30,
    UserLoginReq = 0x31,
    UserChangePwdReq = 0x32,
    UserLogoutReq = 0x33,
    UserResponse = 0x34,
    FriendListReq = 0x35,
    SearchUserReq = 0x36,
    AddFriendReq = 0x37,
    PendingRequestsReq = 0x38,
    HandleFriendReq = 0x39,

    // Files
    FileListReq = 0x40,
    FileDeleteReq = 0x41,
    FileDetailReq = 0x42,
    FileResponse = 0x43
};

using FrameTypeSet = std::set<FrameType>;

bool isKnownFrameType(uint8_t code);
const char* frameTypeName(FrameType type);

/**
 * @brief One unit of the wire protocol.
 *
 * flags is reserved and carried through untouched.
 */
struct Frame {
    FrameType type{FrameType::Heartbeat};
    uint8_t flags{0};
    std::vector<uint8_t> payload;

    Frame() = default;
    Frame(FrameType t, std::vector<uint8_t> p, uint8_t f = 0)
        : type(t), flags(f), payload(std::move(p)) {}

    static Frame fromString(FrameType t, const std::string& text) {
        return Frame(t, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::string payloadString() const {
        return std::string(payload.begin(), payload.end());
    }

    bool operator==(const Frame& other) const {
        return type == other.type && flags == other.flags && payload == other.payload;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

} // namespace ChatStorage
