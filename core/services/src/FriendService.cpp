#include "FriendService.h"

namespace ChatStorage {

namespace {

Json::Value asArray(const Json::Value& value) {
    if (value.isArray()) {
        return value;
    }
    Json::Value list(Json::arrayValue);
    if (value.isObject()) {
        list.append(value);
    }
    return list;
}

} // namespace

FriendService::FriendService(Correlator& correlator) : RequestService(correlator, "FriendService") {}

Result<Json::Value> FriendService::searchUser(const std::string& userName) {
    Json::Value body;
    body["userName"] = userName;

    auto envelope = exchange(FrameType::SearchUserReq, body, FrameType::UserResponse, timeout());
    if (!envelope) {
        return envelope.error();
    }
    if (!envelope->ok) {
        return envelope->toError();
    }
    // Wrapped {data: [...]} or the bare user object itself
    if (!envelope->data.isNull()) {
        return asArray(envelope->data);
    }
    const Json::Value& raw = envelope->raw;
    if (raw.isObject() && (raw.isMember("code") || raw.isMember("success"))) {
        return Json::Value(Json::arrayValue);
    }
    return asArray(raw);
}

Result<Json::Value> FriendService::addFriend(int64_t userId, const std::string& message) {
    Json::Value body;
    body["userId"] = static_cast<Json::Int64>(userId);
    body["requestMsg"] = message;
    return call(FrameType::AddFriendReq, body, FrameType::UserResponse);
}

Result<Json::Value> FriendService::listFriends() {
    auto data = call(FrameType::FriendListReq, Json::Value(), FrameType::UserResponse);
    if (!data) {
        return data;
    }
    return asArray(data.value());
}

Result<Json::Value> FriendService::pendingRequests() {
    auto data = call(FrameType::PendingRequestsReq, Json::Value(), FrameType::UserResponse);
    if (!data) {
        return data;
    }
    return asArray(data.value());
}

Result<Json::Value> FriendService::handleFriendRequest(int64_t requestId, bool accept) {
    Json::Value body;
    body["requestId"] = static_cast<Json::Int64>(requestId);
    body["status"] = accept ? 1 : 2;
    return call(FrameType::HandleFriendReq, body, FrameType::UserResponse);
}

} // namespace ChatStorage
