#pragma once

#include "RequestService.h"

namespace ChatStorage {

/// Friend and user-search requests. Every one is answered with UserResponse.
class FriendService : public RequestService {
public:
    explicit FriendService(Correlator& correlator);

    /// Always an array, even when the server answers with a single user object
    Result<Json::Value> searchUser(const std::string& userName);
    Result<Json::Value> addFriend(int64_t userId, const std::string& message);
    Result<Json::Value> listFriends();
    Result<Json::Value> pendingRequests();
    Result<Json::Value> handleFriendRequest(int64_t requestId, bool accept);
};

} // namespace ChatStorage
