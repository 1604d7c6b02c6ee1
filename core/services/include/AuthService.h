#pragma once

#include "RequestService.h"

#include <mutex>
#include <optional>

namespace ChatStorage {

struct UserInfo {
    int64_t userId{0};
    std::string userName;
    std::string mail;
    std::string token;

    static UserInfo fromJson(const Json::Value& json);
};

/**
 * @brief Account requests. Every one is answered with UserResponse.
 *
 * A successful login or registration becomes the current user until logout.
 */
class AuthService : public RequestService {
public:
    explicit AuthService(Correlator& correlator);

    Result<UserInfo> login(const std::string& userName, const std::string& password);
    Result<UserInfo> registerUser(const std::string& userName, const std::string& password, const std::string& mail);
    Result<Json::Value> changePassword(const std::string& oldPassword, const std::string& newPassword);
    Result<Json::Value> logout();

    std::optional<UserInfo> currentUser() const;

private:
    Result<UserInfo> authenticate(FrameType request, const Json::Value& body);

    mutable std::mutex mutex_;
    std::optional<UserInfo> currentUser_;
};

} // namespace ChatStorage
