#include "AuthService.h"
#include "Logger.h"

namespace ChatStorage {

UserInfo UserInfo::fromJson(const Json::Value& json) {
    UserInfo user;
    user.userId = jsonInt64(json["userId"]);
    user.userName = json.get("userName", "").asString();
    user.mail = json.get("mail", "").asString();
    user.token = json.get("token", "").asString();
    return user;
}

AuthService::AuthService(Correlator& correlator) : RequestService(correlator, "AuthService") {}

Result<UserInfo> AuthService::authenticate(FrameType request, const Json::Value& body) {
    auto data = call(request, body, FrameType::UserResponse);
    if (!data) {
        return data.error();
    }
    if (!data->isObject()) {
        return Error{ErrorCode::InvalidResponse, "no user in response", component_};
    }

    UserInfo user = UserInfo::fromJson(data.value());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentUser_ = user;
    }
    Logger::instance().log(LogLevel::INFO, "Signed in as " + user.userName + " (" + std::to_string(user.userId) + ")",
                           component_);
    return user;
}

Result<UserInfo> AuthService::login(const std::string& userName, const std::string& password) {
    Json::Value body;
    body["userName"] = userName;
    body["password"] = password;
    return authenticate(FrameType::UserLoginReq, body);
}

Result<UserInfo> AuthService::registerUser(const std::string& userName, const std::string& password,
                                           const std::string& mail) {
    Json::Value body;
    body["userName"] = userName;
    body["password"] = password;
    body["mail"] = mail;
    return authenticate(FrameType::UserRegisterReq, body);
}

Result<Json::Value> AuthService::changePassword(const std::string& oldPassword, const std::string& newPassword) {
    Json::Value body;
    body["oldPassword"] = oldPassword;
    body["newPassword"] = newPassword;
    return call(FrameType::UserChangePwdReq, body, FrameType::UserResponse);
}

Result<Json::Value> AuthService::logout() {
    auto result = call(FrameType::UserLogoutReq, Json::Value(Json::objectValue), FrameType::UserResponse);
    // The session is over locally even if the server did not answer
    std::lock_guard<std::mutex> lock(mutex_);
    currentUser_.reset();
    return result;
}

std::optional<UserInfo> AuthService::currentUser() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentUser_;
}

} // namespace ChatStorage
