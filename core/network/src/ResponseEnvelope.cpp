#include "ResponseEnvelope.h"

#include <memory>

namespace ChatStorage {

Error Envelope::toError() const {
    std::string text = message;
    if (text.empty()) {
        text = status.empty() ? "request rejected by server" : status;
    }
    Error err = Error::server(code, text);
    err.component = "Envelope";
    return err;
}

std::string toWireJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

int64_t jsonInt64(const Json::Value& value, int64_t fallback) {
    if (value.isIntegral()) {
        return value.asInt64();
    }
    if (value.isDouble()) {
        return static_cast<int64_t>(value.asDouble());
    }
    if (value.isString()) {
        const std::string text = value.asString();
        if (text.empty()) return fallback;
        try {
            std::size_t used = 0;
            long long parsed = std::stoll(text, &used);
            return used == text.size() ? static_cast<int64_t>(parsed) : fallback;
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

Result<Envelope> parseEnvelope(const Frame& frame) {
    return parseEnvelope(frame.payloadString());
}

Result<Envelope> parseEnvelope(const std::string& payload) {
    Envelope envelope;
    if (payload.empty()) {
        return envelope;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(payload.data(), payload.data() + payload.size(), &root, &errors)) {
        return Error{ErrorCode::InvalidResponse, "malformed JSON: " + errors, "Envelope"};
    }
    if (!root.isObject()) {
        return Error{ErrorCode::InvalidResponse, "response is not a JSON object", "Envelope"};
    }

    const Json::Value& body = root;
    envelope.raw = root;
    envelope.data = body.get("data", Json::Value(Json::nullValue));

    if (body["message"].isString()) {
        envelope.message = body["message"].asString();
    } else if (body["msg"].isString()) {
        envelope.message = body["msg"].asString();
    }
    if (body["status"].isString()) {
        envelope.status = body["status"].asString();
    }

    const bool hasCode = body["code"].isNumeric() || body["code"].isString();
    if (hasCode) {
        envelope.code = static_cast<int>(jsonInt64(body["code"], 500));
    }

    if (body["success"].isBool()) {
        envelope.ok = body["success"].asBool();
        if (!envelope.ok && !hasCode) {
            envelope.code = 500;
        }
    } else if (hasCode) {
        envelope.ok = envelope.code == 200;
    } else if (envelope.status == "error" || envelope.status == "fail") {
        envelope.ok = false;
        envelope.code = 500;
    }

    return envelope;
}

} // namespace ChatStorage
