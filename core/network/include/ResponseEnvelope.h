#pragma once

#include "Frame.h"
#include "Result.h"

#include <json/json.h>
#include <string>

namespace ChatStorage {

/**
 * @brief Canonical form of a JSON response payload.
 *
 * The server answers with several shapes: {success, message, data},
 * {code, msg, data}, handshake acks carrying a "status" string, and bare
 * objects. parseEnvelope() is the only place that knows about them.
 */
struct Envelope {
    bool ok{true};
    int code{200};
    std::string message;
    std::string status;
    Json::Value data{Json::nullValue};
    Json::Value raw{Json::objectValue};

    /// ServerError(code, message) for a failed envelope
    Error toError() const;
};

Result<Envelope> parseEnvelope(const Frame& frame);
Result<Envelope> parseEnvelope(const std::string& payload);

/// Compact single-line JSON, as sent on the wire
std::string toWireJson(const Json::Value& value);

inline Frame makeJsonFrame(FrameType type, const Json::Value& body) {
    return Frame::fromString(type, toWireJson(body));
}

/// Reads an integer that the server may send as a number or a numeric string
int64_t jsonInt64(const Json::Value& value, int64_t fallback = 0);

} // namespace ChatStorage
