#pragma once

#include "Correlator.h"
#include "ResponseEnvelope.h"
#include "Constants.h"

#include <chrono>
#include <json/json.h>
#include <string>

namespace ChatStorage {

/**
 * @brief Base for the one-shot request services on the control connection.
 *
 * call() sends the JSON body, waits for the response type and returns the
 * envelope's data, or the envelope mapped to ServerError.
 */
class RequestService {
public:
    RequestService(Correlator& correlator, std::string component,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(config::REQUEST_TIMEOUT_MS));
    virtual ~RequestService() = default;

    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds timeout() const { return timeout_; }

protected:
    /// A null body is sent as an empty payload
    Result<Envelope> exchange(FrameType request, const Json::Value& body, FrameType response,
                              std::chrono::milliseconds timeout);

    Result<Json::Value> call(FrameType request, const Json::Value& body, FrameType response);
    Result<Json::Value> call(FrameType request, const Json::Value& body, FrameType response,
                             std::chrono::milliseconds timeout);

    Correlator& correlator_;
    const std::string component_;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace ChatStorage
