#include "RequestService.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace ChatStorage {

RequestService::RequestService(Correlator& correlator, std::string component, std::chrono::milliseconds timeout)
    : correlator_(correlator), component_(std::move(component)), timeout_(timeout) {}

Result<Envelope> RequestService::exchange(FrameType request, const Json::Value& body, FrameType response,
                                          std::chrono::milliseconds timeout) {
    Frame frame = body.isNull() ? Frame(request, {}) : makeJsonFrame(request, body);

    LOG_DEBUG_COMP_IF(std::string("-> ") + frameTypeName(request) + " " + frame.payloadString(), component_);

    auto reply = correlator_.sendAndAwait(frame, {response}, timeout);
    if (!reply) {
        Logger::instance().log(LogLevel::WARN, std::string(frameTypeName(request)) + " failed: " +
                               reply.error().toString(), component_);
        return reply.error();
    }

    auto envelope = parseEnvelope(reply.value());
    if (!envelope) {
        Error err = envelope.error();
        err.component = component_;
        Logger::instance().log(LogLevel::WARN, err.toString(), component_);
        return err;
    }
    return envelope;
}

Result<Json::Value> RequestService::call(FrameType request, const Json::Value& body, FrameType response) {
    return call(request, body, response, timeout_);
}

Result<Json::Value> RequestService::call(FrameType request, const Json::Value& body, FrameType response,
                                         std::chrono::milliseconds timeout) {
    auto envelope = exchange(request, body, response, timeout);
    if (!envelope) {
        return envelope.error();
    }
    if (!envelope->ok) {
        Error err = envelope->toError();
        err.component = component_;
        Logger::instance().log(LogLevel::WARN, std::string(frameTypeName(request)) + " rejected: " + err.toString(),
                               component_);
        return err;
    }
    return envelope->data;
}

} // namespace ChatStorage
