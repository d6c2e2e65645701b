#include "RequestBridge.hpp"

#include <fmt/format.h>

#include "../Core/CompletionSlot.hpp"
#include "../Logging/LogConfig.hpp"

namespace BACN::Request {

RequestBridge::RequestBridge(Device::LocalDeviceManager& node, BridgeParams params)
    : node_(node), params_(params) {}

RawOutcome RequestBridge::Classify(const Transport::Response& response) {
    if (const auto* ack = std::get_if<Transport::Ack>(&response)) {
        return Success<Transport::AckPayload>{ack->payload};
    }
    if (const auto* abort = std::get_if<Transport::AbortPdu>(&response)) {
        return Abort{Protocol::DecodeAbortReason(abort->reason)};
    }
    if (const auto* reject = std::get_if<Transport::RejectPdu>(&response)) {
        return Reject{Protocol::DecodeRejectReason(reject->reason)};
    }
    if (const auto* error = std::get_if<Transport::ErrorPdu>(&response)) {
        return RemoteError{Protocol::DecodeErrorClass(error->errorClass),
                           Protocol::DecodeErrorCode(error->errorCode)};
    }
    return Timeout{std::get<Transport::TransportException>(response).detail};
}

Result<RawOutcome> RequestBridge::SendAndWait(DeviceId deviceId,
                                              const Transport::ConfirmedRequest& request,
                                              std::optional<std::chrono::milliseconds> timeout) {
    auto device = node_.RequireInitialized();
    if (!device) {
        BACN_LOG_V1(Request, "%s to %u refused: local device not initialized",
                    Transport::ToString(Transport::ServiceOf(request)), deviceId);
        return std::unexpected(device.error());
    }
    auto& endpoint = (*device)->Endpoint();

    auto remote = endpoint.GetRemoteDevice(deviceId);
    if (!remote) {
        BACN_LOG_V1(Request, "%s to %u refused: device not in remote table",
                    Transport::ToString(Transport::ServiceOf(request)), deviceId);
        return BACN_ERROR_NOT_FOUND("Remote device not found");
    }

    const uint32_t invokeId = nextInvokeId_.fetch_add(1);
    const char* service = Transport::ToString(Transport::ServiceOf(request));
    const auto budget = std::chrono::milliseconds(
        static_cast<int64_t>(endpoint.Timeout()) * (static_cast<int64_t>(endpoint.Retries()) + 1));
    const auto guard = timeout.value_or(budget + params_.guardGrace);

    auto slot = Core::CompletionSlot<Transport::Response>::Make();
    auto onComplete = [slot, deviceId, invokeId, service](Transport::Response response) {
        if (!slot->Deliver(std::move(response))) {
            BACN_LOG_KV(Request, service, deviceId, invokeId, "late response dropped");
        }
    };
    TRY(endpoint.Send(*remote, request, std::move(onComplete)));
    BACN_LOG_V3(Request, "svc=%s dev=%u invoke=%u sent (%s), guard %lld ms", service, deviceId,
                invokeId, Transport::Describe(request), static_cast<long long>(guard.count()));

    if (!slot->WaitFor(guard)) {
        if (slot->Deliver(Transport::TransportException{
                fmt::format("no response within {} ms", guard.count())})) {
            BACN_LOG_RL(Request, "bridge/guard-timeout", 1000, spdlog::level::warn,
                        "svc=%s dev=%u invoke=%u guard timer fired", service, deviceId, invokeId);
        }
    }
    Transport::Response response = slot->Wait();

    {
        std::lock_guard<std::mutex> lock(lastLock_);
        lastResponse_ = response;
    }

    RawOutcome outcome = Classify(response);
    if (IsSuccess(outcome)) {
        BACN_LOG_V3(Request, "svc=%s dev=%u invoke=%u -> %s", service, deviceId, invokeId,
                    Transport::Describe(response));
    } else {
        BACN_LOG_V1(Request, "svc=%s dev=%u invoke=%u -> %s", service, deviceId, invokeId,
                    Describe(outcome));
    }
    return outcome;
}

std::optional<Transport::Response> RequestBridge::LastResponse() const {
    std::lock_guard<std::mutex> lock(lastLock_);
    return lastResponse_;
}

} // namespace BACN::Request
