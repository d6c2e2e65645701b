#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

#include "../Device/LocalDeviceManager.hpp"
#include "../Transport/TransportTypes.hpp"
#include "RequestOutcome.hpp"

namespace BACN::Request {

struct BridgeParams {
    // Added to the transport's own budget before the bridge gives up waiting.
    std::chrono::milliseconds guardGrace{1000};
};

// Ack payload as delivered by the transport; monostate means "acknowledged, no value".
using RawOutcome = RequestOutcome<Transport::AckPayload>;

/**
 * @brief Blocking request/response on top of the callback-driven transport.
 *
 * Each call owns one CompletionSlot. The transport callback and the guard
 * timer race to fill it; whichever loses is dropped. Calls are independent:
 * the bridge does not serialize concurrent callers.
 */
class RequestBridge {
public:
    explicit RequestBridge(Device::LocalDeviceManager& node, BridgeParams params = {});

    RequestBridge(const RequestBridge&) = delete;
    RequestBridge& operator=(const RequestBridge&) = delete;

    /**
     * @brief Send one confirmed request and wait for its single outcome.
     *
     * Local preconditions come back as errors, in this order: NotInitialized
     * (nothing is sent), NotFound (device not in the remote table). Everything
     * the peer or the network does is a RequestOutcome.
     *
     * @param timeout Overrides the guard wait (default: Timeout() * (Retries() + 1) + grace)
     */
    Result<RawOutcome> SendAndWait(DeviceId deviceId,
                                   const Transport::ConfirmedRequest& request,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Raw response that completed the most recent request.
    [[nodiscard]] std::optional<Transport::Response> LastResponse() const;

    [[nodiscard]] static RawOutcome Classify(const Transport::Response& response);

private:
    Device::LocalDeviceManager& node_;
    const BridgeParams params_;

    std::atomic<uint32_t> nextInvokeId_{1};

    mutable std::mutex lastLock_;
    std::optional<Transport::Response> lastResponse_;
};

} // namespace BACN::Request
