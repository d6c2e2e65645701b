#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../Core/Error.hpp"
#include "TransportTypes.hpp"

namespace BACN::Transport {

/**
 * @brief Local BACnet endpoint provided by a transport stack.
 *
 * Owns wire encoding, APDU/NPDU framing, segmentation, request timeouts and
 * retries, plus the remote device table learned from I-Am traffic.
 *
 * Threading:
 * - Send() returns immediately; the callback fires exactly once, on a
 *   transport-owned thread, after Ack/Abort/Reject/Error or once the
 *   timeout budget (Timeout() * (Retries() + 1)) expires.
 * - Remote device table and local object accessors are safe from any thread.
 */
class ILocalTransport {
public:
    virtual ~ILocalTransport() = default;

    // -------------------------------------------------------------------------
    // Tunables (apply before Initialize(); read back for backup)
    // -------------------------------------------------------------------------

    virtual void SetPort(uint16_t port) = 0;
    [[nodiscard]] virtual uint16_t Port() const = 0;

    /// APDU timeout in milliseconds.
    virtual void SetTimeout(uint32_t timeoutMs) = 0;
    [[nodiscard]] virtual uint32_t Timeout() const = 0;

    virtual void SetRetries(uint32_t retries) = 0;
    [[nodiscard]] virtual uint32_t Retries() const = 0;

    virtual void SetSegTimeout(uint32_t segTimeoutMs) = 0;
    [[nodiscard]] virtual uint32_t SegTimeout() const = 0;

    virtual void SetSegWindow(uint32_t segWindow) = 0;
    [[nodiscard]] virtual uint32_t SegWindow() const = 0;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Binds Port(). BindError when another live endpoint holds it.
    virtual Result<void> Initialize() = 0;

    /// Releases the port. The endpoint cannot be initialized again.
    virtual Result<void> Terminate() = 0;

    [[nodiscard]] virtual bool IsInitialized() const = 0;

    [[nodiscard]] virtual DeviceId LocalDeviceId() const = 0;

    // -------------------------------------------------------------------------
    // Traffic
    // -------------------------------------------------------------------------

    /// Local broadcast to the given destination port.
    virtual Result<void> SendBroadcast(uint16_t port, const UnconfirmedRequest& request) = 0;

    virtual Result<void> SendGlobalBroadcast(const UnconfirmedRequest& request) = 0;

    /// On error the callback is never invoked.
    virtual Result<void> Send(const RemoteDeviceInfo& device,
                              const ConfirmedRequest& request,
                              CompletionCallback callback) = 0;

    // -------------------------------------------------------------------------
    // Remote device table
    // -------------------------------------------------------------------------

    [[nodiscard]] virtual std::vector<RemoteDeviceInfo> GetRemoteDevices() const = 0;
    [[nodiscard]] virtual std::optional<RemoteDeviceInfo> GetRemoteDevice(DeviceId id) const = 0;

    /// Blocking fetch of object-name, vendor-name and services-supported.
    virtual Result<RemoteDeviceInfo> GetExtendedDeviceInformation(DeviceId id) = 0;

    // -------------------------------------------------------------------------
    // Local object table served to the network
    // -------------------------------------------------------------------------

    virtual Result<void> AddObject(const ObjectRecord& record) = 0;
    [[nodiscard]] virtual Result<ObjectRecord> GetObject(const ObjectIdentifier& id) const = 0;
    virtual Result<void> SetProperty(const ObjectIdentifier& id, PropertyId property,
                                     const PropertyValue& value) = 0;
    virtual Result<void> RemoveObject(const ObjectIdentifier& id) = 0;
    [[nodiscard]] virtual std::vector<ObjectRecord> GetLocalObjects() const = 0;
};

struct TransportParams {
    DeviceId deviceId{0};
    std::string broadcastAddress;
    std::string localAddress;
};

class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<ILocalTransport> Create(const TransportParams& params) = 0;
};

} // namespace BACN::Transport
