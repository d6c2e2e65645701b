#include "TransportTypes.hpp"

#include <fmt/format.h>

#include "ProtocolCodes.hpp"

namespace BACN::Transport {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string Describe(const Response& response) {
    return std::visit(Overloaded{
        [](const Ack& ack) -> std::string {
            if (const auto* map = std::get_if<PropertyMap>(&ack.payload)) {
                return fmt::format("ack ({} properties)", map->size());
            }
            if (const auto* id = std::get_if<ObjectIdentifier>(&ack.payload)) {
                return fmt::format("ack {}", ToString(*id));
            }
            return "ack";
        },
        [](const AbortPdu& pdu) -> std::string {
            return fmt::format("abort {}", Protocol::ToString(Protocol::DecodeAbortReason(pdu.reason)));
        },
        [](const RejectPdu& pdu) -> std::string {
            return fmt::format("reject {}", Protocol::ToString(Protocol::DecodeRejectReason(pdu.reason)));
        },
        [](const ErrorPdu& pdu) -> std::string {
            return fmt::format("error {}/{}",
                               Protocol::ToString(Protocol::DecodeErrorClass(pdu.errorClass)),
                               Protocol::ToString(Protocol::DecodeErrorCode(pdu.errorCode)));
        },
        [](const TransportException& ex) -> std::string {
            return fmt::format("exception: {}", ex.detail);
        },
    }, response);
}

std::string Describe(const ConfirmedRequest& request) {
    return std::visit(Overloaded{
        [](const ReadPropertyMultipleRequest& r) -> std::string {
            return fmt::format("rpm {} x{}", ToString(r.object), r.properties.size());
        },
        [](const WritePropertyRequest& r) -> std::string {
            return fmt::format("write {}.{}", ToString(r.object), ToString(r.property));
        },
        [](const CreateObjectRequest& r) -> std::string {
            return fmt::format("create {}", ToString(r.object));
        },
        [](const DeleteObjectRequest& r) -> std::string {
            return fmt::format("delete {}", ToString(r.object));
        },
        [](const SubscribeCovRequest& r) -> std::string {
            return fmt::format("subscribe-cov {} pid={} lifetime={}s", ToString(r.object),
                               r.processId, r.lifetimeSeconds);
        },
    }, request);
}

} // namespace BACN::Transport
