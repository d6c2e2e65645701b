#pragma once

#include <string>
#include <string_view>

#include "../Core/Error.hpp"

namespace BACN::Net {

struct InterfaceAddresses {
    std::string name;
    std::string address;     // dotted quad
    std::string broadcast;   // dotted quad
};

// First non-loopback IPv4 interface that is up. Broadcast comes from the
// interface itself, or is derived from address | ~netmask.
[[nodiscard]] Result<InterfaceAddresses> PrimaryInterface();

[[nodiscard]] bool IsValidIPv4(std::string_view text);

// address | ~netmask for two dotted quads.
[[nodiscard]] Result<std::string> DeriveBroadcast(std::string_view address, std::string_view netmask);

} // namespace BACN::Net
