#pragma once
#include <cstdint>
namespace secnego::auth::enums {
enum class SecurityBufferType : uint32_t {
    Empty = 0,
    Data = 1,
    Token = 2,
    Missing = 4,
    Extra = 5,
    ChannelBindings = 14
};
constexpr const char* ToString(const SecurityBufferType type) noexcept {
    switch (type) {
        case SecurityBufferType::Empty:
            return "EMPTY";
        case SecurityBufferType::Data:
            return "DATA";
        case SecurityBufferType::Token:
            return "TOKEN";
        case SecurityBufferType::Missing:
            return "MISSING";
        case SecurityBufferType::Extra:
            return "EXTRA";
        case SecurityBufferType::ChannelBindings:
            return "CHANNEL_BINDINGS";
        default:
            return "UNKNOWN";
    }
}
}
