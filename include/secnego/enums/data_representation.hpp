#pragma once
#include <cstdint>
namespace secnego::auth::enums {
enum class DataRepresentation : uint32_t {
    Network = 0x00000000,
    Native = 0x00000010
};
constexpr const char* ToString(const DataRepresentation rep) noexcept {
    switch (rep) {
        case DataRepresentation::Network:
            return "NETWORK";
        case DataRepresentation::Native:
            return "NATIVE";
        default:
            return "UNKNOWN";
    }
}
}
