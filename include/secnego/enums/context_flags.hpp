#pragma once

#include <cstdint>
#include <type_traits>

namespace secnego::auth::enums {

/**
 * @brief Attributes requested from the provider when accepting a context
 *
 * Bit layout matches the ASC_REQ_* constants.
 */
enum class AcceptContextReqFlags : uint32_t {
    None = 0,
    Delegate = 0x00000001,
    MutualAuth = 0x00000002,
    ReplayDetect = 0x00000004,
    SequenceDetect = 0x00000008,
    Confidentiality = 0x00000010,
    UseSessionKey = 0x00000020,
    SessionTicket = 0x00000040,
    AllocateMemory = 0x00000100,
    UseDceStyle = 0x00000200,
    Datagram = 0x00000400,
    Connection = 0x00000800,
    CallLevel = 0x00001000,
    FragmentSupplied = 0x00002000,
    ExtendedError = 0x00008000,
    Stream = 0x00010000,
    Integrity = 0x00020000,
    Licensing = 0x00040000,
    Identify = 0x00080000,
    AllowNullSessions = 0x00100000,
    AllowNonUserLogons = 0x00200000,
    AllowContextReplay = 0x00400000,
    FragmentToFit = 0x00800000,
    NoToken = 0x01000000,
    ProxyBindings = 0x04000000,
    AllowMissingBindings = 0x10000000
};

/**
 * @brief Attributes the provider actually established (ASC_RET_* layout)
 */
enum class AcceptContextRetFlags : uint32_t {
    None = 0,
    Delegate = 0x00000001,
    MutualAuth = 0x00000002,
    ReplayDetect = 0x00000004,
    SequenceDetect = 0x00000008,
    Confidentiality = 0x00000010,
    UseSessionKey = 0x00000020,
    SessionTicket = 0x00000040,
    AllocatedMemory = 0x00000100,
    UsedDceStyle = 0x00000200,
    Datagram = 0x00000400,
    Connection = 0x00000800,
    CallLevel = 0x00002000,
    ThirdLegFailed = 0x00004000,
    ExtendedError = 0x00008000,
    Stream = 0x00010000,
    Integrity = 0x00020000,
    Licensing = 0x00040000,
    Identify = 0x00080000,
    NullSession = 0x00100000,
    AllowNonUserLogons = 0x00200000,
    AllowContextReplay = 0x00400000,
    FragmentOnly = 0x00800000,
    NoToken = 0x01000000,
    NoAdditionalToken = 0x02000000
};

template<typename T>
struct IsContextFlags : std::false_type {};
template<>
struct IsContextFlags<AcceptContextReqFlags> : std::true_type {};
template<>
struct IsContextFlags<AcceptContextRetFlags> : std::true_type {};

template<typename T>
concept ContextFlags = IsContextFlags<T>::value;

template<ContextFlags T>
constexpr T operator|(const T lhs, const T rhs) noexcept {
    using U = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<U>(lhs) | static_cast<U>(rhs));
}

template<ContextFlags T>
constexpr T operator&(const T lhs, const T rhs) noexcept {
    using U = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<U>(lhs) & static_cast<U>(rhs));
}

template<ContextFlags T>
constexpr T operator~(const T value) noexcept {
    using U = std::underlying_type_t<T>;
    return static_cast<T>(~static_cast<U>(value));
}

template<ContextFlags T>
constexpr T& operator|=(T& lhs, const T rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

template<ContextFlags T>
constexpr T& operator&=(T& lhs, const T rhs) noexcept {
    lhs = lhs & rhs;
    return lhs;
}

template<ContextFlags T>
constexpr bool HasFlag(const T value, const T flag) noexcept {
    return (value & flag) == flag;
}

template<ContextFlags T>
constexpr uint32_t ToNative(const T value) noexcept {
    return static_cast<uint32_t>(value);
}

} // namespace secnego::auth::enums
