#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace secnego::auth {
struct Constants {
    static constexpr size_t DEFAULT_OUTPUT_TOKEN_BUFFER_SIZE = 64 * 1024;
    static constexpr size_t MIN_OUTPUT_TOKEN_BUFFER_SIZE = 1;
    static constexpr size_t MAX_OUTPUT_TOKEN_BUFFER_SIZE = 1024 * 1024;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
    static constexpr size_t TOKEN_SEGMENT_INDEX = 0;
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
    static constexpr uint8_t SECURE_WIPE_PATTERN = 0;
};
struct EnvelopeConstants {
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t MAX_TOKEN_SIZE = Constants::MAX_OUTPUT_TOKEN_BUFFER_SIZE;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view CONTEXT_DISPOSED = "Authentication context has been disposed";
    static constexpr std::string_view CONTEXT_ALREADY_DONE = "Authentication already completed; no further rounds are accepted";
    static constexpr std::string_view CONTEXT_FAILED = "Authentication failed in a previous round";
    static constexpr std::string_view CONTEXT_NOT_DONE = "Authentication has not completed";
    static constexpr std::string_view PROVIDER_REQUIRED = "Security provider is required";
};
}
