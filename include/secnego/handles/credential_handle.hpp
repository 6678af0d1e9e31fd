#pragma once
#include "secnego/handles/sec_handle.hpp"
#include <string>
#include <utility>
namespace secnego::auth::handles {
/**
 * @brief Borrowed reference to credentials acquired outside this library
 *
 * Copying a CredentialHandle copies the reference, never the credentials.
 * Nothing in this library releases the native handle: the owner must keep
 * the credentials alive until every context that borrowed them is disposed.
 */
class CredentialHandle {
public:
    explicit CredentialHandle(const SecHandle native, std::string package_name = {})
        : native_(native), package_name_(std::move(package_name)) {}

    [[nodiscard]] const SecHandle& Native() const noexcept { return native_; }
    [[nodiscard]] const std::string& PackageName() const noexcept { return package_name_; }
    [[nodiscard]] bool IsValid() const noexcept { return !native_.IsEmpty(); }

private:
    SecHandle native_;
    std::string package_name_;
};
}
