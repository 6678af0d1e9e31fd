#pragma once
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
namespace secnego::auth::buffers {
/**
 * @brief Scope guard that owns a set of per-call resources
 *
 * Resources are moved in with AddResource() and destroyed in reverse order
 * of registration when the list goes out of scope or Release() is called,
 * on normal and error paths alike. Register a buffer before any descriptor
 * that points at it, so descriptors are torn down first.
 *
 * References returned by AddResource() stay valid until release.
 */
class DisposableList {
public:
    DisposableList() = default;
    DisposableList(const DisposableList&) = delete;
    DisposableList& operator=(const DisposableList&) = delete;
    DisposableList(DisposableList&&) noexcept = default;
    DisposableList& operator=(DisposableList&& other) noexcept {
        if (this != &other) {
            Release();
            entries_ = std::move(other.entries_);
        }
        return *this;
    }
    ~DisposableList() { Release(); }

    template<typename T>
    T& AddResource(T resource) {
        auto holder = std::make_unique<Holder<T>>(std::move(resource));
        T& ref = holder->value;
        entries_.push_back(std::move(holder));
        return ref;
    }

    [[nodiscard]] size_t Count() const noexcept { return entries_.size(); }

    void Release() noexcept {
        while (!entries_.empty()) {
            entries_.pop_back();
        }
    }

private:
    struct Entry {
        virtual ~Entry() = default;
    };

    template<typename T>
    struct Holder final : Entry {
        explicit Holder(T v) : value(std::move(v)) {}
        T value;
    };

    std::vector<std::unique_ptr<Entry>> entries_;
};
}
