#include <catch2/catch_test_macros.hpp>
#include "secnego/buffers/disposable_list.hpp"
#include <memory>
#include <string>
#include <vector>
using namespace secnego::auth::buffers;

namespace {

class Recorder {
public:
    Recorder(std::string name, std::shared_ptr<std::vector<std::string>> log)
        : name_(std::move(name)), log_(std::move(log)) {}
    Recorder(Recorder&& other) noexcept
        : name_(std::move(other.name_)), log_(std::move(other.log_)) {}
    Recorder(const Recorder&) = delete;
    ~Recorder() {
        if (log_) {
            log_->push_back(name_);
        }
    }
    [[nodiscard]] const std::string& Name() const { return name_; }

private:
    std::string name_;
    std::shared_ptr<std::vector<std::string>> log_;
};

}

TEST_CASE("DisposableList - Release order", "[buffers][lifetime]") {
    auto log = std::make_shared<std::vector<std::string>>();
    SECTION("Resources are destroyed in reverse order on scope exit") {
        {
            DisposableList scope;
            scope.AddResource(Recorder("output_buffer", log));
            scope.AddResource(Recorder("input_buffer", log));
            scope.AddResource(Recorder("descriptor", log));
            REQUIRE(scope.Count() == 3);
            REQUIRE(log->empty());
        }
        REQUIRE(*log == std::vector<std::string>{"descriptor", "input_buffer", "output_buffer"});
    }
    SECTION("Early return path releases everything") {
        auto run = [&]() -> bool {
            DisposableList scope;
            scope.AddResource(Recorder("first", log));
            scope.AddResource(Recorder("second", log));
            return false;
        };
        REQUIRE_FALSE(run());
        REQUIRE(*log == std::vector<std::string>{"second", "first"});
    }
    SECTION("Explicit Release is idempotent") {
        DisposableList scope;
        scope.AddResource(Recorder("only", log));
        scope.Release();
        scope.Release();
        REQUIRE(scope.Count() == 0);
        REQUIRE(log->size() == 1);
    }
}

TEST_CASE("DisposableList - References stay valid", "[buffers][lifetime]") {
    DisposableList scope;
    auto& first = scope.AddResource(std::vector<int>{1, 2, 3});
    for (int i = 0; i < 100; ++i) {
        scope.AddResource(std::vector<int>(static_cast<size_t>(i)));
    }
    REQUIRE(first.size() == 3);
    REQUIRE(first[2] == 3);
}

TEST_CASE("DisposableList - Move transfers ownership", "[buffers][lifetime]") {
    auto log = std::make_shared<std::vector<std::string>>();
    {
        DisposableList outer;
        {
            DisposableList inner;
            inner.AddResource(Recorder("moved", log));
            outer = std::move(inner);
        }
        REQUIRE(log->empty());
    }
    REQUIRE(*log == std::vector<std::string>{"moved"});
}
