#include <catch2/catch_test_macros.hpp>
#include "secnego/buffers/security_buffer.hpp"
#include "secnego/buffers/security_buffer_desc.hpp"
#include "secnego/buffers/buffer_utils.hpp"
#include "secnego/crypto/sodium_interop.hpp"
#include <algorithm>
#include <vector>
using namespace secnego::auth;
using namespace secnego::auth::buffers;
using secnego::auth::crypto::SodiumInterop;
using secnego::auth::enums::SecurityBufferType;

TEST_CASE("SecurityBuffer - Allocation", "[buffers]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocated buffer is empty with full capacity") {
        auto buffer = SecurityBuffer::Allocate(SecurityBufferType::Token, 256).Unwrap();
        REQUIRE(buffer.Type() == SecurityBufferType::Token);
        REQUIRE(buffer.Capacity() == 256);
        REQUIRE(buffer.Length() == 0);
        REQUIRE(buffer.View().empty());
        REQUIRE_FALSE(buffer.Overflowed());
    }
    SECTION("FromBytes copies data and sets length") {
        std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
        auto buffer = SecurityBuffer::FromBytes(SecurityBufferType::Token, data).Unwrap();
        REQUIRE(buffer.Length() == 4);
        REQUIRE(buffer.Capacity() == 4);
        REQUIRE(buffer.ToArray().Unwrap() == data);
    }
    SECTION("FromBytes with no data yields a zero-capacity buffer") {
        auto buffer = SecurityBuffer::FromBytes(SecurityBufferType::Token, {}).Unwrap();
        REQUIRE(buffer.Capacity() == 0);
        REQUIRE(buffer.Length() == 0);
        REQUIRE(buffer.View().empty());
        REQUIRE(buffer.ToArray().Unwrap().empty());
    }
    SECTION("Zero capacity allocation fails") {
        REQUIRE(SecurityBuffer::Allocate(SecurityBufferType::Token, 0).IsErr());
    }
}

TEST_CASE("SecurityBuffer - Assign", "[buffers]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto buffer = SecurityBuffer::Allocate(SecurityBufferType::Token, 8).Unwrap();
    SECTION("Assign within capacity sets the view") {
        std::vector<uint8_t> data = {1, 2, 3};
        REQUIRE(buffer.Assign(data).IsOk());
        REQUIRE(buffer.Length() == 3);
        REQUIRE(std::equal(data.begin(), data.end(), buffer.View().begin(), buffer.View().end()));
    }
    SECTION("Assign exactly the capacity is accepted") {
        std::vector<uint8_t> data(8, 0x33);
        REQUIRE(buffer.Assign(data).IsOk());
        REQUIRE(buffer.Length() == 8);
        REQUIRE_FALSE(buffer.Overflowed());
    }
    SECTION("Assign beyond capacity fails and is remembered") {
        std::vector<uint8_t> data(9, 0x33);
        auto result = buffer.Assign(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == secnego::auth::SodiumFailureType::BufferTooSmall);
        REQUIRE(buffer.Overflowed());
        REQUIRE(buffer.RequestedLength() == 9);
        REQUIRE(buffer.Length() == 0);
    }
    SECTION("SetLength after writing in place") {
        auto writable = buffer.WritableView();
        REQUIRE(writable.size() == 8);
        writable[0] = 0xAA;
        writable[1] = 0xBB;
        REQUIRE(buffer.SetLength(2).IsOk());
        REQUIRE(buffer.ToArray().Unwrap() == std::vector<uint8_t>{0xAA, 0xBB});
        REQUIRE(buffer.SetLength(9).IsErr());
        REQUIRE(buffer.Overflowed());
    }
    SECTION("Clear resets length and overflow") {
        std::vector<uint8_t> big(9, 0x01);
        REQUIRE(buffer.Assign(big).IsErr());
        REQUIRE(buffer.Clear().IsOk());
        REQUIRE(buffer.Length() == 0);
        REQUIRE_FALSE(buffer.Overflowed());
    }
}

TEST_CASE("SecurityBufferDesc - Lookup", "[buffers]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto token = SecurityBuffer::Allocate(SecurityBufferType::Token, 16).Unwrap();
    auto extra = SecurityBuffer::Allocate(SecurityBufferType::Extra, 16).Unwrap();
    SecurityBufferDesc desc{&token, &extra};
    REQUIRE(desc.Count() == 2);
    REQUIRE(desc.At(0) == &token);
    REQUIRE(desc.At(1) == &extra);
    REQUIRE(desc.At(2) == nullptr);
    REQUIRE(desc.Find(SecurityBufferType::Extra) == &extra);
    REQUIRE(desc.Find(SecurityBufferType::ChannelBindings) == nullptr);
}

TEST_CASE("Buffer utilities - Zero and Fill", "[buffers]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto buffer = AllocateTokenBuffer(32).Unwrap();
    REQUIRE(buffer.Type() == SecurityBufferType::Token);
    SECTION("Fill covers the whole capacity") {
        REQUIRE(FillBuffer(buffer, 0x9C).IsOk());
        REQUIRE(buffer.SetLength(32).IsOk());
        auto bytes = buffer.ToArray().Unwrap();
        REQUIRE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0x9C; }));
    }
    SECTION("Zero leaves the length unchanged") {
        std::vector<uint8_t> data(10, 0x42);
        REQUIRE(buffer.Assign(data).IsOk());
        REQUIRE(ZeroBuffer(buffer).IsOk());
        REQUIRE(buffer.Length() == 10);
        auto bytes = buffer.ToArray().Unwrap();
        REQUIRE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("ToTokenBuffer wraps peer bytes") {
        std::vector<uint8_t> peer = {5, 6, 7};
        auto wrapped = ToTokenBuffer(peer).Unwrap();
        REQUIRE(wrapped.Type() == SecurityBufferType::Token);
        REQUIRE(wrapped.ToArray().Unwrap() == peer);
    }
    SECTION("Zero and fill on an empty buffer succeed") {
        auto empty = ToTokenBuffer({}).Unwrap();
        REQUIRE(ZeroBuffer(empty).IsOk());
        REQUIRE(FillBuffer(empty, 0x01).IsOk());
    }
}
