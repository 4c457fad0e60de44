#include <catch2/catch_test_macros.hpp>
#include "agentreg/checks.hpp"
#include "agentreg/primitives.hpp"
#include "agentreg/types.hpp"
#include <unordered_set>

using namespace agentreg;

TEST_CASE("Address hex parsing", "[primitives]")
{
    auto a = Address::from_hex("0x00000000000000000000000000000000000000Ab");
    REQUIRE(a.has_value());
    REQUIRE(a->bytes[19] == 0xab);
    REQUIRE(a->to_hex() == "0x00000000000000000000000000000000000000ab");
    REQUIRE_FALSE(a->is_zero());

    SECTION("Prefix is optional")
    {
        auto b = Address::from_hex("00000000000000000000000000000000000000ab");
        REQUIRE(b.has_value());
        REQUIRE(*b == *a);
    }

    SECTION("Wrong length is rejected")
    {
        auto bad = Address::from_hex("0xabcd");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::InvalidInput);
    }

    SECTION("Non-hex characters are rejected")
    {
        REQUIRE_FALSE(Address::from_hex("0xzz000000000000000000000000000000000000ab").has_value());
    }
}

TEST_CASE("Zero address", "[primitives]")
{
    REQUIRE(Address::zero().is_zero());
    REQUIRE(Address::zero().to_hex() == "0x0000000000000000000000000000000000000000");
}

TEST_CASE("Hash32 parsing and hashing", "[primitives]")
{
    std::string text = "0x" + std::string(62, '0') + "ff";
    auto h = Hash32::from_hex(text);
    REQUIRE(h.has_value());
    REQUIRE(h->to_hex() == text);
    REQUIRE_FALSE(Hash32::from_hex("0xff").has_value());

    std::unordered_set<Hash32> set{*h};
    REQUIRE(set.contains(*h));
    REQUIRE(optional_hash_to_hex(std::nullopt).empty());
}

TEST_CASE("Error codes map to taxonomy", "[types]")
{
    REQUIRE(kind_of(ErrorCode::FieldTooLong) == ErrorKind::Input);
    REQUIRE(kind_of(ErrorCode::AgentNotFound) == ErrorKind::Reference);
    REQUIRE(kind_of(ErrorCode::SelfFeedback) == ErrorKind::Authorization);
    REQUIRE(kind_of(ErrorCode::ThreadFull) == ErrorKind::State);
    REQUIRE(kind_of(ErrorCode::IntegrityViolation) == ErrorKind::Integrity);
    REQUIRE(kind_of(ErrorCode::StorageError) == ErrorKind::Environment);

    auto err = RegistryError::too_long("uri", 2048);
    REQUIRE(err.code == ErrorCode::FieldTooLong);
    REQUIRE(std::string(err.what()) == "uri exceeds 2048 characters");
    REQUIRE(error_code_to_string(ErrorCode::ThreadFull) == "ThreadFull");
}

TEST_CASE("UTF-8 validation", "[primitives][checks]")
{
    REQUIRE(checks::is_utf8(""));
    REQUIRE(checks::is_utf8("ipfs://agent"));
    REQUIRE(checks::is_utf8("caf\xc3\xa9"));
    REQUIRE(checks::is_utf8("\xe2\x82\xac"));
    REQUIRE(checks::is_utf8("\xf0\x9f\x98\x80"));

    REQUIRE_FALSE(checks::is_utf8("\xff"));
    REQUIRE_FALSE(checks::is_utf8("\xc3"));          // truncated
    REQUIRE_FALSE(checks::is_utf8("\xc0\xaf"));      // overlong '/'
    REQUIRE_FALSE(checks::is_utf8("\xed\xa0\x80")); // surrogate
    REQUIRE_FALSE(checks::is_utf8("\xf4\x90\x80\x80"));
    REQUIRE_FALSE(checks::is_utf8("\x80"));

    auto res = checks::text("uri", "ipfs://\xff", 2048);
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
    REQUIRE(checks::text("uri", std::string(3, 'a'), 2).error().code == ErrorCode::FieldTooLong);
}
