#include <catch2/catch_test_macros.hpp>

#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>

using namespace pingscope::infra;

namespace {

std::filesystem::path freshKeyPath() {
    auto dir = std::filesystem::temp_directory_path() / "pingscope_secure_test";
    std::filesystem::remove_all(dir);
    return dir / ".key";
}

} // namespace

TEST_CASE("SecureStorage key handling", "[SecureStorage]") {
    auto keyPath = freshKeyPath();

    SECTION("Creates a key on first use") {
        SecureStorage storage(keyPath);

        REQUIRE(storage.isReady());
        REQUIRE(std::filesystem::exists(keyPath));
        REQUIRE(std::filesystem::file_size(keyPath) == crypto_secretbox_KEYBYTES);
    }

    SECTION("Reuses an existing key") {
        std::string sealed;
        {
            SecureStorage first(keyPath);
            sealed = first.seal("bearer");
        }

        SecureStorage second(keyPath);
        REQUIRE(second.open(sealed) == std::string("bearer"));
    }

    std::filesystem::remove_all(keyPath.parent_path());
}

TEST_CASE("SecureStorage seal and open", "[SecureStorage]") {
    auto keyPath = freshKeyPath();
    SecureStorage storage(keyPath);
    REQUIRE(storage.isReady());

    SECTION("Sealed text hides the plaintext") {
        auto sealed = storage.seal("token-value");

        REQUIRE_FALSE(sealed.empty());
        REQUIRE(sealed.find("token-value") == std::string::npos);
        REQUIRE(storage.open(sealed) == std::string("token-value"));
    }

    SECTION("Each seal uses a fresh nonce") {
        REQUIRE(storage.seal("same") != storage.seal("same"));
    }

    SECTION("Tampered ciphertext is rejected") {
        auto sealed = storage.seal("token-value");
        sealed[sealed.size() / 2] = sealed[sealed.size() / 2] == 'A' ? 'B' : 'A';

        REQUIRE_FALSE(storage.open(sealed).has_value());
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(storage.open("").has_value());
        REQUIRE_FALSE(storage.open("!!not base64!!").has_value());
        REQUIRE_FALSE(storage.open("AAAA").has_value());
    }

    SECTION("Another key cannot open it") {
        auto sealed = storage.seal("token-value");
        auto otherPath = keyPath.parent_path() / "other.key";
        SecureStorage other(otherPath);

        REQUIRE_FALSE(other.open(sealed).has_value());
    }

    std::filesystem::remove_all(keyPath.parent_path());
}
