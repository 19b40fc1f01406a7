#include "infrastructure/crypto/SecureStorage.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace pingscope::infra {

namespace {

constexpr auto BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

std::string toBase64(const std::vector<unsigned char>& bytes) {
    std::string text(sodium_base64_encoded_len(bytes.size(), BASE64_VARIANT), '\0');
    sodium_bin2base64(text.data(), text.size(), bytes.data(), bytes.size(), BASE64_VARIANT);
    text.resize(std::char_traits<char>::length(text.c_str()));
    return text;
}

std::optional<std::vector<unsigned char>> fromBase64(const std::string& text) {
    std::vector<unsigned char> bytes(text.size());
    size_t length = 0;
    if (sodium_base642bin(bytes.data(), bytes.size(), text.c_str(), text.size(), nullptr,
                          &length, nullptr, BASE64_VARIANT) != 0) {
        return std::nullopt;
    }
    bytes.resize(length);
    return bytes;
}

} // namespace

SecureStorage::SecureStorage(std::filesystem::path keyPath) : keyPath_(std::move(keyPath)) {
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        return;
    }

    ready_ = readKey() || writeNewKey();
}

SecureStorage::~SecureStorage() {
    sodium_memzero(key_.data(), key_.size());
}

bool SecureStorage::readKey() {
    std::error_code ec;
    if (!std::filesystem::exists(keyPath_, ec)) {
        return false;
    }

    std::ifstream file(keyPath_, std::ios::binary);
    file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(key_.size()));
    if (file.gcount() != static_cast<std::streamsize>(key_.size())) {
        spdlog::warn("Key file {} is truncated, replacing it", keyPath_.string());
        return false;
    }

    spdlog::debug("Loaded token key from {}", keyPath_.string());
    return true;
}

bool SecureStorage::writeNewKey() {
    crypto_secretbox_keygen(key_.data());

    std::error_code ec;
    if (auto parent = keyPath_.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to create key file: {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()),
               static_cast<std::streamsize>(key_.size()));
    file.close();

#ifndef _WIN32
    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }
#endif

    spdlog::info("Created token key at {}", keyPath_.string());
    return true;
}

std::string SecureStorage::seal(const std::string& plaintext) const {
    if (!ready_) {
        spdlog::error("Cannot seal secret: no key loaded");
        return {};
    }

    // nonce || mac || ciphertext
    std::vector<unsigned char> box(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES +
                                   plaintext.size());
    unsigned char* nonce = box.data();
    randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);

    if (crypto_secretbox_easy(box.data() + crypto_secretbox_NONCEBYTES,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), nonce, key_.data()) != 0) {
        spdlog::error("Encryption failed");
        return {};
    }
    return toBase64(box);
}

std::optional<std::string> SecureStorage::open(const std::string& sealed) const {
    if (!ready_) {
        spdlog::error("Cannot open secret: no key loaded");
        return std::nullopt;
    }

    auto box = fromBase64(sealed);
    if (!box || box->size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
        spdlog::warn("Sealed secret is malformed");
        return std::nullopt;
    }

    const unsigned char* nonce = box->data();
    const unsigned char* cipher = box->data() + crypto_secretbox_NONCEBYTES;
    const size_t cipherLength = box->size() - crypto_secretbox_NONCEBYTES;

    std::string plaintext(cipherLength - crypto_secretbox_MACBYTES, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()), cipher,
                                   cipherLength, nonce, key_.data()) != 0) {
        spdlog::warn("Sealed secret failed authentication");
        return std::nullopt;
    }
    return plaintext;
}

} // namespace pingscope::infra
