#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>

#include <sodium.h>

namespace pingscope::infra {

/**
 * @brief Encrypts small secrets such as API tokens with libsodium secret-box.
 *
 * The symmetric key lives in a file readable by the owner only and is created
 * on first use. Sealed values are Base64 text of the nonce followed by the
 * authenticated ciphertext, so they can be embedded in the JSON config.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    /**
     * @brief Opens or creates the key at @p keyPath.
     */
    explicit SecureStorage(std::filesystem::path keyPath);

    /**
     * @brief Destructor. Wipes key material from memory.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Checks whether a usable key is loaded.
     */
    [[nodiscard]] bool isReady() const { return ready_; }

    /**
     * @brief Seals a secret.
     * @return Base64 text, or an empty string if no key is loaded.
     */
    [[nodiscard]] std::string seal(const std::string& plaintext) const;

    /**
     * @brief Opens a sealed secret.
     * @return The plaintext, or nullopt if the text is malformed or was sealed
     *         with another key.
     */
    [[nodiscard]] std::optional<std::string> open(const std::string& sealed) const;

    [[nodiscard]] const std::filesystem::path& keyPath() const { return keyPath_; }

private:
    bool readKey();
    bool writeNewKey();

    std::filesystem::path keyPath_;
    std::array<unsigned char, crypto_secretbox_KEYBYTES> key_{};
    bool ready_{false};
};

} // namespace pingscope::infra
