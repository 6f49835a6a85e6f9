#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace beamstate::infra {

/**
 * @brief Seals credentials (Pushover token, user key) with libsodium secretbox.
 *
 * The key lives in a file readable only by the owner and is created on first
 * use. Sealed values are "bs1:" followed by base64(nonce || ciphertext), so
 * values written by another format are recognised and rejected.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    static constexpr const char* SEALED_PREFIX = "bs1:";

    /**
     * @param keyPath Key file, created if missing.
     */
    explicit SecureStorage(const std::filesystem::path& keyPath);

    /**
     * @brief Zeroes the key material.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Encrypts a secret.
     * @return The sealed value, or an empty string if the storage is not ready.
     */
    std::string seal(const std::string& plaintext) const;

    /**
     * @brief Decrypts a value produced by seal().
     * @return The secret, or nullopt for a foreign, truncated or tampered value.
     */
    std::optional<std::string> open(const std::string& sealed) const;

    /**
     * @brief True once libsodium is initialised and a key is loaded.
     */
    [[nodiscard]] bool isReady() const { return ready_; }

private:
    bool loadKey();
    bool createKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool ready_{false};
};

std::string base64Encode(const std::vector<unsigned char>& data);
std::optional<std::vector<unsigned char>> base64Decode(const std::string& encoded);

} // namespace beamstate::infra
