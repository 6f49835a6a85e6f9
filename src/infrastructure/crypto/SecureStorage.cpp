#include "infrastructure/crypto/SecureStorage.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <fstream>

namespace beamstate::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;
constexpr int BASE64_VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

} // namespace

SecureStorage::SecureStorage(const std::filesystem::path& keyPath) : keyPath_(keyPath) {
    if (sodium_init() < 0) {
        spdlog::error("libsodium could not be initialised, secrets are unavailable");
        return;
    }

    key_.resize(KEY_SIZE);
    ready_ = std::filesystem::exists(keyPath_) ? loadKey() : createKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

bool SecureStorage::loadKey() {
    std::ifstream file(keyPath_, std::ios::binary);
    file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    if (file.gcount() != static_cast<std::streamsize>(KEY_SIZE)) {
        // Replacing the key would orphan every stored secret
        spdlog::error("Key file {} is unreadable or truncated", keyPath_.string());
        return false;
    }
    spdlog::debug("Loaded secret key from {}", keyPath_.string());
    return true;
}

bool SecureStorage::createKey() {
    crypto_secretbox_keygen(key_.data());

    std::error_code ec;
    if (auto parent = keyPath_.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot create key file {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Created secret key {}", keyPath_.string());
    return true;
}

std::string SecureStorage::seal(const std::string& plaintext) const {
    if (!ready_) {
        spdlog::error("Cannot seal secret, key not loaded");
        return {};
    }

    std::vector<unsigned char> box(NONCE_SIZE + MAC_SIZE + plaintext.size());
    unsigned char* nonce = box.data();
    randombytes_buf(nonce, NONCE_SIZE);

    crypto_secretbox_easy(box.data() + NONCE_SIZE,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          plaintext.size(), nonce, key_.data());

    return std::string(SEALED_PREFIX) + base64Encode(box);
}

std::optional<std::string> SecureStorage::open(const std::string& sealed) const {
    if (!ready_) {
        spdlog::error("Cannot open secret, key not loaded");
        return std::nullopt;
    }

    const size_t prefixLength = std::strlen(SEALED_PREFIX);
    if (sealed.compare(0, prefixLength, SEALED_PREFIX) != 0) {
        spdlog::warn("Stored secret has an unknown format");
        return std::nullopt;
    }

    auto box = base64Decode(sealed.substr(prefixLength));
    if (!box || box->size() < NONCE_SIZE + MAC_SIZE) {
        spdlog::warn("Stored secret is truncated");
        return std::nullopt;
    }

    std::string plaintext(box->size() - NONCE_SIZE - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()),
                                   box->data() + NONCE_SIZE, box->size() - NONCE_SIZE,
                                   box->data(), key_.data()) != 0) {
        spdlog::warn("Stored secret failed authentication");
        return std::nullopt;
    }
    return plaintext;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    const size_t length = sodium_base64_encoded_len(data.size(), BASE64_VARIANT);
    std::string encoded(length, '\0');
    sodium_bin2base64(encoded.data(), length, data.data(), data.size(), BASE64_VARIANT);
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

std::optional<std::vector<unsigned char>> base64Decode(const std::string& encoded) {
    std::vector<unsigned char> decoded(encoded.size());
    size_t length = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(),
                          nullptr, &length, nullptr, BASE64_VARIANT) != 0) {
        return std::nullopt;
    }
    decoded.resize(length);
    return decoded;
}

} // namespace beamstate::infra
