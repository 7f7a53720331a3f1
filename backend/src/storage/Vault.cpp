#include "Vault.hpp"
#include <fstream>
#include <sodium.h>
#include <spdlog/spdlog.h>

// constants for key derivation
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;      // recommended salt size

// Helper: hex-encode salt bytes to string
static std::string saltToHex(const unsigned char* salt, size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), salt, len);
    hex.resize(2 * len);
    return hex;
}

// Helper: hex string to bytes
static bool hexToSalt(const std::string& hex, std::vector<unsigned char>& out) {
    out.resize(SALT_BYTES);
    size_t bin_len = 0;

    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        spdlog::error("Failed to convert hex salt to binary");
        return false;
    }

    if (bin_len != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        return false;
    }

    return true;
}

Vault::Vault(const std::string& saltFile)
    : saltFilePath(saltFile)
{
    spdlog::debug("Vault initialized with salt file '{}'", saltFilePath);
}

Vault::~Vault() {
    lock();
}

bool Vault::loadOrCreateSalt(std::vector<unsigned char>& salt) {
    std::ifstream in(saltFilePath);
    if (in) {
        std::string hex;
        std::getline(in, hex);
        return hexToSalt(hex, salt);
    }

    spdlog::info("No salt at '{}'; creating a new one", saltFilePath);
    salt.assign(SALT_BYTES, 0);
    randombytes_buf(salt.data(), salt.size());

    std::ofstream out(saltFilePath, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing salt", saltFilePath);
        return false;
    }
    out << saltToHex(salt.data(), salt.size()) << "\n";
    return static_cast<bool>(out);
}

bool Vault::unlock(const std::string& passphrase) {
    spdlog::debug("Deriving data key (not logging passphrase or salt)");
    lock();

    if (passphrase.empty()) {
        spdlog::warn("Cannot unlock vault: empty passphrase");
        return false;
    }

    std::vector<unsigned char> salt;
    if (!loadOrCreateSalt(salt)) {
        spdlog::error("Failed to obtain salt for key derivation");
        return false;
    }

    key_.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key_.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation (likely out of memory)");
        key_.clear();
        return false;
    }

    spdlog::info("Vault unlocked");
    return true;
}

void Vault::lock() {
    if (!key_.empty()) {
        spdlog::debug("Clearing data key from memory");
        sodium_memzero(key_.data(), key_.size());
        key_.clear();
    }
}

const std::vector<unsigned char>& Vault::key() const {
    return key_;
}
