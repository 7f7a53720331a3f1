#pragma once

#include <string>
#include <vector>

// Holds the data key for the current session, derived from a passphrase (libsodium Argon2id)
// and a per-installation salt stored hex-encoded in `saltFile`. The salt is created on first unlock.
class Vault {
public:
    explicit Vault(const std::string& saltFile = "unilex.salt");
    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // returns true on success, false on failure
    bool unlock(const std::string& passphrase);

    // Zeroes the key
    void lock();

    bool isUnlocked() const { return !key_.empty(); }

    // Empty when locked
    const std::vector<unsigned char>& key() const;

private:
    std::string saltFilePath;
    std::vector<unsigned char> key_;

    bool loadOrCreateSalt(std::vector<unsigned char>& salt);
};
