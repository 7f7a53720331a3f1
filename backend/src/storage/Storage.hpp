#pragma once
#include <vector>
#include <string>
#include "../core/VocabItem.hpp"
#include "../core/DrillSession.hpp"

// Storage handles encrypted item and session files.
//
// File layout:
//   Header: 8 bytes ASCII "ULXDAT1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Plaintext is line based, one record per item/session, each terminated by "---".
// save/load require a derived key of crypto_secretbox_KEYBYTES; otherwise they return false.
// A missing file loads as an empty collection.

class Storage {
public:
    // ITEMS
    static bool saveItems(const std::vector<VocabItem>& items, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadItems(std::vector<VocabItem>& items, const std::string& filename, const std::vector<unsigned char>& key);

    // SESSIONS
    static bool saveSessions(const std::vector<DrillSession>& sessions, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadSessions(std::vector<DrillSession>& sessions, const std::string& filename, const std::vector<unsigned char>& key);

    // Plaintext codec, exposed for tests
    static std::string serializeItems(const std::vector<VocabItem>& items);
    static bool parseItems(const std::string& plain, std::vector<VocabItem>& items);
    static std::string serializeSessions(const std::vector<DrillSession>& sessions);
    static bool parseSessions(const std::string& plain, std::vector<DrillSession>& sessions);

private:
    static bool writeEncrypted(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key);
    // found=false when the file does not exist
    static bool readEncrypted(std::string& plain, bool& found, const std::string& filename, const std::vector<unsigned char>& key);
};
