#pragma once
#include <string>
#include <vector>
#include "../core/SchedulingState.hpp"

// Storage handles the encrypted on-disk files of a user's data directory.
//
// Salt file: one line, hex-encoded crypto_pwhash salt (not secret).
// Encrypted files:
//   Header: 9 bytes ASCII "CADENCE1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Files are written to "<name>.tmp" and renamed over the target, so a failed
// write never leaves a half-written file behind.
// All helpers return false (after logging) instead of throwing.

class Storage {
public:
    // KEYS
    static bool loadOrCreateSalt(const std::string& filename, std::vector<unsigned char>& salt);
    static bool deriveKey(const std::string& passphrase,
        const std::vector<unsigned char>& salt,
        std::vector<unsigned char>& key);
    static void wipeKey(std::vector<unsigned char>& key);

    // ENCRYPTED BLOBS
    static bool writeEncrypted(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key);
    // Missing file -> true with empty `plain`.
    static bool readEncrypted(std::string& plain, const std::string& filename, const std::vector<unsigned char>& key);

    // STATE ROWS (plain text, one block per row terminated by "---")
    static std::string serializeStates(const std::vector<SchedulingState>& states);
    static bool parseStates(const std::string& plain, std::vector<SchedulingState>& states);
};
