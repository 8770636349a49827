#include "Storage.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "CADENCE1\n";

static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

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

// Write to a temporary file then rename it over the target.
static bool replaceFile(const std::string& filename, const std::string& bytes) {
    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp);
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' over '{}'", tmp, filename);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool Storage::loadOrCreateSalt(const std::string& filename, std::vector<unsigned char>& salt) {
    std::ifstream in(filename);
    if (in) {
        std::string hex;
        std::getline(in, hex);
        spdlog::debug("Loaded salt from '{}'", filename);
        return hexToSalt(hex, salt);
    }

    spdlog::info("Salt file '{}' not found; creating a new one", filename);
    salt.assign(SALT_BYTES, 0);
    randombytes_buf(salt.data(), salt.size());
    return replaceFile(filename, saltToHex(salt.data(), salt.size()) + "\n");
}

bool Storage::deriveKey(const std::string& passphrase,
    const std::vector<unsigned char>& salt,
    std::vector<unsigned char>& key)
{
    spdlog::debug("Deriving storage key (not logging passphrase or salt)");

    if (passphrase.empty()) {
        spdlog::error("Cannot derive storage key: passphrase is empty");
        return false;
    }
    if (salt.size() != SALT_BYTES) {
        spdlog::error("Cannot derive storage key: bad salt size {}", salt.size());
        return false;
    }

    key.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        key.clear();
        return false;
    }

    spdlog::debug("Storage key derived successfully");
    return true;
}

void Storage::wipeKey(std::vector<unsigned char>& key) {
    if (key.empty()) return;
    sodium_memzero(key.data(), key.size());
    key.clear();
}

bool Storage::writeEncrypted(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::debug("Writing {} plaintext bytes encrypted to '{}'", plain.size(), filename);
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::string bytes;
    bytes.reserve(sizeof(MAGIC_HDR) - 1 + sizeof(nonce) + ciphertext.size());
    bytes.append(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    bytes.append(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    bytes.append(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());

    return replaceFile(filename, bytes);
}

bool Storage::readEncrypted(std::string& plain, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::debug("Reading encrypted file '{}'", filename);
    plain.clear();

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("File '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> decrypted(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(decrypted.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption of '{}' failed (wrong passphrase or corrupted file)", filename);
        return false;
    }

    plain.assign(reinterpret_cast<const char*>(decrypted.data()), decrypted.size());
    sodium_memzero(decrypted.data(), decrypted.size());
    return true;
}

std::string Storage::serializeStates(const std::vector<SchedulingState>& states) {
    std::ostringstream oss;
    oss.precision(17);

    for (const auto& s : states) {
        oss << s.user_id << "\n"
            << s.flashcard_id << "\n"
            << s.ease_factor << " "
            << s.interval_days << " "
            << s.repetitions << " "
            << s.due_date << " "
            << (s.last_reviewed_at ? *s.last_reviewed_at : -1) << " "
            << s.times_reviewed << " "
            << s.times_correct << " "
            << s.version << "\n"
            << "---\n";
    }

    return oss.str();
}

bool Storage::parseStates(const std::string& plain, std::vector<SchedulingState>& states) {
    std::istringstream iss(plain);
    states.clear();

    while (true) {
        SchedulingState s;
        if (!std::getline(iss, s.user_id)) break;
        if (!std::getline(iss, s.flashcard_id)) {
            spdlog::error("Truncated state row for user '{}'", s.user_id);
            return false;
        }

        std::string fields;
        if (!std::getline(iss, fields)) {
            spdlog::error("Missing fields for card '{}'", s.flashcard_id);
            return false;
        }

        std::istringstream fss(fields);
        std::time_t last = -1;
        if (!(fss >> s.ease_factor >> s.interval_days >> s.repetitions >> s.due_date
            >> last >> s.times_reviewed >> s.times_correct >> s.version))
        {
            spdlog::error("Malformed fields for card '{}'", s.flashcard_id);
            return false;
        }
        if (last >= 0) s.last_reviewed_at = last;

        std::string sep;
        std::getline(iss, sep);
        if (sep != "---") {
            spdlog::error("Missing row separator after card '{}'", s.flashcard_id);
            return false;
        }

        states.push_back(s);
    }

    spdlog::debug("Parsed {} state rows", states.size());
    return true;
}
