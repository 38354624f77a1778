#include "Identity.hpp"
#include <sodium.h>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace shortgap {

    bool initializeIdentity() {
        // sodium_init returns 1 when the library was already initialized
        if (sodium_init() < 0) {
            std::cerr << "Identity: failed to initialize libsodium" << std::endl;
            return false;
        }
        return true;
    }

    std::string randomHex(size_t bytes) {
        if (bytes == 0) {
            return "";
        }

        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium not initialized");
        }

        std::vector<unsigned char> raw(bytes);
        randombytes_buf(raw.data(), raw.size());

        std::string hex(bytes * 2 + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
        hex.resize(bytes * 2); // drop the terminator written by sodium_bin2hex

        sodium_memzero(raw.data(), raw.size());
        return hex;
    }

    MemberId generateMemberId() {
        return randomHex(ID_BYTES);
    }

    MessageId generateMessageId() {
        return randomHex(ID_BYTES);
    }

    std::string generatePartyId() {
        return randomHex(ID_BYTES);
    }

    uint64_t randomNonce() {
        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium not initialized");
        }

        uint64_t nonce = 0;
        randombytes_buf(&nonce, sizeof(nonce));
        return nonce;
    }

} // namespace shortgap
