#ifndef SHORTGAP_IDENTITY_HPP
#define SHORTGAP_IDENTITY_HPP

#include "Types.hpp"
#include <string>

namespace shortgap {

    /**
     * Initializes libsodium. Must succeed once before any id is generated; calling it again
     * is harmless.
     *
     * @return false if libsodium could not be initialized.
     */
    bool initializeIdentity();

    /**
     * Returns `bytes` random bytes from libsodium, hex encoded (2 * bytes characters).
     *
     * @throws std::runtime_error if libsodium has not been initialized.
     */
    std::string randomHex(size_t bytes);

    MemberId generateMemberId();
    MessageId generateMessageId();
    std::string generatePartyId();

    /** Random 64-bit value, used as probe nonce. */
    uint64_t randomNonce();

} // namespace shortgap

#endif // SHORTGAP_IDENTITY_HPP
