#ifndef SHORTGAP_PARTY_ERROR_HPP
#define SHORTGAP_PARTY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shortgap {

    // Error taxonomy of the core. Only NameCollision and ConnectionLost are ever thrown to
    // callers; the rest are absorbed into registry state and logged.
    enum class PartyErrc {
        NameCollision,
        ProbeTimeout,
        PeerUnreachable,
        NoQuorum,
        TransportHandshakeFailed,
        ConnectionLost
    };

    std::string partyErrcToString(PartyErrc code);

    class PartyError : public std::runtime_error {
    public:
        PartyError(PartyErrc code, const std::string& what)
            : std::runtime_error(partyErrcToString(code) + ": " + what), errc(code) {}

        PartyErrc code() const noexcept { return errc; }

    private:
        PartyErrc errc;
    };

} // namespace shortgap

#endif // SHORTGAP_PARTY_ERROR_HPP
