#include "PartyError.hpp"

namespace shortgap {

    std::string partyErrcToString(PartyErrc code) {
        switch (code) {
            case PartyErrc::NameCollision:            return "NameCollision";
            case PartyErrc::ProbeTimeout:             return "ProbeTimeout";
            case PartyErrc::PeerUnreachable:          return "PeerUnreachable";
            case PartyErrc::NoQuorum:                 return "NoQuorum";
            case PartyErrc::TransportHandshakeFailed: return "TransportHandshakeFailed";
            case PartyErrc::ConnectionLost:           return "ConnectionLost";
            default:                                  return "Unknown";
        }
    }

} // namespace shortgap
