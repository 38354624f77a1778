#ifndef SHORTGAP_RTC_NEGOTIATOR_HPP
#define SHORTGAP_RTC_NEGOTIATOR_HPP

#include "Payloads.hpp"
#include "RtcChannel.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace shortgap {

    /**
     * WebRTC negotiation step. Session descriptions and ICE candidates travel as RTC_SIGNAL
     * messages over the existing session links (relayed by the host); the negotiator turns
     * them into data channels wrapped as RtcChannel.
     *
     * Callbacks may run on any thread; receivers post to their own io_context.
     */
    class RtcNegotiator {
        public:
            using Ptr = std::shared_ptr<RtcNegotiator>;
            using SignalSender = std::function<void(const RtcSignalPayload&)>;
            using ChannelCallback = std::function<void(RtcChannel::Ptr channel)>;

            virtual ~RtcNegotiator() = default;

            /** Where outgoing signals go. */
            virtual void setSignalSender(SignalSender sender) = 0;

            /** Receives data channels opened by remote peers. */
            virtual void setIncomingHandler(ChannelCallback cb) = 0;

            /**
             * Starts an offer to `peer`. `cb` receives the open channel, or nullptr when the
             * negotiation fails. The caller bounds the wait with its own timer.
             */
            virtual void negotiate(const MemberId& peer, ChannelCallback cb) = 0;

            /** Applies a signal addressed to this node. */
            virtual void onSignal(const RtcSignalPayload& signal) = 0;

            /** Round-trip time of an open data channel to `peer`, if there is one. */
            virtual std::optional<uint32_t> roundTripMillis(const MemberId& peer) const = 0;

            virtual void close(const MemberId& peer) = 0;
            virtual void closeAll() = 0;
    };

} // namespace shortgap

#endif // SHORTGAP_RTC_NEGOTIATOR_HPP
