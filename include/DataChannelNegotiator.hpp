#ifndef SHORTGAP_DATA_CHANNEL_NEGOTIATOR_HPP
#define SHORTGAP_DATA_CHANNEL_NEGOTIATOR_HPP

#include "RtcNegotiator.hpp"
#include <rtc/rtc.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shortgap {

    /**
     * RtcNegotiator on top of libdatachannel. One PeerConnection with one ordered, reliable
     * data channel per remote member. libdatachannel invokes its callbacks on its own
     * threads; the peer table is guarded by a mutex and everything that reaches a session
     * link goes through RtcChannel, which posts to the io_context.
     */
    class DataChannelNegotiator : public RtcNegotiator,
                                  public std::enable_shared_from_this<DataChannelNegotiator> {
        public:
            using Ptr = std::shared_ptr<DataChannelNegotiator>;

            /** `iceServers` are "stun:host:port" style URLs; empty means host candidates only. */
            DataChannelNegotiator(boost::asio::io_context& ctx, MemberId selfId,
                                  std::vector<std::string> iceServers = {});
            ~DataChannelNegotiator() override;

            void setSignalSender(SignalSender sender) override;
            void setIncomingHandler(ChannelCallback cb) override;
            void negotiate(const MemberId& peer, ChannelCallback cb) override;
            void onSignal(const RtcSignalPayload& signal) override;
            std::optional<uint32_t> roundTripMillis(const MemberId& peer) const override;
            void close(const MemberId& peer) override;
            void closeAll() override;

        private:
            struct PeerLink {
                std::shared_ptr<rtc::PeerConnection> pc;
                std::shared_ptr<rtc::DataChannel> dc;
                RtcChannel::Ptr channel;
                ChannelCallback pending; // offerer side, until the channel opens
                bool offerer = false;
            };

            std::shared_ptr<PeerLink> createLink(const MemberId& peer, bool offerer);
            void wireChannel(const MemberId& peer, const std::shared_ptr<PeerLink>& link,
                             const std::shared_ptr<rtc::DataChannel>& dc);
            void onChannelOpen(const MemberId& peer, const std::shared_ptr<PeerLink>& link);
            void sendSignal(const MemberId& peer, const std::string& kind, const std::string& data,
                            const std::string& mid);
            void dropLink(const MemberId& peer, const std::shared_ptr<PeerLink>& link);

            boost::asio::io_context& io;
            MemberId selfId;
            rtc::Configuration rtcConfig;

            mutable std::mutex mtx;
            std::unordered_map<MemberId, std::shared_ptr<PeerLink>> links;
            SignalSender signalSender;
            ChannelCallback onIncoming;
    };

} // namespace shortgap

#endif // SHORTGAP_DATA_CHANNEL_NEGOTIATOR_HPP
