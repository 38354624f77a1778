#include "DataChannelNegotiator.hpp"
#include <iostream>
#include <variant>

namespace shortgap {

    namespace {
        const char* const CHANNEL_LABEL = "shortgap";
    }

    DataChannelNegotiator::DataChannelNegotiator(boost::asio::io_context& ctx, MemberId self,
                                                 std::vector<std::string> iceServers)
        : io(ctx),
          selfId(std::move(self)) {
        for (const auto& url : iceServers) {
            rtcConfig.iceServers.emplace_back(url);
        }
    }

    DataChannelNegotiator::~DataChannelNegotiator() {
        closeAll();
    }

    void DataChannelNegotiator::setSignalSender(SignalSender sender) {
        std::lock_guard<std::mutex> lock(mtx);
        signalSender = std::move(sender);
    }

    void DataChannelNegotiator::setIncomingHandler(ChannelCallback cb) {
        std::lock_guard<std::mutex> lock(mtx);
        onIncoming = std::move(cb);
    }

    std::shared_ptr<DataChannelNegotiator::PeerLink> DataChannelNegotiator::createLink(const MemberId& peer, bool offerer) {
        auto link = std::make_shared<PeerLink>();
        link->offerer = offerer;
        link->pc = std::make_shared<rtc::PeerConnection>(rtcConfig);

        std::weak_ptr<DataChannelNegotiator> weak = shared_from_this();
        std::weak_ptr<PeerLink> weakLink = link;

        link->pc->onLocalDescription([weak, peer](rtc::Description desc) {
            if (auto self = weak.lock()) {
                self->sendSignal(peer, desc.typeString(), std::string(desc), "");
            }
        });

        link->pc->onLocalCandidate([weak, peer](rtc::Candidate candidate) {
            if (auto self = weak.lock()) {
                self->sendSignal(peer, "candidate", candidate.candidate(), candidate.mid());
            }
        });

        link->pc->onStateChange([weak, weakLink, peer](rtc::PeerConnection::State state) {
            if (state != rtc::PeerConnection::State::Failed && state != rtc::PeerConnection::State::Closed) return;
            auto self = weak.lock();
            auto owned = weakLink.lock();
            if (!self || !owned) return;

            std::cerr << "DataChannelNegotiator: connection to " << peer << " "
                      << (state == rtc::PeerConnection::State::Failed ? "failed" : "closed") << std::endl;
            self->dropLink(peer, owned);
        });

        if (!offerer) {
            link->pc->onDataChannel([weak, weakLink, peer](std::shared_ptr<rtc::DataChannel> dc) {
                auto self = weak.lock();
                auto owned = weakLink.lock();
                if (!self || !owned) return;
                self->wireChannel(peer, owned, dc);
            });
        }

        return link;
    }

    void DataChannelNegotiator::wireChannel(const MemberId& peer, const std::shared_ptr<PeerLink>& link,
                                            const std::shared_ptr<rtc::DataChannel>& dc) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            link->dc = dc;
        }

        std::weak_ptr<DataChannelNegotiator> weak = shared_from_this();
        std::weak_ptr<PeerLink> weakLink = link;

        dc->onOpen([weak, weakLink, peer] {
            auto self = weak.lock();
            auto owned = weakLink.lock();
            if (self && owned) self->onChannelOpen(peer, owned);
        });

        dc->onMessage([weakLink](rtc::message_variant data) {
            auto owned = weakLink.lock();
            if (!owned || !owned->channel) return;

            if (auto bytes = std::get_if<rtc::binary>(&data)) {
                std::vector<uint8_t> frame(bytes->size());
                for (size_t i = 0; i < bytes->size(); ++i) {
                    frame[i] = static_cast<uint8_t>((*bytes)[i]);
                }
                owned->channel->deliver(std::move(frame));
            }
        });

        dc->onClosed([weak, weakLink, peer] {
            auto self = weak.lock();
            auto owned = weakLink.lock();
            if (!self || !owned) return;
            if (owned->channel) owned->channel->remoteClosed("data channel closed");
            self->dropLink(peer, owned);
        });
    }

    void DataChannelNegotiator::onChannelOpen(const MemberId& peer, const std::shared_ptr<PeerLink>& link) {
        std::weak_ptr<PeerLink> weakLink = link;

        auto sendFn = [weakLink](const std::vector<uint8_t>& frame) -> bool {
            auto owned = weakLink.lock();
            if (!owned || !owned->dc || !owned->dc->isOpen()) return false;

            rtc::binary data(frame.size());
            for (size_t i = 0; i < frame.size(); ++i) {
                data[i] = static_cast<std::byte>(frame[i]);
            }
            try {
                return owned->dc->send(std::move(data));
            } catch (const std::exception& e) {
                std::cerr << "DataChannelNegotiator: send failed: " << e.what() << std::endl;
                return false;
            }
        };

        std::weak_ptr<DataChannelNegotiator> weak = shared_from_this();
        auto closeFn = [weak, weakLink, peer] {
            auto self = weak.lock();
            auto owned = weakLink.lock();
            if (self && owned) self->dropLink(peer, owned);
        };

        auto channel = std::make_shared<RtcChannel>(io, peer, sendFn, closeFn);

        ChannelCallback deliverTo;
        {
            std::lock_guard<std::mutex> lock(mtx);
            link->channel = channel;
            if (link->offerer) {
                deliverTo = std::move(link->pending);
                link->pending = nullptr;
            } else {
                deliverTo = onIncoming;
            }
        }

        std::cout << "DataChannelNegotiator: data channel to " << peer << " open" << std::endl;
        if (deliverTo) {
            deliverTo(channel);
        } else {
            channel->close();
        }
    }

    void DataChannelNegotiator::negotiate(const MemberId& peer, ChannelCallback cb) {
        std::shared_ptr<PeerLink> link;
        try {
            link = createLink(peer, true);
            link->pending = cb;
            {
                std::lock_guard<std::mutex> lock(mtx);
                auto existing = links.find(peer);
                if (existing != links.end() && existing->second->pc) {
                    existing->second->pc->close();
                }
                links[peer] = link;
            }

            // creating the channel makes the connection produce its offer
            auto dc = link->pc->createDataChannel(CHANNEL_LABEL);
            wireChannel(peer, link, dc);
        } catch (const std::exception& e) {
            std::cerr << "DataChannelNegotiator: cannot offer to " << peer << ": " << e.what() << std::endl;
            if (link) dropLink(peer, link);
            if (cb) cb(nullptr);
        }
    }

    void DataChannelNegotiator::onSignal(const RtcSignalPayload& signal) {
        if (signal.senderId.empty() || signal.senderId == selfId) return;

        try {
            std::shared_ptr<PeerLink> link;
            {
                std::lock_guard<std::mutex> lock(mtx);
                auto it = links.find(signal.senderId);
                if (it != links.end()) link = it->second;
            }

            if (signal.kind == "offer") {
                // a fresh offer replaces whatever was there
                if (link) dropLink(signal.senderId, link);
                link = createLink(signal.senderId, false);
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    links[signal.senderId] = link;
                }
                link->pc->setRemoteDescription(rtc::Description(signal.data, signal.kind));
                return;
            }

            if (!link) {
                std::cerr << "DataChannelNegotiator: " << signal.kind << " from " << signal.senderId
                          << " without a negotiation" << std::endl;
                return;
            }

            if (signal.kind == "answer") {
                link->pc->setRemoteDescription(rtc::Description(signal.data, signal.kind));
            } else if (signal.kind == "candidate") {
                link->pc->addRemoteCandidate(rtc::Candidate(signal.data, signal.mid));
            } else {
                std::cerr << "DataChannelNegotiator: unknown signal " << signal.kind << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "DataChannelNegotiator: bad signal from " << signal.senderId << ": " << e.what() << std::endl;
        }
    }

    void DataChannelNegotiator::sendSignal(const MemberId& peer, const std::string& kind, const std::string& data,
                                           const std::string& mid) {
        SignalSender sender;
        {
            std::lock_guard<std::mutex> lock(mtx);
            sender = signalSender;
        }
        if (!sender) return;

        RtcSignalPayload signal;
        signal.senderId = selfId;
        signal.targetId = peer;
        signal.kind = kind;
        signal.data = data;
        signal.mid = mid;
        sender(signal);
    }

    std::optional<uint32_t> DataChannelNegotiator::roundTripMillis(const MemberId& peer) const {
        std::shared_ptr<PeerLink> link;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = links.find(peer);
            if (it == links.end()) return std::nullopt;
            link = it->second;
        }

        if (!link->dc || !link->dc->isOpen()) return std::nullopt;
        auto rtt = link->pc->rtt();
        if (!rtt) return std::nullopt;
        return static_cast<uint32_t>(rtt->count());
    }

    void DataChannelNegotiator::dropLink(const MemberId& peer, const std::shared_ptr<PeerLink>& link) {
        ChannelCallback pending;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = links.find(peer);
            if (it != links.end() && it->second == link) {
                links.erase(it);
            }
            pending = std::move(link->pending);
            link->pending = nullptr;
        }

        if (pending) pending(nullptr);
        if (link->dc) link->dc->close();
        if (link->pc) link->pc->close();
    }

    void DataChannelNegotiator::close(const MemberId& peer) {
        std::shared_ptr<PeerLink> link;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = links.find(peer);
            if (it == links.end()) return;
            link = it->second;
        }
        dropLink(peer, link);
    }

    void DataChannelNegotiator::closeAll() {
        std::unordered_map<MemberId, std::shared_ptr<PeerLink>> all;
        {
            std::lock_guard<std::mutex> lock(mtx);
            all.swap(links);
        }
        for (auto& [peer, link] : all) {
            dropLink(peer, link);
        }
    }

} // namespace shortgap
