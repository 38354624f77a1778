#include "PartyNode.hpp"
#include "Identity.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

namespace shortgap {

    std::string partyEventKindToString(PartyEvent::Kind kind) {
        switch (kind) {
            case PartyEvent::Kind::HostChanged:       return "HostChanged";
            case PartyEvent::Kind::TransportChanged:  return "TransportChanged";
            case PartyEvent::Kind::MembershipChanged: return "MembershipChanged";
            case PartyEvent::Kind::StateChanged:      return "StateChanged";
            case PartyEvent::Kind::SwitchProgress:    return "SwitchProgress";
            case PartyEvent::Kind::ConnectionLost:    return "ConnectionLost";
            case PartyEvent::Kind::MessageReceived:   return "MessageReceived";
            default:                                  return "Unknown";
        }
    }

    PartyNode::PartyNode(PartyConfig cfg)
        : config(std::move(cfg)),
          workGuard(boost::asio::make_work_guard(io)) {
        if (!initializeIdentity()) {
            throw std::runtime_error("PartyNode: libsodium initialization failed");
        }
        self = generateMemberId();

        elector = std::make_shared<Elector>(io, peerRegistry, self, config);
        probe = std::make_shared<PingProbe>(io, peerRegistry, self, config);
        coordinator = std::make_shared<TransportCoordinator>(io, peerRegistry, elector, self, config);
        wireComponents();
    }

    PartyNode::~PartyNode() {
        try {
            if (joined.load()) {
                leaveParty();
            } else {
                shutdown();
            }
        } catch (const std::exception& e) {
            std::cerr << "PartyNode: error during teardown: " << e.what() << std::endl;
        }
    }

    void PartyNode::wireComponents() {
        elector->setHostChangedHandler([this](const HostClaim& claim, const MemberId& previousHost) {
            coordinator->onHostChanged(claim, previousHost);

            PartyEvent event;
            event.kind = PartyEvent::Kind::HostChanged;
            event.memberId = claim.hostId;
            publish(event);
        });

        elector->setStateHandler([this](ElectorState state) {
            PartyEvent event;
            event.kind = PartyEvent::Kind::StateChanged;
            event.state = state;
            publish(event);
        });

        elector->setChallengeSender([this](const HostClaim& claim) {
            coordinator->sendChallenge(claim);
        });

        probe->setRttSource([this](const MemberId& memberId) {
            return coordinator->rttFor(memberId);
        });

        probe->setRoundCompleteHandler([this](uint64_t) {
            elector->onProbeRoundComplete(Clock::now());
            coordinator->shareScores();
        });

        coordinator->setChatHandler([this](const ChatPayload& chat) { onChat(chat); });

        coordinator->setTransportChangedHandler([this](TransportKind kind) {
            PartyEvent event;
            event.kind = PartyEvent::Kind::TransportChanged;
            event.transport = kind;
            publish(event);
        });

        coordinator->setSwitchStateHandler([this](SwitchState state) {
            PartyEvent event;
            event.kind = PartyEvent::Kind::SwitchProgress;
            event.switchState = state;
            publish(event);
        });

        coordinator->setConnectionLostHandler([this](const std::string& reason) {
            PartyEvent event;
            event.kind = PartyEvent::Kind::ConnectionLost;
            event.reason = reason;
            publish(event);
        });

        registrySubscription = peerRegistry.subscribe([this](const RegistryEvent& change) {
            if (change.kind != RegistryEvent::Kind::MembershipChanged || change.memberId == self) return;

            PartyEvent event;
            event.kind = PartyEvent::Kind::MembershipChanged;
            event.memberId = change.memberId;
            event.online = change.online;
            event.removed = change.removed;
            publish(event);
        });
    }

    // ============================================================
    // Lifecycle
    // ============================================================
    PartySnapshot PartyNode::joinParty(const std::string& displayName, const std::vector<PeerAddress>& bootstrap) {
        if (started.exchange(true)) {
            throw std::logic_error("PartyNode: a node joins one party only");
        }

        const std::string name = displayName.substr(0, MAX_NAME_LENGTH);

        try {
            coordinator->start();
        } catch (const boost::system::system_error& e) {
            shutdown();
            throw PartyError(PartyErrc::ConnectionLost, std::string("cannot listen: ") + e.what());
        }

        Member me;
        me.id = self;
        me.displayName = name;
        if (!config.advertisedHost.empty()) {
            me.addresses.push_back(PeerAddress{config.advertisedHost, coordinator->tcpPort(), TransportKind::Tcp});
            me.addresses.push_back(PeerAddress{config.advertisedHost, coordinator->wsPort(), TransportKind::WebSocket});
        }
        peerRegistry.join(me);

        if (bootstrap.empty()) {
            const auto now = Clock::now();
            peerRegistry.setPartyId(generatePartyId(), now);
            peerRegistry.setActiveTransport(config.initialTransport);

            elector->start();
            elector->runElection(now);
            startIoThread();
            probe->start();
            joined.store(true);

            std::cout << "PartyNode: created party " << snapshot()->partyId << " as " << name << std::endl;
            return snapshot();
        }

        peerRegistry.addBootstrapAddresses(bootstrap);
        startIoThread();

        auto result = std::make_shared<std::promise<DialOutcome>>();
        auto future = result->get_future();
        coordinator->join(bootstrap, [result](const DialOutcome& outcome) { result->set_value(outcome); });

        if (future.wait_for(config.joinTimeout) != std::future_status::ready) {
            shutdown();
            throw PartyError(PartyErrc::ConnectionLost, "no host answered within the join timeout");
        }

        const DialOutcome outcome = future.get();
        if (!outcome.ok) {
            shutdown();
            const PartyErrc code = outcome.error == PartyErrc::NameCollision ? PartyErrc::NameCollision
                                                                             : PartyErrc::ConnectionLost;
            throw PartyError(code, outcome.reason);
        }

        elector->start();
        const HostClaim claim = outcome.ack.claim;
        runOnIo([this, claim] {
            const auto now = Clock::now();
            if (claim.empty() || !elector->considerClaim(claim, now)) {
                elector->runElection(now);
            }
        });
        probe->start();
        joined.store(true);

        PartySnapshot party = snapshot();
        const Member* mine = party->find(self);
        std::cout << "PartyNode: joined party " << party->partyId << " as "
                  << (mine ? mine->displayName : name) << ", host " << party->hostId << std::endl;
        return party;
    }

    void PartyNode::leaveParty() {
        if (!joined.load()) {
            shutdown();
            return;
        }

        std::cout << "PartyNode: leaving party" << std::endl;
        probe->stop();

        auto done = std::make_shared<std::promise<void>>();
        auto future = done->get_future();
        coordinator->leave([done] { done->set_value(); });

        if (future.wait_for(config.connectTimeout + std::chrono::seconds(1)) != std::future_status::ready) {
            std::cerr << "PartyNode: links did not flush before the leave deadline" << std::endl;
        }
        shutdown();
    }

    void PartyNode::shutdown() {
        if (stopped.exchange(true)) return;
        joined.store(false);

        probe->stop();
        elector->stop();
        coordinator->stop();
        peerRegistry.unsubscribe(registrySubscription);

        if (ioThread.joinable()) {
            // lets the teardown queued by the components run first
            runOnIo([] {});
        }
        stopIoThread();
        std::cout << "PartyNode: stopped" << std::endl;
    }

    void PartyNode::startIoThread() {
        if (ioThread.joinable()) return;

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "PartyNode: io context error: " << e.what() << std::endl;
            }
        });
    }

    void PartyNode::stopIoThread() {
        workGuard.reset();
        io.stop();

        if (!ioThread.joinable()) return;
        if (ioThread.get_id() == std::this_thread::get_id()) {
            throw std::logic_error("PartyNode: cannot stop the node from its own io thread");
        }
        ioThread.join();
    }

    void PartyNode::runOnIo(std::function<void()> task) {
        auto done = std::make_shared<std::promise<void>>();
        auto future = done->get_future();

        boost::asio::post(io, [task, done] {
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "PartyNode: error in io task: " << e.what() << std::endl;
            }
            done->set_value();
        });

        if (future.wait_for(config.connectTimeout) != std::future_status::ready) {
            std::cerr << "PartyNode: io task did not finish in time" << std::endl;
        }
    }

    // ============================================================
    // Session
    // ============================================================
    MessageId PartyNode::sendMessage(const std::string& content) {
        if (!joined.load()) {
            throw std::logic_error("PartyNode: not in a party");
        }

        ChatPayload chat;
        chat.messageId = generateMessageId();
        chat.senderId = self;
        chat.content = content;
        chat.sentAtMs = toMillis(Clock::now());

        rememberMessage(chat.messageId);

        coordinator->relay(makeMessage(MessageType::CHAT, chat), self);
        return chat.messageId;
    }

    void PartyNode::onChat(const ChatPayload& chat) {
        if (!rememberMessage(chat.messageId)) return;

        PartyEvent event;
        event.kind = PartyEvent::Kind::MessageReceived;
        event.memberId = chat.senderId;
        event.message.id = chat.messageId;
        event.message.senderId = chat.senderId;
        event.message.content = chat.content;
        event.message.sentAt = fromMillis(chat.sentAtMs);
        if (auto sender = peerRegistry.member(chat.senderId)) {
            event.message.senderName = sender->displayName;
        }
        publish(event);
    }

    bool PartyNode::rememberMessage(const MessageId& id) {
        std::lock_guard<std::mutex> lock(dedupMtx);
        if (!seen.insert(id).second) return false;

        seenOrder.push_back(id);
        while (seenOrder.size() > config.dedupWindow) {
            seen.erase(seenOrder.front());
            seenOrder.pop_front();
        }
        return true;
    }

    size_t PartyNode::rememberedMessages() const {
        std::lock_guard<std::mutex> lock(dedupMtx);
        return seen.size();
    }

    void PartyNode::switchTransport(TransportKind kind) {
        if (!joined.load()) {
            throw std::logic_error("PartyNode: not in a party");
        }
        coordinator->switchTransport(kind);
    }

    void PartyNode::setRtcNegotiator(RtcNegotiator::Ptr rtc) {
        if (started.load()) {
            throw std::logic_error("PartyNode: negotiator must be set before joining");
        }
        negotiator = std::move(rtc);
        coordinator->setRtcNegotiator(negotiator);
    }

    // ============================================================
    // Events
    // ============================================================
    PartyNode::SubscriptionId PartyNode::subscribe(EventCallback cb) {
        std::lock_guard<std::mutex> lock(subscriberMtx);
        const SubscriptionId id = nextSubscription++;
        subscribers.emplace(id, std::move(cb));
        return id;
    }

    void PartyNode::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(subscriberMtx);
        subscribers.erase(id);
    }

    void PartyNode::publish(const PartyEvent& event) {
        std::vector<EventCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(subscriberMtx);
            for (const auto& [id, cb] : subscribers) {
                (void)id;
                callbacks.push_back(cb);
            }
        }

        for (const auto& cb : callbacks) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                std::cerr << "PartyNode: error in " << partyEventKindToString(event.kind)
                          << " subscriber: " << e.what() << std::endl;
            }
        }
    }

    // ============================================================
    // Queries
    // ============================================================
    bool PartyNode::isHost() const {
        return snapshot()->hostId == self;
    }

    ElectorState PartyNode::electorState() const {
        return elector->state();
    }

    SwitchState PartyNode::switchState() const {
        return coordinator->switchState();
    }

    uint16_t PartyNode::tcpPort() const {
        return coordinator->tcpPort();
    }

    uint16_t PartyNode::wsPort() const {
        return coordinator->wsPort();
    }

    std::vector<PeerAddress> PartyNode::knownAddresses() const {
        const TransportKind active = snapshot()->activeTransport;
        std::vector<PeerAddress> out;
        for (const auto& address : peerRegistry.orderedAddresses(active, Clock::now(), self)) {
            if (address.transport != TransportKind::WebRtc) {
                out.push_back(address);
            }
        }
        return out;
    }

} // namespace shortgap
