#include "RtcChannel.hpp"
#include <iostream>

namespace shortgap {

    RtcChannel::RtcChannel(boost::asio::io_context& ctx, MemberId peer, SendFunction sendFn, CloseFunction closeFn)
        : io(ctx),
          peerId(std::move(peer)),
          sendFrame(std::move(sendFn)),
          closeChannel(std::move(closeFn)) {}

    void RtcChannel::setMessageHandler(MessageCallback cb) {
        onMessage = std::move(cb);
    }

    void RtcChannel::setCloseHandler(CloseCallback cb) {
        onClose = std::move(cb);
    }

    bool RtcChannel::isOpen() const {
        return !closed;
    }

    void RtcChannel::start() {
        if (started) return;
        started = true;

        auto pendingFrames = std::move(early);
        early.clear();
        for (const auto& frame : pendingFrames) {
            handleFrame(frame);
        }
    }

    void RtcChannel::send(const Message& msg) {
        if (closed) return;

        std::vector<uint8_t> frame;
        try {
            frame = serializeMessage(msg);
        } catch (const std::exception& e) {
            std::cerr << "RtcChannel: message serialization failed: " << e.what() << std::endl;
            return;
        }

        if (!sendFrame || !sendFrame(frame)) {
            handleDisconnect("data channel send failed");
        }
    }

    void RtcChannel::deliver(std::vector<uint8_t> frame) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, frame = std::move(frame)] {
            if (self->closed) return;
            if (!self->started) {
                self->early.push_back(frame);
                return;
            }
            self->handleFrame(frame);
        });
    }

    void RtcChannel::remoteClosed(const std::string& reason) {
        auto self = shared_from_this();
        boost::asio::post(io, [self, reason] { self->handleDisconnect(reason); });
    }

    void RtcChannel::handleFrame(const std::vector<uint8_t>& frame) {
        Message msg;
        if (!parseExactMessage(frame, msg)) {
            handleDisconnect("malformed frame");
            return;
        }

        if (onMessage) {
            try {
                onMessage(msg);
            } catch (const std::exception& e) {
                std::cerr << "RtcChannel: error in message handler: " << e.what() << std::endl;
            }
        }
    }

    void RtcChannel::closeAfterFlush() {
        close();
    }

    void RtcChannel::close() {
        if (closed) return;
        closed = true;
        early.clear();
        if (closeChannel) {
            closeChannel();
        }
    }

    void RtcChannel::handleDisconnect(const std::string& reason) {
        if (closed) return;
        close();

        if (onClose) {
            auto handler = std::move(onClose);
            onClose = nullptr;
            handler(reason);
        }
    }

} // namespace shortgap
