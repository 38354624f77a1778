#ifndef SHORTGAP_RTC_CHANNEL_HPP
#define SHORTGAP_RTC_CHANNEL_HPP

#include "Message.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shortgap {

    /**
     * Session link over a WebRTC data channel. The data channel itself belongs to the
     * negotiator; this class only sees a send function, a close function and the frames the
     * negotiator hands to deliver(). deliver() and remoteClosed() may be called from any
     * thread, everything else from the io_context thread.
     */
    class RtcChannel : public std::enable_shared_from_this<RtcChannel> {
        public:
            using Ptr = std::shared_ptr<RtcChannel>;
            using MessageCallback = std::function<void(const Message&)>;
            using CloseCallback = std::function<void(const std::string& reason)>;
            using SendFunction = std::function<bool(const std::vector<uint8_t>&)>;
            using CloseFunction = std::function<void()>;

            RtcChannel(boost::asio::io_context& ctx, MemberId peer, SendFunction sendFn, CloseFunction closeFn);

            /** Starts delivering frames; frames that arrived earlier are delivered first. */
            void start();
            void send(const Message& msg);
            void close();

            /**
             * Data channels are ordered and reliable, so the sends already handed over are
             * flushed by the channel itself; closes right away.
             */
            void closeAfterFlush();

            bool isOpen() const;
            std::string remoteHost() const { return std::string(); }
            TransportKind kind() const { return TransportKind::WebRtc; }
            const MemberId& peer() const { return peerId; }

            void setMessageHandler(MessageCallback cb);
            void setCloseHandler(CloseCallback cb);

            void deliver(std::vector<uint8_t> frame);
            void remoteClosed(const std::string& reason);

        private:
            void handleFrame(const std::vector<uint8_t>& frame);
            void handleDisconnect(const std::string& reason);

            boost::asio::io_context& io;
            MemberId peerId;
            SendFunction sendFrame;
            CloseFunction closeChannel;
            MessageCallback onMessage;
            CloseCallback onClose;

            std::vector<std::vector<uint8_t>> early;
            bool started = false;
            bool closed = false;
    };

} // namespace shortgap

#endif // SHORTGAP_RTC_CHANNEL_HPP
