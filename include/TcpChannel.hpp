#ifndef SHORTGAP_TCP_CHANNEL_HPP
#define SHORTGAP_TCP_CHANNEL_HPP

#include "Address.hpp"
#include "Message.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shortgap {

    using tcp = boost::asio::ip::tcp;

    /**
     * Framed session link over a plain TCP socket. Frames are read back to back
     * (header, then payload and checksum) and written through a FIFO outbox, so messages
     * leave in the order send() was called. Not thread-safe: use from the io_context thread.
     */
    class TcpChannel : public std::enable_shared_from_this<TcpChannel> {
        public:
            using Ptr = std::shared_ptr<TcpChannel>;
            using MessageCallback = std::function<void(const Message&)>;
            using CloseCallback = std::function<void(const std::string& reason)>;
            using ConnectCallback = std::function<void(const boost::system::error_code&)>;

            /**
             * Creates an unconnected channel, for connectTo().
             */
            explicit TcpChannel(boost::asio::io_context& ctx);

            /**
             * Wraps a socket that was already accepted.
             */
            explicit TcpChannel(tcp::socket socket);

            ~TcpChannel();

            tcp::socket& socket();

            /**
             * Resolves and connects to `address`. The read loop is not started; call start()
             * once the callback reports success.
             */
            void connectTo(const PeerAddress& address, ConnectCallback cb);

            /** Starts the read loop. */
            void start();

            /**
             * Queues a message. Messages sent after close() or closeAfterFlush() are dropped.
             */
            void send(const Message& msg);

            /** Closes immediately; queued messages are lost. */
            void close();

            /**
             * Stops accepting new messages, writes what is queued, then shuts down the sending
             * side. The read loop keeps going until the remote end closes.
             */
            void closeAfterFlush();

            bool isOpen() const;
            std::string remoteHost() const;
            TransportKind kind() const { return TransportKind::Tcp; }

            void setMessageHandler(MessageCallback cb);
            void setCloseHandler(CloseCallback cb);

        private:
            void asyncReadHeader();
            void asyncReadPayload(uint64_t payloadLen);
            void doWrite();
            void handleDisconnect(const std::string& reason);

            tcp::socket sock;
            tcp::resolver resolver;
            MessageCallback onMessage;
            CloseCallback onClose;

            std::vector<uint8_t> headerBuf;
            std::vector<uint8_t> payloadBuf;
            std::deque<std::vector<uint8_t>> outbox;
            bool writing = false;
            bool draining = false; // closeAfterFlush called
            bool connected = false;
            bool closed = false;
    };

} // namespace shortgap

#endif // SHORTGAP_TCP_CHANNEL_HPP
