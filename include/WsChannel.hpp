#ifndef SHORTGAP_WS_CHANNEL_HPP
#define SHORTGAP_WS_CHANNEL_HPP

#include "Address.hpp"
#include "Message.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shortgap {

    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    using tcp = boost::asio::ip::tcp;

    inline constexpr const char* WEBSOCKET_TARGET = "/shortgap";

    /**
     * Session link over a WebSocket. One frame per binary WebSocket message; same queueing
     * and shutdown behaviour as TcpChannel. Use from the io_context thread only.
     */
    class WsChannel : public std::enable_shared_from_this<WsChannel> {
        public:
            using Ptr = std::shared_ptr<WsChannel>;
            using MessageCallback = std::function<void(const Message&)>;
            using CloseCallback = std::function<void(const std::string& reason)>;
            using ConnectCallback = std::function<void(const boost::system::error_code&)>;

            /** Client side, for connectTo(). */
            explicit WsChannel(boost::asio::io_context& ctx);

            /** Server side, wrapping an accepted socket; call accept() next. */
            WsChannel(boost::asio::io_context& ctx, tcp::socket socket);

            ~WsChannel();

            /** Resolves, connects and performs the WebSocket upgrade as a client. */
            void connectTo(const PeerAddress& address, ConnectCallback cb);

            /** Answers the client's upgrade request on an accepted socket. */
            void accept(ConnectCallback cb);

            void start();
            void send(const Message& msg);
            void close();

            /** Writes what is queued, then sends a WebSocket close frame. */
            void closeAfterFlush();

            bool isOpen() const;
            std::string remoteHost() const;
            TransportKind kind() const { return TransportKind::WebSocket; }

            void setMessageHandler(MessageCallback cb);
            void setCloseHandler(CloseCallback cb);

        private:
            void asyncRead();
            void doWrite();
            void handleDisconnect(const std::string& reason);

            websocket::stream<beast::tcp_stream> ws;
            tcp::resolver resolver;
            beast::flat_buffer readBuf;
            MessageCallback onMessage;
            CloseCallback onClose;

            std::deque<std::vector<uint8_t>> outbox;
            bool writing = false;
            bool draining = false;
            bool connected = false;
            bool closed = false;
    };

} // namespace shortgap

#endif // SHORTGAP_WS_CHANNEL_HPP
