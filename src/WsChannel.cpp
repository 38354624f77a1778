#include "WsChannel.hpp"
#include <iostream>

namespace shortgap {

    WsChannel::WsChannel(boost::asio::io_context& ctx)
        : ws(ctx),
          resolver(ctx) {}

    WsChannel::WsChannel(boost::asio::io_context& ctx, tcp::socket socket)
        : ws(std::move(socket)),
          resolver(ctx) {}

    WsChannel::~WsChannel() {
        beast::get_lowest_layer(ws).close();
    }

    void WsChannel::setMessageHandler(MessageCallback cb) {
        onMessage = std::move(cb);
    }

    void WsChannel::setCloseHandler(CloseCallback cb) {
        onClose = std::move(cb);
    }

    bool WsChannel::isOpen() const {
        return connected && !closed && !draining && ws.is_open();
    }

    std::string WsChannel::remoteHost() const {
        boost::system::error_code ec;
        auto endpoint = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
        return ec ? std::string() : endpoint.address().to_string();
    }

    // ============================================================
    // Opening
    // ============================================================
    void WsChannel::connectTo(const PeerAddress& address, ConnectCallback cb) {
        auto self = shared_from_this();
        const std::string hostHeader = address.host + ":" + std::to_string(address.port);

        resolver.async_resolve(address.host, std::to_string(address.port),
            [this, self, cb, hostHeader](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec || closed) {
                    cb(ec ? ec : boost::asio::error::operation_aborted);
                    return;
                }

                beast::get_lowest_layer(ws).async_connect(results,
                    [this, self, cb, hostHeader](const boost::system::error_code& ec2, const tcp::endpoint&) {
                        if (ec2 || closed) {
                            cb(ec2 ? ec2 : boost::asio::error::operation_aborted);
                            return;
                        }

                        // the websocket stream runs its own timeouts
                        beast::get_lowest_layer(ws).expires_never();
                        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
                        ws.binary(true);

                        ws.async_handshake(hostHeader, WEBSOCKET_TARGET,
                            [this, self, cb](const boost::system::error_code& ec3) {
                                if (!ec3 && !closed) {
                                    connected = true;
                                }
                                cb(closed && !ec3 ? boost::asio::error::operation_aborted : ec3);
                            });
                    });
            });
    }

    void WsChannel::accept(ConnectCallback cb) {
        auto self = shared_from_this();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws.binary(true);
        ws.async_accept([this, self, cb](const boost::system::error_code& ec) {
            if (!ec && !closed) {
                connected = true;
            }
            cb(closed && !ec ? boost::asio::error::operation_aborted : ec);
        });
    }

    void WsChannel::start() {
        asyncRead();
        if (!writing && connected && !outbox.empty()) {
            doWrite();
        }
    }

    // ============================================================
    // Read loop
    // ============================================================
    void WsChannel::asyncRead() {
        if (closed) return;

        auto self = shared_from_this();
        ws.async_read(readBuf, [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                handleDisconnect(ec == websocket::error::closed ? "closed by peer" : "read error: " + ec.message());
                return;
            }

            std::vector<uint8_t> frame(readBuf.size());
            boost::asio::buffer_copy(boost::asio::buffer(frame), readBuf.data());
            readBuf.consume(readBuf.size());

            Message msg;
            if (!parseExactMessage(frame, msg)) {
                handleDisconnect("malformed frame");
                return;
            }

            if (onMessage) {
                try {
                    onMessage(msg);
                } catch (const std::exception& e) {
                    std::cerr << "WsChannel: error in message handler: " << e.what() << std::endl;
                }
            }

            asyncRead();
        });
    }

    // ============================================================
    // Write queue
    // ============================================================
    void WsChannel::send(const Message& msg) {
        if (closed || draining) return;

        try {
            outbox.push_back(serializeMessage(msg));
        } catch (const std::exception& e) {
            std::cerr << "WsChannel: message serialization failed: " << e.what() << std::endl;
            return;
        }

        if (!writing && connected) {
            doWrite();
        }
    }

    void WsChannel::doWrite() {
        if (outbox.empty()) {
            writing = false;
            if (draining && !closed && ws.is_open()) {
                auto self = shared_from_this();
                writing = true; // the close frame occupies the write side
                ws.async_close(websocket::close_code::normal, [self](const boost::system::error_code& ec) {
                    self->writing = false;
                    if (ec && ec != boost::asio::error::operation_aborted) {
                        self->handleDisconnect("close error: " + ec.message());
                    }
                });
            }
            return;
        }

        writing = true;
        auto self = shared_from_this();
        ws.async_write(boost::asio::buffer(outbox.front()),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    writing = false;
                    handleDisconnect("send error: " + ec.message());
                    return;
                }
                outbox.pop_front();
                doWrite();
            });
    }

    // ============================================================
    // Shutdown
    // ============================================================
    void WsChannel::closeAfterFlush() {
        if (closed || draining) return;
        draining = true;
        if (!writing) {
            doWrite();
        }
    }

    void WsChannel::close() {
        if (closed) return;
        closed = true;
        outbox.clear();
        resolver.cancel();
        beast::get_lowest_layer(ws).close();
    }

    void WsChannel::handleDisconnect(const std::string& reason) {
        if (closed) return;
        close();

        if (onClose) {
            auto handler = std::move(onClose);
            onClose = nullptr;
            handler(reason);
        }
    }

} // namespace shortgap
