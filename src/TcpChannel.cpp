#include "TcpChannel.hpp"
#include <iostream>

namespace shortgap {

    TcpChannel::TcpChannel(boost::asio::io_context& ctx)
        : sock(ctx),
          resolver(ctx),
          headerBuf(MESSAGE_HEADER_SIZE) {}

    TcpChannel::TcpChannel(tcp::socket socket)
        : sock(std::move(socket)),
          resolver(sock.get_executor()),
          headerBuf(MESSAGE_HEADER_SIZE),
          connected(true) {}

    TcpChannel::~TcpChannel() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    tcp::socket& TcpChannel::socket() {
        return sock;
    }

    void TcpChannel::setMessageHandler(MessageCallback cb) {
        onMessage = std::move(cb);
    }

    void TcpChannel::setCloseHandler(CloseCallback cb) {
        onClose = std::move(cb);
    }

    bool TcpChannel::isOpen() const {
        return connected && !closed && !draining && sock.is_open();
    }

    std::string TcpChannel::remoteHost() const {
        boost::system::error_code ec;
        auto endpoint = sock.remote_endpoint(ec);
        return ec ? std::string() : endpoint.address().to_string();
    }

    void TcpChannel::connectTo(const PeerAddress& address, ConnectCallback cb) {
        auto self = shared_from_this();
        resolver.async_resolve(address.host, std::to_string(address.port),
            [this, self, cb](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec || closed) {
                    cb(ec ? ec : boost::asio::error::operation_aborted);
                    return;
                }

                boost::asio::async_connect(sock, results,
                    [this, self, cb](const boost::system::error_code& ec2, const tcp::endpoint&) {
                        if (!ec2 && !closed) {
                            connected = true;
                            boost::system::error_code ignored;
                            sock.set_option(tcp::no_delay(true), ignored);
                        }
                        cb(closed && !ec2 ? boost::asio::error::operation_aborted : ec2);
                    });
            });
    }

    void TcpChannel::start() {
        asyncReadHeader();
        if (!writing && connected && !outbox.empty()) {
            doWrite();
        }
    }

    // ============================================================
    // Read loop
    // ============================================================
    void TcpChannel::asyncReadHeader() {
        if (closed) return;

        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    handleDisconnect(ec == boost::asio::error::eof ? "closed by peer" : "header read error: " + ec.message());
                    return;
                }

                Message header;
                uint64_t payloadLen = 0;
                if (!parseMessageHeader(headerBuf, header, payloadLen)) {
                    handleDisconnect("malformed message header");
                    return;
                }

                asyncReadPayload(payloadLen);
            });
    }

    void TcpChannel::asyncReadPayload(uint64_t payloadLen) {
        // payload + checksum
        payloadBuf.resize(static_cast<std::size_t>(payloadLen) + CHECKSUM_SIZE);

        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    handleDisconnect("payload read error: " + ec.message());
                    return;
                }

                std::vector<uint8_t> full;
                full.reserve(headerBuf.size() + payloadBuf.size());
                full.insert(full.end(), headerBuf.begin(), headerBuf.end());
                full.insert(full.end(), payloadBuf.begin(), payloadBuf.end());

                Message msg;
                if (!parseExactMessage(full, msg)) {
                    handleDisconnect("message checksum verification failed");
                    return;
                }

                if (onMessage) {
                    try {
                        onMessage(msg);
                    } catch (const std::exception& e) {
                        std::cerr << "TcpChannel: error in message handler: " << e.what() << std::endl;
                    }
                }

                asyncReadHeader();
            });
    }

    // ============================================================
    // Write queue
    // ============================================================
    void TcpChannel::send(const Message& msg) {
        if (closed || draining) return;

        try {
            outbox.push_back(serializeMessage(msg));
        } catch (const std::exception& e) {
            std::cerr << "TcpChannel: message serialization failed: " << e.what() << std::endl;
            return;
        }

        if (!writing && connected) {
            doWrite();
        }
    }

    void TcpChannel::doWrite() {
        if (outbox.empty()) {
            writing = false;
            if (draining && !closed) {
                boost::system::error_code ignored;
                sock.shutdown(tcp::socket::shutdown_send, ignored);
            }
            return;
        }

        writing = true;
        auto self = shared_from_this();
        boost::asio::async_write(sock, boost::asio::buffer(outbox.front()),
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
    void TcpChannel::closeAfterFlush() {
        if (closed || draining) return;
        draining = true;
        if (!writing) {
            doWrite();
        }
    }

    void TcpChannel::close() {
        if (closed) return;
        closed = true;
        outbox.clear();

        boost::system::error_code ec;
        resolver.cancel();
        if (sock.is_open()) {
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        }
    }

    void TcpChannel::handleDisconnect(const std::string& reason) {
        if (closed) return;
        close();

        if (onClose) {
            // the handler may drop the last owner reference
            auto handler = std::move(onClose);
            onClose = nullptr;
            handler(reason);
        }
    }

} // namespace shortgap
