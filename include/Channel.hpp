#ifndef SHORTGAP_CHANNEL_HPP
#define SHORTGAP_CHANNEL_HPP

#include "RtcChannel.hpp"
#include "TcpChannel.hpp"
#include "WsChannel.hpp"
#include <functional>
#include <string>
#include <variant>

namespace shortgap {

    /**
     * A session link of any transport. Every alternative offers the same operations
     * (start, send, close, closeAfterFlush, isOpen, remoteHost, kind and the two handlers);
     * the helpers below dispatch on the alternative.
     */
    using Channel = std::variant<TcpChannel::Ptr, WsChannel::Ptr, RtcChannel::Ptr>;

    using ChannelMessageCallback = std::function<void(const Message&)>;
    using ChannelCloseCallback = std::function<void(const std::string& reason)>;

    inline void channelStart(const Channel& channel) {
        std::visit([](const auto& c) { c->start(); }, channel);
    }

    inline void channelSend(const Channel& channel, const Message& msg) {
        std::visit([&msg](const auto& c) { c->send(msg); }, channel);
    }

    inline void channelClose(const Channel& channel) {
        std::visit([](const auto& c) { c->close(); }, channel);
    }

    inline void channelCloseAfterFlush(const Channel& channel) {
        std::visit([](const auto& c) { c->closeAfterFlush(); }, channel);
    }

    inline bool channelIsOpen(const Channel& channel) {
        return std::visit([](const auto& c) { return c->isOpen(); }, channel);
    }

    inline TransportKind channelKind(const Channel& channel) {
        return std::visit([](const auto& c) { return c->kind(); }, channel);
    }

    inline std::string channelRemoteHost(const Channel& channel) {
        return std::visit([](const auto& c) { return c->remoteHost(); }, channel);
    }

    /** Identity of the underlying object, for comparing two Channel values. */
    inline const void* channelIdentity(const Channel& channel) {
        return std::visit([](const auto& c) { return static_cast<const void*>(c.get()); }, channel);
    }

    inline void channelSetHandlers(const Channel& channel, ChannelMessageCallback onMessage, ChannelCloseCallback onClose) {
        std::visit([&](const auto& c) {
            c->setMessageHandler(std::move(onMessage));
            c->setCloseHandler(std::move(onClose));
        }, channel);
    }

} // namespace shortgap

#endif // SHORTGAP_CHANNEL_HPP
