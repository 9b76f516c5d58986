#pragma once

/**
 * @file transport.h
 * @brief Message-oriented peer connections
 *
 * A PeerTransport owns one peer identity. It dials other peers by their
 * opaque id and reports inbound connections. Every Connection is ordered
 * and reliable and carries whole text or binary messages.
 *
 * Event order for a connection:
 *   outbound: connect() returns it not yet open, then open or error
 *   inbound:  incoming-connection callback, then open
 *   then any number of text/binary events, then close or error
 *
 * close() is idempotent and does not fire the local close callback; the
 * remote side observes a close event. All callbacks run on the EventLoop.
 */

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace peerlink {

class Connection {
public:
    using OpenCallback = std::function<void()>;
    using TextCallback = std::function<void(const std::string& text)>;
    using BinaryCallback = std::function<void(const std::vector<uint8_t>& data)>;
    using CloseCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const std::string& error)>;

    virtual ~Connection() = default;

    virtual const std::string& connection_id() const = 0;
    virtual const std::string& peer_id() const = 0;
    virtual bool is_open() const = 0;

    // false if the connection is not open
    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(const std::vector<uint8_t>& data) = 0;

    virtual void close() = 0;

    void on_open(OpenCallback callback) { open_callback_ = std::move(callback); }
    void on_text(TextCallback callback) { text_callback_ = std::move(callback); }
    void on_binary(BinaryCallback callback) { binary_callback_ = std::move(callback); }
    void on_close(CloseCallback callback) { close_callback_ = std::move(callback); }
    void on_error(ErrorCallback callback) { error_callback_ = std::move(callback); }

    // Drop every handler (and whatever the handlers captured)
    void release_handlers() {
        open_callback_ = nullptr;
        text_callback_ = nullptr;
        binary_callback_ = nullptr;
        close_callback_ = nullptr;
        error_callback_ = nullptr;
    }

protected:
    // Copies are invoked so a handler may replace or release itself
    void emit_open() {
        OpenCallback cb = open_callback_;
        if (cb) cb();
    }
    void emit_text(const std::string& text) {
        TextCallback cb = text_callback_;
        if (cb) cb(text);
    }
    void emit_binary(const std::vector<uint8_t>& data) {
        BinaryCallback cb = binary_callback_;
        if (cb) cb(data);
    }
    void emit_close() {
        CloseCallback cb = close_callback_;
        if (cb) cb();
    }
    void emit_error(const std::string& error) {
        ErrorCallback cb = error_callback_;
        if (cb) cb(error);
    }

private:
    OpenCallback open_callback_;
    TextCallback text_callback_;
    BinaryCallback binary_callback_;
    CloseCallback close_callback_;
    ErrorCallback error_callback_;
};

class PeerTransport {
public:
    using IncomingCallback = std::function<void(std::shared_ptr<Connection> connection)>;

    virtual ~PeerTransport() = default;

    virtual std::string local_id() const = 0;

    /**
     * @brief Dial a peer
     * @return Connection that will later open or fail; nullptr if the dial
     *         could not even be started
     */
    virtual std::shared_ptr<Connection> connect(const std::string& peer_id) = 0;

    // Close every connection and stop accepting new ones
    virtual void shutdown() = 0;

    void on_incoming_connection(IncomingCallback callback) { incoming_callback_ = std::move(callback); }

protected:
    void emit_incoming(std::shared_ptr<Connection> connection) {
        IncomingCallback cb = incoming_callback_;
        if (cb) cb(std::move(connection));
    }

private:
    IncomingCallback incoming_callback_;
};

} // namespace peerlink
