#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include "venue/transport.hpp"

namespace binbot {

/**
 * TLS websocket client transport (RFC 6455 text frames over OpenSSL).
 *
 * The receive thread and any number of senders share one SSL object. The
 * live socket is non-blocking and each SSL call runs under ssl_mutex_;
 * threads wait for readiness in poll() with the lock released.
 */
class WebSocketTransport : public Transport {
public:
    // Accepts wss://host[:port]/path?query
    explicit WebSocketTransport(const std::string& url, int connect_timeout_ms = 10000);
    ~WebSocketTransport() override;

    bool open() override;
    bool send(const std::string& text) override;
    std::string receive() override;
    void interrupt() override;
    void close() override;
    bool is_open() const override { return open_.load(); }

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    const std::string& path() const { return path_; }

    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

private:
    std::string host_;
    int port_{443};
    std::string path_{"/"};
    int connect_timeout_ms_;

    std::atomic<int> socket_fd_{-1};
    void* ssl_ctx_{nullptr};  // SSL_CTX*
    void* ssl_{nullptr};      // SSL*
    std::atomic<bool> open_{false};

    // Lock order: write_mutex_, ssl_mutex_, fd_mutex_
    std::mutex write_mutex_;  // Keeps whole frames from callers and pongs in order
    std::mutex ssl_mutex_;    // Every SSL_read/SSL_write on ssl_; never held while waiting
    std::mutex fd_mutex_;     // Guards socket_fd_ against interrupt during close

    int ssl_call(bool write, void* buf, size_t len, int& ssl_error);
    bool wait_io(int ssl_error);
    bool read_exact(void* buf, size_t len);
    bool write_frame(const std::string& payload, uint8_t opcode);
    void release();
};

} // namespace binbot
