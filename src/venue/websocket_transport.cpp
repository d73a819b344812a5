#include "venue/websocket_transport.hpp"
#include <spdlog/spdlog.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <random>
#include <stdexcept>

namespace binbot {

namespace {
    // Upper bound on a single poll() so interrupt() is noticed promptly
    constexpr int POLL_SLICE_MS = 100;

    // WebSocket frame helpers
    std::string create_ws_handshake(const std::string& host, const std::string& path) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);

        std::string key;
        for (int i = 0; i < 16; i++) {
            key += static_cast<char>(dis(gen));
        }

        static const char* b64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string encoded_key;
        for (size_t i = 0; i < key.size(); i += 3) {
            uint32_t n = static_cast<uint8_t>(key[i]) << 16;
            if (i + 1 < key.size()) n |= static_cast<uint8_t>(key[i + 1]) << 8;
            if (i + 2 < key.size()) n |= static_cast<uint8_t>(key[i + 2]);
            encoded_key += b64[(n >> 18) & 0x3F];
            encoded_key += b64[(n >> 12) & 0x3F];
            encoded_key += (i + 1 < key.size()) ? b64[(n >> 6) & 0x3F] : '=';
            encoded_key += (i + 2 < key.size()) ? b64[n & 0x3F] : '=';
        }

        std::string request = "GET " + path + " HTTP/1.1\r\n";
        request += "Host: " + host + "\r\n";
        request += "Upgrade: websocket\r\n";
        request += "Connection: Upgrade\r\n";
        request += "Sec-WebSocket-Key: " + encoded_key + "\r\n";
        request += "Sec-WebSocket-Version: 13\r\n";
        request += "\r\n";
        return request;
    }

    std::string create_ws_frame(const std::string& data, uint8_t opcode) {
        std::string frame;
        frame += static_cast<char>(0x80 | opcode);  // FIN + opcode

        size_t len = data.size();
        if (len < 126) {
            frame += static_cast<char>(0x80 | len);  // Masked + length
        } else if (len < 65536) {
            frame += static_cast<char>(0x80 | 126);
            frame += static_cast<char>((len >> 8) & 0xFF);
            frame += static_cast<char>(len & 0xFF);
        } else {
            frame += static_cast<char>(0x80 | 127);
            for (int i = 7; i >= 0; i--) {
                frame += static_cast<char>((len >> (8 * i)) & 0xFF);
            }
        }

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);
        uint8_t mask[4];
        for (int i = 0; i < 4; i++) {
            mask[i] = static_cast<uint8_t>(dis(gen));
            frame += static_cast<char>(mask[i]);
        }

        for (size_t i = 0; i < data.size(); i++) {
            frame += static_cast<char>(data[i] ^ mask[i % 4]);
        }

        return frame;
    }
}

WebSocketTransport::WebSocketTransport(const std::string& url, int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms)
{
    const std::string scheme = "wss://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Only wss:// URLs are supported: " + url);
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    path_ = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.find(':');
    if (colon != std::string::npos) {
        host_ = authority.substr(0, colon);
        port_ = std::stoi(authority.substr(colon + 1));
    } else {
        host_ = authority;
    }

    if (host_.empty()) {
        throw std::invalid_argument("Missing host in URL: " + url);
    }
}

WebSocketTransport::~WebSocketTransport() {
    close();
}

bool WebSocketTransport::open() {
    if (open_.load()) {
        spdlog::warn("WebSocketTransport already open");
        return true;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    // Bound connect and handshake reads; cleared once the socket is live
    struct timeval tv{};
    tv.tv_sec = connect_timeout_ms_ / 1000;
    tv.tv_usec = (connect_timeout_ms_ % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* result = nullptr;
    if (getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &result) != 0 || !result) {
        spdlog::error("Failed to resolve host: {}", host_);
        ::close(sock);
        return false;
    }

    int rc = ::connect(sock, result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);
    if (rc < 0) {
        spdlog::error("Failed to connect to {}:{}: {}", host_, port_, strerror(errno));
        ::close(sock);
        return false;
    }

    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        spdlog::error("Failed to create SSL context");
        ::close(sock);
        return false;
    }
    SSL_CTX_set_default_verify_paths(static_cast<SSL_CTX*>(ssl_ctx_));

    ssl_ = SSL_new(static_cast<SSL_CTX*>(ssl_ctx_));
    SSL_set_fd(static_cast<SSL*>(ssl_), sock);
    SSL_set_tlsext_host_name(static_cast<SSL*>(ssl_), host_.c_str());
    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        socket_fd_ = sock;
    }

    if (SSL_connect(static_cast<SSL*>(ssl_)) <= 0) {
        spdlog::error("SSL handshake with {} failed", host_);
        release();
        return false;
    }

    std::string handshake = create_ws_handshake(host_, path_);
    if (SSL_write(static_cast<SSL*>(ssl_), handshake.c_str(), static_cast<int>(handshake.size())) <= 0) {
        spdlog::error("Failed to send WebSocket handshake");
        release();
        return false;
    }

    // Read the HTTP upgrade response up to the blank line
    std::string response;
    char c;
    while (response.size() < 8192) {
        if (SSL_read(static_cast<SSL*>(ssl_), &c, 1) <= 0) break;
        response += c;
        if (response.size() >= 4 && response.compare(response.size() - 4, 4, "\r\n\r\n") == 0) break;
    }

    if (response.find(" 101 ") == std::string::npos) {
        spdlog::error("WebSocket handshake failed: {}", response.substr(0, response.find("\r\n")));
        release();
        return false;
    }

    // From here on the reader and writers share ssl_: switch to
    // non-blocking I/O so no thread sleeps inside an SSL call while holding
    // ssl_mutex_, and waits happen in poll() instead
    struct timeval no_timeout{};
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &no_timeout, sizeof(no_timeout));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &no_timeout, sizeof(no_timeout));
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to make socket non-blocking: {}", strerror(errno));
        release();
        return false;
    }
    SSL_set_mode(static_cast<SSL*>(ssl_), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    open_ = true;
    spdlog::info("WebSocket connected to {}:{}", host_, port_);
    return true;
}

bool WebSocketTransport::wait_io(int ssl_error) {
    short events = 0;
    if (ssl_error == SSL_ERROR_WANT_READ) {
        events = POLLIN;
    } else if (ssl_error == SSL_ERROR_WANT_WRITE) {
        events = POLLOUT;
    } else {
        return false;
    }

    while (open_.load()) {
        struct pollfd pfd{};
        pfd.fd = socket_fd_.load();
        pfd.events = events;
        if (pfd.fd < 0) return false;

        int rc = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (rc > 0) return open_.load();
        if (rc < 0 && errno != EINTR) {
            spdlog::error("poll failed: {}", strerror(errno));
            return false;
        }
    }
    return false;
}

int WebSocketTransport::ssl_call(bool write, void* buf, size_t len, int& ssl_error) {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    SSL* ssl = static_cast<SSL*>(ssl_);
    if (!ssl) {
        ssl_error = SSL_ERROR_SSL;
        return -1;
    }
    ERR_clear_error();
    int rc = write ? SSL_write(ssl, buf, static_cast<int>(len))
                   : SSL_read(ssl, buf, static_cast<int>(len));
    ssl_error = rc > 0 ? SSL_ERROR_NONE : SSL_get_error(ssl, rc);
    return rc;
}

bool WebSocketTransport::read_exact(void* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        int ssl_error = SSL_ERROR_NONE;
        int chunk = ssl_call(false, static_cast<char*>(buf) + total, len - total, ssl_error);
        if (chunk > 0) {
            total += chunk;
        } else if (!wait_io(ssl_error)) {
            return false;
        }
    }
    return true;
}

std::string WebSocketTransport::receive() {
    if (!open_.load()) return "";

    std::string message;
    while (true) {
        uint8_t header[2];
        if (!read_exact(header, 2)) break;

        bool fin = (header[0] & 0x80) != 0;
        uint8_t opcode = header[0] & 0x0F;
        bool masked = (header[1] & 0x80) != 0;
        uint64_t payload_len = header[1] & 0x7F;

        if (payload_len == 126) {
            uint8_t ext[2];
            if (!read_exact(ext, 2)) break;
            payload_len = (ext[0] << 8) | ext[1];
        } else if (payload_len == 127) {
            uint8_t ext[8];
            if (!read_exact(ext, 8)) break;
            payload_len = 0;
            for (int i = 0; i < 8; i++) {
                payload_len = (payload_len << 8) | ext[i];
            }
        }

        uint8_t mask[4] = {0};
        if (masked && !read_exact(mask, 4)) break;

        if (message.size() + payload_len > MAX_MESSAGE_SIZE) {
            spdlog::error("Message too large: {} bytes", message.size() + payload_len);
            break;
        }

        std::string payload(payload_len, '\0');
        if (payload_len > 0 && !read_exact(&payload[0], payload_len)) break;

        if (masked) {
            for (size_t i = 0; i < payload.size(); i++) {
                payload[i] ^= mask[i % 4];
            }
        }

        // Control frames
        if (opcode == 0x08) {
            spdlog::info("Received WebSocket close frame");
            break;
        } else if (opcode == 0x09) {
            write_frame(payload, 0x0A);
            continue;
        } else if (opcode == 0x0A) {
            continue;
        }

        // Text, binary or continuation
        message += payload;
        if (fin) return message;
    }

    open_ = false;
    return "";
}

bool WebSocketTransport::write_frame(const std::string& payload, uint8_t opcode) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_.load()) return false;
    std::string frame = create_ws_frame(payload, opcode);

    size_t sent = 0;
    while (sent < frame.size()) {
        int ssl_error = SSL_ERROR_NONE;
        int rc = ssl_call(true, &frame[sent], frame.size() - sent, ssl_error);
        if (rc > 0) {
            sent += rc;
        } else if (!wait_io(ssl_error)) {
            return false;
        }
    }
    return true;
}

bool WebSocketTransport::send(const std::string& text) {
    return write_frame(text, 0x01);
}

void WebSocketTransport::interrupt() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    open_ = false;
    int fd = socket_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void WebSocketTransport::close() {
    if (open_.load()) {
        write_frame("", 0x08);
    }
    open_ = false;
    release();
}

void WebSocketTransport::release() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (ssl_) {
        SSL_shutdown(static_cast<SSL*>(ssl_));
        SSL_free(static_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(static_cast<SSL_CTX*>(ssl_ctx_));
        ssl_ctx_ = nullptr;
    }
    int fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace binbot
