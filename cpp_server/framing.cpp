#include "framing.hpp"

#include <cerrno>
#include <stdexcept>
#include <unistd.h>

namespace {

// Retries on EINTR; a closed peer or any other error is fatal for the frame.
void read_exact(int fd, char* buf, size_t len, const char* what) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = read(fd, buf + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw std::runtime_error(std::string("Failed to read message ") + what);
        }
        total += static_cast<size_t>(n);
    }
}

void write_all(int fd, const char* buf, size_t len, const char* what) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = write(fd, buf + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw std::runtime_error(std::string("Failed to write message ") + what);
        }
        total += static_cast<size_t>(n);
    }
}

}  // namespace

std::string read_message(int fd) {
    unsigned char header[4];
    read_exact(fd, reinterpret_cast<char*>(header), sizeof(header), "length");

    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8)  |
                      static_cast<uint32_t>(header[3]);
    if (length == 0 || length > MAX_MESSAGE_BYTES) {
        throw std::runtime_error("Invalid message length: " + std::to_string(length));
    }

    std::string payload(length, '\0');
    read_exact(fd, &payload[0], length, "payload");
    return payload;
}

void write_message(int fd, const std::string& msg) {
    if (msg.size() > MAX_MESSAGE_BYTES) {
        throw std::runtime_error("Message too large: " + std::to_string(msg.size()) + " bytes");
    }

    uint32_t length = static_cast<uint32_t>(msg.size());
    const char header[4] = {
        static_cast<char>((length >> 24) & 0xFF),
        static_cast<char>((length >> 16) & 0xFF),
        static_cast<char>((length >> 8) & 0xFF),
        static_cast<char>(length & 0xFF)
    };
    write_all(fd, header, sizeof(header), "length");
    write_all(fd, msg.data(), msg.size(), "payload");
}
