#pragma once

#include <cstdint>
#include <string>

// Length-prefixed framing: 4-byte uint32 big-endian + payload.
constexpr uint32_t MAX_MESSAGE_BYTES = 10 * 1024 * 1024;

// Throws std::runtime_error on a short read, an empty frame or a frame
// larger than MAX_MESSAGE_BYTES.
std::string read_message(int fd);

// Throws std::runtime_error if the peer stops accepting bytes.
void write_message(int fd, const std::string& msg);
