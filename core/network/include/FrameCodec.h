#pragma once

#include "Frame.h"
#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ChatStorage {

/**
 * @brief Encodes and decodes single frames.
 *
 * Wire layout, all integers big-endian:
 *   magic(2) = 0xFACE | type(1) | flags(1) | length(4) | payload(length)
 *
 * Decoding never looks inside the payload.
 */
class FrameCodec {
public:
    static std::vector<uint8_t> encode(const Frame& frame);

    static Result<Frame> decode(const uint8_t* data, std::size_t size);
    static Result<Frame> decode(const std::vector<uint8_t>& bytes) {
        return decode(bytes.data(), bytes.size());
    }

    /// Declared payload length, or nullopt when fewer than 8 bytes are available
    static std::optional<uint32_t> peekLength(const uint8_t* data, std::size_t size);

    /// True when data starts with the frame magic (needs at least 2 bytes)
    static bool hasMagic(const uint8_t* data, std::size_t size);

    /// One-line description for debug logs, e.g. "Ack(0x04) flags=0 len=42"
    static std::string describe(const Frame& frame);
};

} // namespace ChatStorage
