#pragma once

#include "Frame.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace ChatStorage {

/**
 * @brief Pulls complete frames out of a fragmented byte stream.
 *
 * The receive loop appends whatever a read returned and then calls next()
 * until it yields nothing. Bytes that cannot start a frame (bad magic) are
 * skipped up to the next magic candidate, as is a header declaring more than
 * MAX_FRAME_PAYLOAD bytes. A complete frame with an unknown
 * type byte is skipped whole. Well-formed frames are never dropped or
 * duplicated.
 */
class FrameExtractor {
public:
    /// Stateless single step: first complete frame plus the unconsumed bytes
    static std::optional<std::pair<Frame, std::vector<uint8_t>>> extract(const std::vector<uint8_t>& buffer);

    void append(const uint8_t* data, std::size_t size);
    void append(const std::vector<uint8_t>& bytes) { append(bytes.data(), bytes.size()); }

    std::optional<Frame> next();

    std::size_t buffered() const { return buffer_.size() - readPos_; }
    uint64_t discardedBytes() const { return discardedBytes_; }
    void clear();

private:
    void consume(std::size_t count);
    void discard(std::size_t count);

    std::vector<uint8_t> buffer_;
    std::size_t readPos_{0};
    uint64_t discardedBytes_{0};
};

} // namespace ChatStorage
