#include "FrameExtractor.h"
#include "FrameCodec.h"
#include "Constants.h"
#include "Logger.h"
#include "MetricsCollector.h"

namespace ChatStorage {

std::optional<std::pair<Frame, std::vector<uint8_t>>> FrameExtractor::extract(const std::vector<uint8_t>& buffer) {
    auto length = FrameCodec::peekLength(buffer.data(), buffer.size());
    if (!length) {
        return std::nullopt;
    }
    const std::size_t total = config::FRAME_HEADER_SIZE + *length;
    if (buffer.size() < total) {
        return std::nullopt;
    }

    auto frame = FrameCodec::decode(buffer.data(), total);
    if (!frame) {
        return std::nullopt;
    }
    std::vector<uint8_t> remainder(buffer.begin() + static_cast<std::ptrdiff_t>(total), buffer.end());
    return std::make_pair(std::move(*frame), std::move(remainder));
}

void FrameExtractor::append(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    // Compact before growing once most of the buffer has been consumed
    if (readPos_ > 0 && readPos_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
        readPos_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<Frame> FrameExtractor::next() {
    for (;;) {
        const uint8_t* head = buffer_.data() + readPos_;
        const std::size_t available = buffered();

        if (available >= 2 && !FrameCodec::hasMagic(head, available)) {
            // Resynchronise on the next magic candidate; keep a trailing 0xFA
            std::size_t skip = 1;
            while (skip < available) {
                if (head[skip] == static_cast<uint8_t>(config::FRAME_MAGIC >> 8) &&
                    (skip + 1 == available || head[skip + 1] == static_cast<uint8_t>(config::FRAME_MAGIC & 0xFF))) {
                    break;
                }
                ++skip;
            }
            Logger::instance().log(LogLevel::WARN, "Bad frame magic, skipped " + std::to_string(skip) + " bytes",
                                   "FrameExtractor");
            discard(skip);
            continue;
        }

        auto length = FrameCodec::peekLength(head, available);
        if (!length) {
            return std::nullopt;
        }
        if (*length > config::MAX_FRAME_PAYLOAD) {
            Logger::instance().log(LogLevel::WARN, "Implausible frame length " + std::to_string(*length) +
                                   ", resynchronising", "FrameExtractor");
            MetricsCollector::instance().incrementFramesDiscarded();
            discard(1);
            continue;
        }
        const std::size_t total = config::FRAME_HEADER_SIZE + *length;
        if (available < total) {
            return std::nullopt;
        }

        auto frame = FrameCodec::decode(head, total);
        if (!frame) {
            // Only UnknownType can reach here: header is complete and magic matched
            Logger::instance().log(LogLevel::WARN, "Dropping frame: " + frame.error().toString(), "FrameExtractor");
            MetricsCollector::instance().incrementFramesDiscarded();
            discard(total);
            continue;
        }

        consume(total);
        return std::move(*frame);
    }
}

void FrameExtractor::clear() {
    buffer_.clear();
    readPos_ = 0;
}

void FrameExtractor::consume(std::size_t count) {
    readPos_ += count;
    if (readPos_ == buffer_.size()) {
        buffer_.clear();
        readPos_ = 0;
    }
}

void FrameExtractor::discard(std::size_t count) {
    discardedBytes_ += count;
    consume(count);
}

} // namespace ChatStorage
