/**
 * @file stream_scanner.cpp
 * @brief Resynchronizing scanner for VIB record boundaries.
 */

#include <vif2csv/stream_scanner.hpp>

#include <algorithm>
#include <cstring>

namespace vif2csv {

StreamScanner::StreamScanner(std::istream& source, std::size_t initial_capacity)
    : source_(source), window_(std::max<std::size_t>(initial_capacity, MIN_RECORD_BYTES)) {}

void StreamScanner::compact() noexcept {
    std::size_t remaining = length_ - scan_;
    if (remaining > 0) {
        std::memmove(window_.data(), window_.data() + scan_, remaining);
    }
    window_start_ += scan_;
    length_ = remaining;
    scan_ = 0;
}

bool StreamScanner::ensure_available(std::size_t count) {
    while (length_ - scan_ < count) {
        if (scan_ > 0) {
            compact();
            continue;
        }

        if (length_ == window_.size()) {
            std::size_t capacity = window_.size() * 2;
            while (capacity < count) {
                capacity *= 2;
            }
            window_.resize(capacity);
        }

        source_.read(reinterpret_cast<char*>(window_.data() + length_),
                     static_cast<std::streamsize>(window_.size() - length_));
        std::streamsize got = source_.gcount();
        if (source_.bad()) {
            source_failed_ = true;
            return false;
        }
        if (got <= 0) {
            return false;
        }
        length_ += static_cast<std::size_t>(got);
    }
    return true;
}

bool StreamScanner::find_candidate(RawRecordCandidate& out) {
    for (;;) {
        if (!ensure_available(MARKER_SIZE)) {
            return false;
        }

        std::size_t i = scan_;
        while (i + 2 < length_) {
            if (window_[i] == MARKER[0] && window_[i + 1] == MARKER[1] &&
                window_[i + 2] == MARKER[2]) {
                break;
            }
            ++i;
        }

        scan_ = i;
        if (i + 2 >= length_) {
            // Keep a possible partial marker and pull more bytes
            continue;
        }

        if (!ensure_available(MIN_RECORD_BYTES)) {
            return false;
        }

        std::size_t record_size = window_[scan_ + offsets::SIZE] |
                                  (static_cast<std::size_t>(window_[scan_ + offsets::SIZE + 1]) << 8);
        std::size_t advance = std::max(record_size, MIN_RECORD_BYTES);
        if (!ensure_available(advance)) {
            return false;
        }

        std::size_t copy_len = std::min(advance, out.bytes.size());
        std::memcpy(out.bytes.data(), window_.data() + scan_, copy_len);
        std::fill(out.bytes.begin() + static_cast<std::ptrdiff_t>(copy_len), out.bytes.end(), 0);
        out.offset = window_start_ + scan_;

        scan_ += advance;
        ++records_found_;
        return true;
    }
}

Error StreamScanner::next(ScannedRecord& out) {
    if (finished_) {
        return Error::EndOfStream;
    }

    RawRecordCandidate found;
    while (find_candidate(found)) {
        if (pending_) {
            out.candidate = *pending_;
            out.read_type = read_type_from_delta(found.offset - pending_->offset);
            pending_ = found;
            return Error::Ok;
        }
        pending_ = found;
    }

    finished_ = true;
    if (source_failed_) {
        pending_.reset();
        return Error::Io;
    }

    // The last candidate has no successor to measure against
    if (pending_) {
        out.candidate = *pending_;
        out.read_type = READ_TYPE_NORMAL;
        pending_.reset();
        return Error::Ok;
    }
    return Error::EndOfStream;
}

} // namespace vif2csv
