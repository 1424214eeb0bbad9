#include <replay/line_reader.hpp>
#include <utils/errors.hpp>

namespace ChainReplay {

LineReader::LineReader(const std::string& path, size_t chunk_size)
    : path_(path), chunk_(chunk_size == 0 ? 1 : chunk_size) {
    file_.open(path, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        throw IoError("Could not open file: " + path);
    }
}

bool LineReader::fill() {
    if (eof_) return false;

    file_.read(chunk_.data(), static_cast<std::streamsize>(chunk_.size()));
    std::streamsize got = file_.gcount();
    if (file_.bad()) {
        throw IoError("Read failed: " + path_);
    }
    if (got <= 0) {
        eof_ = true;
        return false;
    }

    // Drop the consumed prefix before appending so pending_ stays one line long
    if (pending_pos_ > 0) {
        pending_.erase(0, pending_pos_);
        pending_pos_ = 0;
    }
    pending_.append(chunk_.data(), static_cast<size_t>(got));
    if (file_.eof()) eof_ = true;
    return true;
}

std::optional<std::string> LineReader::next() {
    while (true) {
        size_t newline = pending_.find('\n', pending_pos_);
        if (newline != std::string::npos) {
            size_t end = newline;
            if (end > pending_pos_ && pending_[end - 1] == '\r') --end;
            std::string line = pending_.substr(pending_pos_, end - pending_pos_);
            pending_pos_ = newline + 1;
            ++line_number_;
            return line;
        }

        if (!fill()) {
            if (pending_pos_ < pending_.size()) {
                // Last line without a trailing newline
                size_t end = pending_.size();
                if (pending_[end - 1] == '\r') --end;
                std::string line = pending_.substr(pending_pos_, end - pending_pos_);
                pending_.clear();
                pending_pos_ = 0;
                ++line_number_;
                return line;
            }
            return std::nullopt;
        }
    }
}

} // namespace ChainReplay
