#include "session_transcript.hpp"

SessionTranscript::SessionTranscript(size_t max_bytes) : max_bytes_(max_bytes) {}

void SessionTranscript::rewind_line() {
    auto nl = text_.rfind('\n');
    text_.erase(nl == std::string::npos ? 0 : nl + 1);
}

void SessionTranscript::put(char c) {
    if (pending_cr_) {
        pending_cr_ = false;
        if (c != '\n') rewind_line();
    }
    if (c == '\r') {
        pending_cr_ = true;
        return;
    }
    text_ += c;
}

void SessionTranscript::append(const std::string& chunk) {
    std::string buf = pending_esc_ + chunk;
    pending_esc_.clear();

    size_t len = buf.size();
    for (size_t i = 0; i < len; ) {
        if (buf[i] == '\033') {
            if (i + 1 >= len) {
                pending_esc_ = buf.substr(i);
                break;
            }
            if (buf[i + 1] == '[') {
                // CSI: parameters then one final byte in @..~
                size_t j = i + 2;
                while (j < len && (buf[j] < '@' || buf[j] > '~')) j++;
                if (j >= len) {
                    pending_esc_ = buf.substr(i);
                    break;
                }
                i = j + 1;
            } else {
                i += 2;
            }
        } else if (buf[i] == '\b') {
            if (!text_.empty() && text_.back() != '\n') text_.pop_back();
            i++;
        } else {
            put(buf[i++]);
        }
    }
    enforce_cap();
}

void SessionTranscript::append_line(const std::string& line) {
    pending_cr_ = false;
    if (!text_.empty() && text_.back() != '\n') text_ += '\n';
    text_ += line;
    text_ += '\n';
    enforce_cap();
}

void SessionTranscript::enforce_cap() {
    if (text_.size() <= max_bytes_) return;
    size_t cut = text_.size() - max_bytes_;
    auto nl = text_.find('\n', cut);
    text_.erase(0, nl == std::string::npos ? cut : nl + 1);
}

std::vector<std::string> SessionTranscript::tail(size_t n) const {
    std::vector<std::string> lines;
    size_t end = text_.size();
    if (end > 0 && text_[end - 1] == '\n') end--;

    while (lines.size() < n && end > 0) {
        auto nl = text_.rfind('\n', end - 1);
        size_t start = (nl == std::string::npos) ? 0 : nl + 1;
        lines.insert(lines.begin(), text_.substr(start, end - start));
        if (nl == std::string::npos) break;
        end = nl;
    }
    return lines;
}
