#pragma once

#include <string>
#include <vector>

// Plain-text record of what a transfer printed on its surface.
//
// Escape sequences are dropped and carriage-return redraws (rsync --progress)
// overwrite the current line, so the transcript holds what the user last saw
// on each line. Oldest lines are discarded past max_bytes.
class SessionTranscript {
public:
    explicit SessionTranscript(size_t max_bytes);

    void append(const std::string& chunk);

    // Append a complete line of our own (status lines).
    void append_line(const std::string& line);

    // Up to n last lines, including an unterminated final line.
    std::vector<std::string> tail(size_t n) const;

    const std::string& text() const { return text_; }

private:
    size_t max_bytes_;
    std::string text_;
    std::string pending_esc_;   // escape sequence split across chunks
    bool pending_cr_ = false;   // '\r' seen, waiting to know if '\n' follows

    void put(char c);
    void rewind_line();
    void enforce_cap();
};
