#include "utils.hpp"
#include "types.hpp"
#include <cctype>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

static bool is_shell_safe(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";

    bool safe = true;
    for (char c : word) {
        if (!is_shell_safe(c)) { safe = false; break; }
    }
    if (safe) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += " ";
        out += shell_quote(words[i]);
    }
    return out;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::NoTarget:           return "no_target";
        case ErrorKind::DestinationUnset:   return "destination_unset";
        case ErrorKind::NothingMarked:      return "nothing_marked";
        case ErrorKind::ToolNotFound:       return "tool_not_found";
        case ErrorKind::TransferFailed:     return "transfer_failed";
        case ErrorKind::SurfaceUnavailable: return "surface_unavailable";
        case ErrorKind::Busy:               return "busy";
        case ErrorKind::InvalidConfig:      return "invalid_config";
    }
    return "unknown";
}
