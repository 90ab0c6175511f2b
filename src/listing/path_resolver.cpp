#include "path_resolver.hpp"
#include <core/constants.hpp>
#include <cctype>

namespace fs = std::filesystem;

FilenameCharset::FilenameCharset() {
    for (int c = 0; c < 256; ++c) {
        if (c >= 0x80 || std::isalnum(c)) bits_.set(static_cast<size_t>(c));
    }
    add("/.-_+,#$%~=");
}

void FilenameCharset::add(const std::string& chars) {
    for (char c : chars) bits_.set(static_cast<unsigned char>(c));
}

ScopedCharsetWidening::ScopedCharsetWidening(FilenameCharset& charset, const std::string& extra)
    : charset_(charset), saved_(charset.bits()) {
    charset_.add(extra);
}

ScopedCharsetWidening::~ScopedCharsetWidening() {
    charset_.set_bits(saved_);
}

std::optional<std::string> extract_filename_token(const std::string& line, size_t column,
                                                  const FilenameCharset& charset) {
    if (line.empty()) return std::nullopt;
    if (column >= line.size()) column = line.size() - 1;

    size_t pos = column;
    while (pos < line.size() && !charset.contains(line[pos])) ++pos;
    if (pos == line.size()) return std::nullopt;

    size_t start = pos;
    while (start > 0 && charset.contains(line[start - 1])) --start;
    size_t end = pos;
    while (end < line.size() && charset.contains(line[end])) ++end;

    return line.substr(start, end - start);
}

static void strip_trailing_separators(std::string& s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
}

std::optional<std::string> resolve_entry(const fs::path& base_dir,
                                         const std::string& line, size_t column,
                                         FilenameCharset& charset) {
    std::optional<std::string> token;
    {
        ScopedCharsetWidening widen(charset, FILENAME_EXTRA_CHARS);
        token = extract_filename_token(line, column, charset);
    }
    if (!token) return std::nullopt;
    return resolve_entry_name(base_dir, *token);
}

std::optional<std::string> resolve_entry_name(const fs::path& base_dir, const std::string& entry) {
    std::string name = entry;
    if (name.find_first_not_of(" \t") == std::string::npos) return std::nullopt;
    strip_trailing_separators(name);
    if (name == "." || name == "..") return std::nullopt;

    fs::path base = base_dir;
    if (base.is_relative()) {
        std::error_code ec;
        base = fs::absolute(base, ec);
        if (ec) return std::nullopt;
    }

    fs::path joined = (name[0] == '/') ? fs::path(name) : base / name;
    std::string normalized = joined.lexically_normal().string();
    strip_trailing_separators(normalized);
    return normalized;
}
