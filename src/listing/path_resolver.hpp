#pragma once

#include <bitset>
#include <string>
#include <optional>
#include <filesystem>

// Byte class used to find the filename under the cursor.
// Default: letters, digits, bytes >= 0x80 and / . - _ + , # $ % ~ =
class FilenameCharset {
public:
    FilenameCharset();

    bool contains(char c) const { return bits_.test(static_cast<unsigned char>(c)); }
    void add(const std::string& chars);

    std::bitset<256> bits() const { return bits_; }
    void set_bits(const std::bitset<256>& bits) { bits_ = bits; }

private:
    std::bitset<256> bits_;
};

// Widens a charset for the lifetime of the guard and restores the previous
// set on destruction, including during stack unwinding.
class ScopedCharsetWidening {
public:
    ScopedCharsetWidening(FilenameCharset& charset, const std::string& extra);
    ~ScopedCharsetWidening();

    ScopedCharsetWidening(const ScopedCharsetWidening&) = delete;
    ScopedCharsetWidening& operator=(const ScopedCharsetWidening&) = delete;

private:
    FilenameCharset& charset_;
    std::bitset<256> saved_;
};

// Maximal run of charset bytes around `column`. If the byte at `column` is not
// part of a filename, the next run to the right is used. nullopt if none.
std::optional<std::string> extract_filename_token(const std::string& line, size_t column,
                                                  const FilenameCharset& charset);

// Turn the entry under the cursor into a normalized absolute path without a
// trailing separator. nullopt for blank space, "." and "..". The charset is
// widened with FILENAME_EXTRA_CHARS only while the token is extracted.
std::optional<std::string> resolve_entry(const std::filesystem::path& base_dir,
                                         const std::string& line, size_t column,
                                         FilenameCharset& charset);

// Same normalization for a line that holds exactly one entry name, taken
// verbatim so quotes, colons and other bytes outside the charset survive.
std::optional<std::string> resolve_entry_name(const std::filesystem::path& base_dir,
                                              const std::string& entry);
