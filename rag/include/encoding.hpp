#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

bool is_valid_utf8(const std::string& s);

// Re-encodes text bytes as UTF-8. Tries UTF-8 (BOM stripped), UTF-16 by BOM, then
// WINDOWS-1252 and ISO-8859-1 through iconv. *encoding receives the name that worked.
// Throws CorruptDocumentError when the bytes are not text.
std::string decode_to_utf8(const std::string& bytes, std::string* encoding);

// Code point boundary helpers; offsets are byte positions in UTF-8 text.
std::size_t utf8_floor(const std::string& s, std::size_t pos);
std::size_t utf8_ceil(const std::string& s, std::size_t pos);
std::string utf8_prefix(const std::string& s, std::size_t max_bytes);
void append_utf8(std::string& out, uint32_t cp);
