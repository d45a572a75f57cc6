#include "../include/encoding.hpp"
#include "../include/errors.hpp"
#include <cerrno>
#include <iconv.h>
#include <optional>

static bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

bool is_valid_utf8(const std::string& s) {
    size_t i = 0, n = s.size();
    while (i < n) {
        unsigned char c = (unsigned char)s[i];
        if (c < 0x80) { ++i; continue; }
        size_t len = 0;
        uint32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char ck = (unsigned char)s[i + k];
            if (!is_cont(ck)) return false;
            cp = (cp << 6) | (ck & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if (len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += len;
    }
    return true;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

static std::string utf16_to_utf8(const std::string& bytes, size_t offset, bool big_endian) {
    if ((bytes.size() - offset) % 2 != 0) {
        throw CorruptDocumentError(std::string("invalid UTF-16") + (big_endian ? "BE" : "LE") + " byte length");
    }
    auto unit = [&](size_t i) -> uint32_t {
        unsigned char a = (unsigned char)bytes[i], b = (unsigned char)bytes[i + 1];
        return big_endian ? ((uint32_t)a << 8 | b) : ((uint32_t)b << 8 | a);
    };
    std::string out;
    out.reserve(bytes.size());
    for (size_t i = offset; i < bytes.size(); i += 2) {
        uint32_t u = unit(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 3 >= bytes.size()) throw CorruptDocumentError("truncated UTF-16 surrogate pair");
            uint32_t lo = unit(i + 2);
            if (lo < 0xDC00 || lo > 0xDFFF) throw CorruptDocumentError("unpaired UTF-16 surrogate");
            append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
            i += 2;
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
            throw CorruptDocumentError("unpaired UTF-16 surrogate");
        } else {
            append_utf8(out, u);
        }
    }
    return out;
}

namespace {

// An iconv descriptor from one legacy charset to UTF-8.
class LegacyDecoder {
public:
    explicit LegacyDecoder(const char* charset) : cd_(iconv_open("UTF-8", charset)) {}
    ~LegacyDecoder() { if (ok()) iconv_close(cd_); }
    LegacyDecoder(const LegacyDecoder&) = delete;
    LegacyDecoder& operator=(const LegacyDecoder&) = delete;

    bool ok() const { return cd_ != (iconv_t)-1; }

    // Empty when the input holds a sequence the charset cannot represent.
    std::optional<std::string> decode(const std::string& in) {
        std::string out;
        char block[4096];
        char* src = const_cast<char*>(in.data());
        size_t src_left = in.size();
        while (src_left > 0) {
            char* dst = block;
            size_t dst_left = sizeof(block);
            size_t rc = iconv(cd_, &src, &src_left, &dst, &dst_left);
            out.append(block, sizeof(block) - dst_left);
            if (rc == (size_t)-1 && errno != E2BIG) return std::nullopt;
        }
        return out;
    }

private:
    iconv_t cd_;
};

}

std::string decode_to_utf8(const std::string& bytes, std::string* encoding) {
    auto set = [&](const char* name) { if (encoding) *encoding = name; };
    const auto b = [&](size_t i) { return (unsigned char)bytes[i]; };

    if (bytes.size() >= 3 && b(0) == 0xEF && b(1) == 0xBB && b(2) == 0xBF) {
        std::string rest = bytes.substr(3);
        if (!is_valid_utf8(rest)) throw CorruptDocumentError("invalid UTF-8 after byte order mark");
        set("UTF-8");
        return rest;
    }
    if (bytes.size() >= 2 && b(0) == 0xFF && b(1) == 0xFE) {
        set("UTF-16LE");
        return utf16_to_utf8(bytes, 2, false);
    }
    if (bytes.size() >= 2 && b(0) == 0xFE && b(1) == 0xFF) {
        set("UTF-16BE");
        return utf16_to_utf8(bytes, 2, true);
    }
    if (bytes.find('\0') != std::string::npos) {
        throw CorruptDocumentError("binary content in text document");
    }
    if (is_valid_utf8(bytes)) {
        set("UTF-8");
        return bytes;
    }
    for (const char* cs : {"WINDOWS-1252", "ISO-8859-1"}) {
        LegacyDecoder decoder(cs);
        if (!decoder.ok()) continue;
        auto text = decoder.decode(bytes);
        if (text && is_valid_utf8(*text)) {
            set(cs);
            return *text;
        }
    }
    throw CorruptDocumentError("text is not valid UTF-8, UTF-16, WINDOWS-1252 or ISO-8859-1");
}

size_t utf8_floor(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    while (pos > 0 && is_cont((unsigned char)s[pos])) --pos;
    return pos;
}

size_t utf8_ceil(const std::string& s, size_t pos) {
    while (pos < s.size() && is_cont((unsigned char)s[pos])) ++pos;
    return pos;
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    return s.substr(0, utf8_floor(s, max_bytes));
}
