#include "../include/extractor.hpp"
#include "../include/encoding.hpp"
#include "../include/errors.hpp"
#include <zlib.h>
#include <cstdint>
#include <cstdlib>

namespace {

const size_t kMaxMemberBytes = 64u << 20;

uint16_t rd16(const std::string& b, size_t off) {
    if (off + 2 > b.size()) throw CorruptDocumentError("truncated ZIP container");
    return (uint16_t)((unsigned char)b[off] | ((unsigned char)b[off + 1] << 8));
}

uint32_t rd32(const std::string& b, size_t off) {
    if (off + 4 > b.size()) throw CorruptDocumentError("truncated ZIP container");
    return (uint32_t)rd16(b, off) | ((uint32_t)rd16(b, off + 2) << 16);
}

struct ZipMember {
    uint16_t method{0};
    uint32_t compressed{0};
    uint32_t uncompressed{0};
    uint32_t local_offset{0};
};

bool find_member(const std::string& zip, const std::string& name, ZipMember* out) {
    // End of central directory record sits in the last 22 + 65535 bytes.
    if (zip.size() < 22) throw CorruptDocumentError("not a ZIP container");
    size_t min_pos = zip.size() > 22 + 65535 ? zip.size() - 22 - 65535 : 0;
    size_t eocd = std::string::npos;
    for (size_t p = zip.size() - 22 + 1; p-- > min_pos;) {
        if (rd32(zip, p) == 0x06054b50) { eocd = p; break; }
    }
    if (eocd == std::string::npos) throw CorruptDocumentError("ZIP end of central directory not found");

    uint16_t entries = rd16(zip, eocd + 10);
    size_t p = rd32(zip, eocd + 16);
    for (uint16_t i = 0; i < entries; ++i) {
        if (rd32(zip, p) != 0x02014b50) throw CorruptDocumentError("bad ZIP central directory entry");
        uint16_t name_len = rd16(zip, p + 28);
        uint16_t extra_len = rd16(zip, p + 30);
        uint16_t comment_len = rd16(zip, p + 32);
        if (p + 46 + name_len > zip.size()) throw CorruptDocumentError("truncated ZIP central directory");
        if (zip.compare(p + 46, name_len, name) == 0 && name_len == name.size()) {
            out->method = rd16(zip, p + 10);
            out->compressed = rd32(zip, p + 20);
            out->uncompressed = rd32(zip, p + 24);
            out->local_offset = rd32(zip, p + 42);
            return true;
        }
        p += 46 + name_len + extra_len + comment_len;
    }
    return false;
}

std::string read_member(const std::string& zip, const ZipMember& m) {
    size_t lh = m.local_offset;
    if (rd32(zip, lh) != 0x04034b50) throw CorruptDocumentError("bad ZIP local header");
    size_t data = lh + 30 + rd16(zip, lh + 26) + rd16(zip, lh + 28);
    if (data + m.compressed > zip.size()) throw CorruptDocumentError("ZIP member exceeds container");
    if (m.uncompressed > kMaxMemberBytes) throw CorruptDocumentError("ZIP member too large");

    if (m.method == 0) return zip.substr(data, m.compressed);
    if (m.method != 8) throw CorruptDocumentError("unsupported ZIP compression method " + std::to_string(m.method));

    std::string out(m.uncompressed, '\0');
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) throw CorruptDocumentError("inflateInit2 failed");
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(zip.data() + data));
    zs.avail_in = m.compressed;
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = (uInt)out.size();
    int rc = inflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != m.uncompressed) throw CorruptDocumentError("ZIP member failed to inflate");
    return out;
}

void append_entity(const std::string& ent, std::string& out) {
    if (ent == "lt") out += '<';
    else if (ent == "gt") out += '>';
    else if (ent == "amp") out += '&';
    else if (ent == "quot") out += '"';
    else if (ent == "apos") out += '\'';
    else if (ent.size() > 1 && ent[0] == '#') {
        bool hex = ent[1] == 'x' || ent[1] == 'X';
        unsigned long cp = std::strtoul(ent.c_str() + (hex ? 2 : 1), nullptr, hex ? 16 : 10);
        if (cp > 0 && cp <= 0x10FFFF) append_utf8(out, (uint32_t)cp);
    }
}

std::string tag_name(const std::string& tag) {
    size_t end = tag.find_first_of(" \t\r\n/>");
    return tag.substr(0, end);
}

}

std::vector<std::string> extract_docx_pages(const std::string& bytes) {
    ZipMember m;
    if (!find_member(bytes, "word/document.xml", &m)) {
        throw CorruptDocumentError("DOCX has no word/document.xml");
    }
    std::string xml = read_member(bytes, m);

    std::vector<std::string> pages(1);
    bool in_text = false;
    size_t i = 0, n = xml.size();
    while (i < n) {
        if (xml[i] == '<') {
            size_t close = xml.find('>', i);
            if (close == std::string::npos) throw CorruptDocumentError("unterminated XML tag in document.xml");
            std::string tag = xml.substr(i + 1, close - i - 1);
            bool self_closing = !tag.empty() && tag.back() == '/';
            std::string name = tag_name(tag);
            if (name == "w:t") {
                in_text = !self_closing;
            } else if (name == "/w:t") {
                in_text = false;
            } else if (name == "/w:p") {
                pages.back() += '\n';
            } else if (name == "w:tab") {
                pages.back() += '\t';
            } else if (name == "w:br" || name == "w:cr") {
                if (tag.find("w:type=\"page\"") != std::string::npos) pages.emplace_back();
                else pages.back() += '\n';
            }
            i = close + 1;
            continue;
        }
        if (!in_text) { ++i; continue; }
        if (xml[i] == '&') {
            size_t semi = xml.find(';', i);
            if (semi == std::string::npos) throw CorruptDocumentError("unterminated XML entity");
            append_entity(xml.substr(i + 1, semi - i - 1), pages.back());
            i = semi + 1;
            continue;
        }
        pages.back() += xml[i++];
    }
    for (auto& p : pages) {
        if (!is_valid_utf8(p)) throw CorruptDocumentError("document.xml is not valid UTF-8");
    }
    return pages;
}
