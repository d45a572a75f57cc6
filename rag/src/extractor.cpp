#include "../include/extractor.hpp"
#include "../include/encoding.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <filesystem>

const char* format_name(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::text: return "text";
        case DocumentFormat::paged: return "paged";
        case DocumentFormat::pdf: return "pdf";
        case DocumentFormat::docx: return "docx";
    }
    return "text";
}

static bool format_from_token(std::string t, DocumentFormat* out) {
    t = to_lower(t);
    if (!t.empty() && t[0] == '.') t.erase(0, 1);
    if (t == "text" || t == "txt" || t == "md" || t == "markdown" || t == "text/plain" || t == "text/markdown") {
        *out = DocumentFormat::text;
    } else if (t == "paged") {
        *out = DocumentFormat::paged;
    } else if (t == "pdf" || t == "application/pdf") {
        *out = DocumentFormat::pdf;
    } else if (t == "docx" || t == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
        *out = DocumentFormat::docx;
    } else {
        return false;
    }
    return true;
}

DocumentFormat resolve_format(const std::string& declared, const std::string& filename) {
    DocumentFormat f = DocumentFormat::text;
    if (!declared.empty()) {
        if (format_from_token(declared, &f)) return f;
        throw UnsupportedFormatError("unsupported document format: " + declared);
    }
    auto ext = std::filesystem::path(filename).extension().string();
    if (!ext.empty() && format_from_token(ext, &f)) return f;
    throw UnsupportedFormatError("cannot determine a supported format for '" + filename + "'");
}

static ExtractedText join_pages(const std::vector<std::string>& pages) {
    ExtractedText out;
    int number = 1;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) out.text.push_back('\n');
        PageSpan span;
        span.number = number++;
        span.start = out.text.size();
        out.text += pages[i];
        span.end = out.text.size();
        out.pages.push_back(span);
    }
    return out;
}

ExtractedText extract_text(const std::string& bytes, DocumentFormat format) {
    switch (format) {
        case DocumentFormat::text: {
            ExtractedText out;
            out.text = decode_to_utf8(bytes, &out.encoding);
            out.pages.push_back(PageSpan{1, 0, out.text.size()});
            return out;
        }
        case DocumentFormat::paged: {
            // Form feeds separate pages; they are kept in place as newlines so offsets still line up.
            ExtractedText out;
            out.text = decode_to_utf8(bytes, &out.encoding);
            size_t start = 0;
            int number = 1;
            for (size_t i = 0; i <= out.text.size(); ++i) {
                if (i == out.text.size() || out.text[i] == '\f') {
                    out.pages.push_back(PageSpan{number++, start, i});
                    if (i < out.text.size()) out.text[i] = '\n';
                    start = i + 1;
                }
            }
            return out;
        }
        case DocumentFormat::pdf: {
            auto out = join_pages(extract_pdf_pages(bytes));
            out.encoding = "UTF-8";
            return out;
        }
        case DocumentFormat::docx: {
            auto out = join_pages(extract_docx_pages(bytes));
            out.encoding = "UTF-8";
            return out;
        }
    }
    throw UnsupportedFormatError("unsupported document format");
}

int page_at(const std::vector<PageSpan>& pages, size_t offset) {
    if (pages.empty()) return 0;
    auto it = std::upper_bound(pages.begin(), pages.end(), offset,
                               [](size_t off, const PageSpan& p){ return off < p.start; });
    if (it == pages.begin()) return pages.front().number;
    return std::prev(it)->number;
}
