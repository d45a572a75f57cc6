#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class DocumentFormat { text, paged, pdf, docx };

const char* format_name(DocumentFormat format);

// Resolves a declared format ("text", "txt", "md", "paged", "pdf", "docx", optionally with
// a leading dot) and falls back to the filename extension when nothing is declared.
// Throws UnsupportedFormatError.
DocumentFormat resolve_format(const std::string& declared, const std::string& filename);

struct PageSpan {
    int number{1};
    std::size_t start{0}; // byte offsets into ExtractedText::text
    std::size_t end{0};
};

struct ExtractedText {
    std::string text;
    std::vector<PageSpan> pages;
    std::string encoding;
};

// Pure function of its inputs; safe to retry. Throws UnsupportedFormatError or
// CorruptDocumentError.
ExtractedText extract_text(const std::string& bytes, DocumentFormat format);

// Page containing offset, or 0 when pages is empty.
int page_at(const std::vector<PageSpan>& pages, std::size_t offset);

// Container readers used by extract_text; each returns one string per page.
std::vector<std::string> extract_docx_pages(const std::string& bytes);
std::vector<std::string> extract_pdf_pages(const std::string& bytes);
