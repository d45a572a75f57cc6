#include "../include/extractor.hpp"
#include "../include/errors.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <memory>

std::vector<std::string> extract_pdf_pages(const std::string& bytes) {
    if (bytes.compare(0, 5, "%PDF-") != 0) throw CorruptDocumentError("missing %PDF- header");
    // poppler keeps a pointer to the buffer for the document's lifetime.
    std::vector<char> data(bytes.begin(), bytes.end());
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(data.data(), (int)data.size()));
    if (!doc) throw CorruptDocumentError("poppler failed to open PDF");
    if (doc->is_locked()) throw CorruptDocumentError("PDF is encrypted");

    std::vector<std::string> pages;
    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            pages.emplace_back();
            continue;
        }
        auto ba = page->text().to_utf8();
        pages.emplace_back(ba.begin(), ba.end());
    }
    return pages;
}
