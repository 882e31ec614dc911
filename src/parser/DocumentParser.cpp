#include "DocumentParser.hpp"
#include <lexbor/html/html.h>
#include <stdexcept>

namespace OwStats {

std::unique_ptr<HtmlDocument> DocumentParser::Parse(const std::string& html_content) {
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) {
        throw std::runtime_error("Failed to create lexbor HTML document");
    }

    // lexbor only reports allocation failures here; bad markup is repaired.
    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html_content.data()),
        html_content.size());

    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        throw std::runtime_error("lexbor failed to parse document, status " + std::to_string(status));
    }

    return std::make_unique<HtmlDocument>(document);
}

}
