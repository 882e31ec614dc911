#pragma once
#include <string>
#include <vector>

// Forward declare lexbor's document type
typedef struct lxb_html_document lxb_html_document_t;

namespace OwStats {

// Parsed, read-only HTML tree. Owns the underlying lexbor document.
class HtmlDocument {
public:
    explicit HtmlDocument(lxb_html_document_t* document);
    ~HtmlDocument();

    // Non-copyable
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    std::string Title() const;

    // Text content of every element with the given tag name, in document order.
    std::vector<std::string> TextByTagName(const std::string& tag) const;

    // Text content of every element carrying the given class.
    std::vector<std::string> TextByClassName(const std::string& class_name) const;

    // Values of attr on every element with the given tag name that has it.
    std::vector<std::string> AttributeValues(const std::string& tag, const std::string& attr) const;

private:
    lxb_html_document_t* document_ = nullptr;
};

}
