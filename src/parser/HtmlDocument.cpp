#include "HtmlDocument.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <stdexcept>

namespace {

// Helper to convert lxb_char_t* to std::string
std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string text_content(lxb_dom_element_t* element) {
    lxb_dom_node_t* node = lxb_dom_interface_node(element);
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    std::string out = to_std_string(text, len);
    if (text) {
        lxb_dom_document_destroy_text(node->owner_document, text);
    }
    return out;
}

// Owns a lexbor collection for the duration of a query.
class Collection {
public:
    explicit Collection(lxb_dom_document_t* doc) : col_(lxb_dom_collection_make(doc, 32)) {
        if (!col_) throw std::runtime_error("Failed to allocate lexbor collection");
    }
    ~Collection() { lxb_dom_collection_destroy(col_, true); }
    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    lxb_dom_collection_t* get() const { return col_; }
    size_t size() const { return lxb_dom_collection_length(col_); }
    lxb_dom_element_t* at(size_t i) const { return lxb_dom_collection_element(col_, i); }

private:
    lxb_dom_collection_t* col_;
};

} // anonymous namespace

namespace OwStats {

HtmlDocument::HtmlDocument(lxb_html_document_t* document) : document_(document) {
    if (!document_) {
        throw std::invalid_argument("HtmlDocument requires a parsed lexbor document");
    }
}

HtmlDocument::~HtmlDocument() {
    lxb_html_document_destroy(document_);
}

std::string HtmlDocument::Title() const {
    size_t len = 0;
    const lxb_char_t* t = lxb_html_document_title(document_, &len);
    return to_std_string(t, len);
}

std::vector<std::string> HtmlDocument::TextByTagName(const std::string& tag) const {
    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document_);
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
    std::vector<std::string> out;
    if (!root) return out;

    Collection col(dom_doc);
    lxb_status_t status = lxb_dom_elements_by_tag_name(root, col.get(),
        reinterpret_cast<const lxb_char_t*>(tag.data()), tag.size());
    if (status != LXB_STATUS_OK) return out;

    out.reserve(col.size());
    for (size_t i = 0; i < col.size(); ++i) {
        if (auto* el = col.at(i)) out.push_back(text_content(el));
    }
    return out;
}

std::vector<std::string> HtmlDocument::TextByClassName(const std::string& class_name) const {
    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document_);
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
    std::vector<std::string> out;
    if (!root) return out;

    Collection col(dom_doc);
    lxb_status_t status = lxb_dom_elements_by_class_name(root, col.get(),
        reinterpret_cast<const lxb_char_t*>(class_name.data()), class_name.size());
    if (status != LXB_STATUS_OK) return out;

    out.reserve(col.size());
    for (size_t i = 0; i < col.size(); ++i) {
        if (auto* el = col.at(i)) out.push_back(text_content(el));
    }
    return out;
}

std::vector<std::string> HtmlDocument::AttributeValues(const std::string& tag, const std::string& attr) const {
    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document_);
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
    std::vector<std::string> out;
    if (!root) return out;

    Collection col(dom_doc);
    lxb_status_t status = lxb_dom_elements_by_tag_name(root, col.get(),
        reinterpret_cast<const lxb_char_t*>(tag.data()), tag.size());
    if (status != LXB_STATUS_OK) return out;

    const auto* key = reinterpret_cast<const lxb_char_t*>(attr.data());
    for (size_t i = 0; i < col.size(); ++i) {
        lxb_dom_element_t* el = col.at(i);
        if (!el || !lxb_dom_element_has_attribute(el, key, attr.size())) continue;
        size_t len = 0;
        const lxb_char_t* value = lxb_dom_element_get_attribute(el, key, attr.size(), &len);
        out.push_back(to_std_string(value, len));
    }
    return out;
}

}
