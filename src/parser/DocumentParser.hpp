#pragma once
#include "../interfaces/IDocumentParser.hpp"

namespace OwStats {

// lexbor-backed parser. Permissive: malformed markup still yields a tree.
class DocumentParser : public IDocumentParser {
public:
    std::unique_ptr<HtmlDocument> Parse(const std::string& html_content) override;
};

}
