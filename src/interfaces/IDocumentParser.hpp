#pragma once
#include <string>
#include <memory>
#include "../parser/HtmlDocument.hpp"

namespace OwStats {

class IDocumentParser {
public:
    virtual ~IDocumentParser() = default;
    virtual std::unique_ptr<HtmlDocument> Parse(const std::string& html_content) = 0;
};

}
