#include "DocumentLoader.hpp"
#include "../utils/Logger.hpp"

namespace OwStats {

DocumentLoader::DocumentLoader(FetchContext& ctx) : ctx_(ctx), fetcher_(ctx) {}

std::unique_ptr<HtmlDocument> DocumentLoader::Load(const std::string& url, std::chrono::seconds ttl) {
    auto body = fetcher_.Fetch(url, ttl);
    if (!body) {
        return nullptr;
    }

    Logger::Log(LogLevel::Debug, "Enqueuing parsing to thread pool for URL: " + url);
    IDocumentParser& parser = ctx_.parser;
    auto parsed = ctx_.pool.enqueue([&parser, content = std::move(*body)]() {
        return parser.Parse(content);
    });
    return parsed.get();
}

}
