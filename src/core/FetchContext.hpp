#pragma once
#include "../../config/Config.hpp"
#include "../interfaces/IPageCache.hpp"
#include "../interfaces/IHTTPTransport.hpp"
#include "../interfaces/IDocumentParser.hpp"
#include "../utils/ThreadPool.hpp"

namespace OwStats {

// Everything a resolve call touches. The caller owns all members and must keep
// them alive for as long as any component built on this context is in use.
struct FetchContext {
    const Config& config;
    IPageCache& cache;
    IHTTPTransport& transport;
    IDocumentParser& parser;
    ThreadPool& pool;
};

}
