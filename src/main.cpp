#include "errors.hpp"
#include "mcp_client.hpp"
#include "models.hpp"
#include "pagination.hpp"
#include "rpc_client.hpp"
#include "util.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

struct Config {
    std::string endpoint     = "http://localhost:3001/mcp";
    std::string collection   = "all";
    std::size_t maxPages     = mcp_pager::kDefaultMaxPages;
    int         limit        = 0;        // > 0: stream lazily and stop early
    int         timeoutMs    = 5000;
    bool        omitCharset  = false;
    bool        initialize   = true;
    bool        verbose      = false;
};

static void printUsage() {
    std::cout
        << "Usage: mcp_pager [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL      MCP endpoint            "
           "(default: http://localhost:3001/mcp)\n"
        << "  --collection NAME   tools | prompts | resources | templates | all\n"
        << "                                              (default: all)\n"
        << "  --max-pages N       Page limit per listing  (default: 10000)\n"
        << "  --limit N           Stream lazily, stop after N items per listing\n"
        << "  --timeout-ms N      HTTP timeout in ms      (default: 5000)\n"
        << "  --omit-charset      Send Content-Type without charset parameter\n"
        << "  --no-init           Skip the initialize handshake\n"
        << "  --verbose           Enable verbose diagnostics\n"
        << "  --help, -h          Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--endpoint") && i + 1 < argc) {
            cfg.endpoint = argv[++i];
        } else if ((arg == "--collection") && i + 1 < argc) {
            cfg.collection = argv[++i];
        } else if ((arg == "--max-pages") && i + 1 < argc) {
            try {
                cfg.maxPages = mcp_pager::parsePositiveCount(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "--max-pages: " << e.what() << "\n\n";
                printUsage();
                std::exit(1);
            }
        } else if ((arg == "--limit") && i + 1 < argc) {
            cfg.limit = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--omit-charset") {
            cfg.omitCharset = true;
        } else if (arg == "--no-init") {
            cfg.initialize = false;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.collection != "tools" && cfg.collection != "prompts" &&
        cfg.collection != "resources" && cfg.collection != "templates" &&
        cfg.collection != "all") {
        std::cerr << "Unknown collection: " << cfg.collection << "\n\n";
        printUsage();
        std::exit(1);
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// Row printers
// ---------------------------------------------------------------------------

static void printRow(std::size_t index, const mcp_pager::Tool& t) {
    std::cout << std::setw(4) << index << "  " << std::left
              << std::setw(32) << t.name << "  " << t.description
              << std::right << "\n";
}

static void printRow(std::size_t index, const mcp_pager::Prompt& p) {
    std::cout << std::setw(4) << index << "  " << std::left
              << std::setw(32) << p.name << "  " << std::setw(3)
              << p.arguments.size() << " args  " << p.description
              << std::right << "\n";
}

static void printRow(std::size_t index, const mcp_pager::Resource& r) {
    std::cout << std::setw(4) << index << "  " << std::left
              << std::setw(48) << r.uri << "  " << std::setw(24)
              << r.mimeType << "  " << r.name << std::right << "\n";
}

static void printRow(std::size_t index, const mcp_pager::ResourceTemplate& r) {
    std::cout << std::setw(4) << index << "  " << std::left
              << std::setw(48) << r.uriTemplate << "  " << r.name
              << std::right << "\n";
}

template <typename T>
static void printAll(const std::string& heading, const std::vector<T>& items) {
    std::cout << "\n--- " << heading << " (" << items.size() << ") ---\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
        printRow(i + 1, items[i]);
    }
}

/// Print up to @p limit items, leaving the remaining pages unfetched.
template <typename T>
static void printFirst(const std::string& heading,
                       mcp_pager::PageEnumerator<T> items,
                       int limit) {
    std::cout << "\n--- " << heading << " (first " << limit << ") ---\n";
    std::size_t count = 0;
    while (count < static_cast<std::size_t>(limit)) {
        auto item = items.next();
        if (!item) break;
        printRow(++count, *item);
    }
    std::cout << "(" << items.pagesFetched() << " pages fetched)\n";
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        std::cout
            << "=== mcp_pager ===\n"
            << "Endpoint:    " << cfg.endpoint   << "\n"
            << "Collection:  " << cfg.collection << "\n"
            << "Max pages:   " << cfg.maxPages   << "\n"
            << "Timeout:     " << cfg.timeoutMs  << " ms\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "=================\n";

        mcp_pager::RpcClient rpc(cfg.endpoint, cfg.timeoutMs, cfg.omitCharset);
        rpc.setVerbose(cfg.verbose);

        mcp_pager::PaginatorOptions options;
        options.maxPages = cfg.maxPages;
        options.verbose  = cfg.verbose;
        mcp_pager::McpClient client(rpc, options, cfg.verbose);

        if (cfg.initialize) {
            const auto info = client.initialize();
            std::cout << "Server:      " << info.name << " " << info.version
                      << " (protocol " << info.protocolVersion << ")\n";
        }

        const bool all = cfg.collection == "all";
        if (cfg.limit > 0) {
            if (all || cfg.collection == "tools")
                printFirst("Tools", client.enumerateTools(), cfg.limit);
            if (all || cfg.collection == "prompts")
                printFirst("Prompts", client.enumeratePrompts(), cfg.limit);
            if (all || cfg.collection == "resources")
                printFirst("Resources", client.enumerateResources(), cfg.limit);
            if (all || cfg.collection == "templates")
                printFirst("Resource templates",
                           client.enumerateResourceTemplates(), cfg.limit);
        } else {
            if (all || cfg.collection == "tools")
                printAll("Tools", client.listTools());
            if (all || cfg.collection == "prompts")
                printAll("Prompts", client.listPrompts());
            if (all || cfg.collection == "resources")
                printAll("Resources", client.listResources());
            if (all || cfg.collection == "templates")
                printAll("Resource templates", client.listResourceTemplates());
        }

        const auto stats = client.getStats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Total requests:      " << stats.totalRequests << "\n"
            << "Total retries:       " << stats.totalRetries  << "\n"
            << "Total pages:         " << stats.totalPages    << "\n"
            << "Total items:         " << stats.totalItems    << "\n"
            << "======================\n";

        return 0;

    } catch (const mcp_pager::ProtocolError& e) {
        std::cerr << "Server broke the pagination contract: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
