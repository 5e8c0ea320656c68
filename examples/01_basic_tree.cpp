// ============================================================================
// Example 01: A Basic Task Tree
// ============================================================================
//
// A root Job fans out into child Jobs, one of which grows its own subtree.
// The root only completes once every descendant has resolved, and the
// Commander fires its end callback once everything is done.
//
// RUN:
//   cd build && ./01_basic_tree
//   COTREE_LOG_LEVEL=debug ./01_basic_tree   # trace every transition
//
// ============================================================================

#include "cotree/cotree.hpp"

#include <chrono>
#include <iostream>
#include <string>

using namespace cotree;
using namespace std::chrono_literals;

// Pretends to download a page, then returns its size.
Task<NodeResult> Download(Job& self, Args args) {
    auto url = std::any_cast<std::string>(args.at(0));
    co_await AsyncSleep(std::chrono::milliseconds(10 * url.size()), self.GetToken());
    std::cout << "  downloaded " << url << std::endl;
    co_return Ok(std::any(static_cast<int>(url.size() * 100)));
}

// Downloads a page and the two assets it links to.
Task<NodeResult> DownloadWithAssets(Job& self, Args args) {
    auto url = std::any_cast<std::string>(args.at(0));
    for (const char* asset : {"/style.css", "/app.js"}) {
        auto child = SubmitJob(self, "asset", Download, {std::any(url + asset)});
        if (child.IsErr()) {
            co_return Err(MakeFault(child.Error(), url));
        }
    }
    co_return co_await Download(self, std::move(args));
}

Task<NodeResult> Crawl(Job& self, Args) {
    std::cout << "  crawl started" << std::endl;
    (void)SubmitJob(self, "page", Download, {std::any(std::string("example.org/about"))});
    (void)SubmitJob(self, "page", DownloadWithAssets, {std::any(std::string("example.org"))});
    std::cout << "  crawl body returned; waiting for the subtree" << std::endl;
    co_return Ok(std::any(std::string("crawl done")));
}

int main() {
    std::cout << "=== cotree Example 01: Basic Tree ===" << std::endl;

    Commander commander;
    (void)commander.AddCallback(Stage::CommanderEnd,
                                [](const CallbackContext&) { std::cout << "  commander closed" << std::endl; });

    auto crawl = Job::Create("crawl", Crawl);
    (void)crawl->AddCallback(Stage::JobEnd, [&crawl](const CallbackContext&) {
        std::cout << "  " << *crawl->ResultAs<std::string>() << " (" << crawl->Children().size() << " children)"
                  << std::endl;
    });
    (void)commander.Submit(crawl);

    auto outcome = commander.Run();
    if (outcome.IsErr()) {
        std::cout << "Run failed: " << outcome.Error().Message() << std::endl;
        return 1;
    }
    std::cout << "Final status: " << ToString(crawl->Status()) << std::endl;
    return 0;
}
