// ============================================================================
// Example 02: Edges and Branches
// ============================================================================
//
// A small pipeline wired with edges instead of explicit submissions:
//
//   fetch --> validate --(ok)--> publish
//                      \-(retry)-> validate again (a reusable Handler)
//
// The validator fails its first two attempts, loops back on itself through a
// conditional edge, and finally hands over to `publish`.
//
// RUN:
//   cd build && ./02_edges
//
// ============================================================================

#include "cotree/cotree.hpp"

#include <iostream>
#include <string>

using namespace cotree;

int main() {
    std::cout << "=== cotree Example 02: Edges ===" << std::endl;

    Commander commander;

    auto fetch = Job::Create("fetch", [](Job&, Args) -> Task<NodeResult> {
        std::cout << "  fetch" << std::endl;
        co_return Ok(std::any(std::string("payload")));
    });

    int attempts = 0;
    auto validate = Handler::Create(
        "validate",
        [&attempts](Handler&, Args args) -> Task<NodeResult> {
            ++attempts;
            std::cout << "  validate attempt " << attempts << std::endl;
            co_return Ok(std::any(std::string(attempts < 3 ? "retry" : "ok")));
        },
        {.reusable = true});

    auto publish = Handler::Create("publish", [](Handler&, Args args) -> Task<NodeResult> {
        std::cout << "  publish (validator said " << std::any_cast<std::string>(args.at(0)) << ")" << std::endl;
        co_return Ok();
    });

    EdgeOptions forward;
    forward.forward_result = true;

    (void)AddEdge(*fetch, validate, forward);
    (void)AddConditionalEdge(*validate, {{"ok", publish}, {"retry", validate}}, ResultString, forward);

    (void)commander.Submit(fetch);
    auto outcome = commander.Run();
    if (outcome.IsErr()) {
        std::cout << "Run failed: " << outcome.Error().Message() << std::endl;
        return 1;
    }

    std::cout << "validate ran " << validate->CallCount() << " times; publish is "
              << ToString(publish->Status()) << std::endl;
    return 0;
}
