// ============================================================================
// Example 03: Termination
// ============================================================================
//
// A watchdog Job terminates a slow subtree. Terminate() works top-down: every
// unresolved node below fires its Terminate callbacks, sleeping bodies wake
// early through their token, and the Commander still closes normally.
//
// RUN:
//   cd build && ./03_termination
//
// ============================================================================

#include "cotree/cotree.hpp"

#include <chrono>
#include <iostream>
#include <string>

using namespace cotree;
using namespace std::chrono_literals;

Task<NodeResult> Worker(Job& self, Args) {
    co_await AsyncSleep(30s, self.GetToken());
    if (self.GetToken().IsTerminated()) {
        std::cout << "  " << self.Name() << " woke up terminated" << std::endl;
    }
    co_return Ok();
}

int main() {
    std::cout << "=== cotree Example 03: Termination ===" << std::endl;

    Commander commander;

    auto batch = Job::Create("batch", [](Job& self, Args) -> Task<NodeResult> {
        for (int i = 0; i < 3; ++i) {
            auto worker = Job::Create("worker-" + std::to_string(i), Worker);
            (void)worker->AddCallback(Stage::Terminate, [name = worker->Name()](const CallbackContext&) {
                std::cout << "  at_terminate: " << name << std::endl;
            });
            (void)SubmitJob(self, worker);
        }
        co_return Ok();
    });
    (void)batch->AddCallback(Stage::Terminate, [](const CallbackContext&) { std::cout << "  at_terminate: batch" << std::endl; });

    auto watchdog = Job::Create("watchdog", [&batch](Job& self, Args) -> Task<NodeResult> {
        co_await AsyncSleep(50ms, self.GetToken());
        std::cout << "  watchdog fired" << std::endl;
        batch->Terminate();
        co_return Ok();
    });

    (void)commander.Submit(batch);
    (void)commander.Submit(watchdog);

    auto start = std::chrono::steady_clock::now();
    auto outcome = commander.Run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cout << "batch is " << ToString(batch->Status()) << " after " << elapsed.count() << " ms" << std::endl;
    return outcome.IsOk() ? 0 : 1;
}
