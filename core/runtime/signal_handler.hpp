#pragma once

#include <atomic>

namespace lcdlink {
namespace runtime {

// SIGINT/SIGTERM set a flag the runtime loop polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Tests and embedding hosts can raise the flag without a signal
    static void request_shutdown();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace lcdlink
