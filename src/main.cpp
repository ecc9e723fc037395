// ranger_mcp_server: MCP server that answers "Ranger！" to every tool call.

#include "ranger/ranger.hpp"

#include <pthread.h>
#include <signal.h>

#include <iostream>
#include <thread>

using namespace ranger;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "ranger_mcp_server";

    ServerConfig config;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    if (auto exit_code = load_config(args, program, std::cout, std::cerr, config)) {
        return *exit_code;
    }

    // Interrupts are taken synchronously by the watcher thread below; every
    // thread started after this point inherits the mask.
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);  // internal: release the watcher
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ServerApp app(config, std::cerr);

    std::thread watcher([&signals, &app]() {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0 || sig == SIGUSR1) return;
        app.interrupt();
    });

    const int exit_code = app.run();

    if (!app.interrupted()) pthread_kill(watcher.native_handle(), SIGUSR1);
    watcher.join();
    return exit_code;
}
