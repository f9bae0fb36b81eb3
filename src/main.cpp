#include <iostream>
#include <memory>

#include "process/PosixProcess.hpp"
#include "runtime/Config.hpp"
#include "runtime/Context.hpp"
#include "runtime/Errors.hpp"
#include "runtime/Orchestrator.hpp"

using namespace onionsite;

int main(int argc, char** argv) {
    // .env before anything reads the environment. Existing variables win.
    load_dotenv(".env");
    load_dotenv("../.env");

    try {
        Context ctx(load_config(argc, argv));
        if (ctx.config.show_help) {
            std::cout << usage();
            return 0;
        }

        std::cout << "[SITE] Helper: " << ctx.config.helper_command().to_string() << "\n";
        std::cout << "[SITE] Ports: onion=127.0.0.1:" << ctx.config.onion_port
                  << " public=0.0.0.0:" << ctx.config.public_port << "\n";

        PosixProcessLauncher launcher;
        Orchestrator orchestrator(ctx, launcher, std::make_shared<PosixCommandRunner>());
        orchestrator.run();
        return 0;
    } catch (const StartupError& e) {
        std::cerr << "[FATAL] Startup error: " << e.what() << "\n";
    } catch (const RuntimeError& e) {
        std::cerr << "[FATAL] Runtime error: " << e.what() << "\n";
    }
    return 1;
}
