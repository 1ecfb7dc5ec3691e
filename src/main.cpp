#include "app.hpp"
#include "interactive.hpp"
#include "log.hpp"
#include <string>

int main(int argc, char** argv) {
    App app;
    if (argc >= 2 && std::string(argv[1]) == "--interactive") {
        try {
            Config cfg = build_config_interactive();
            return app.run_with_config(std::move(cfg));
        } catch (const std::exception& e) {
            Log::error(std::string("Interactive error: ")+e.what());
            return 1;
        }
    }
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        Log::info("usage: schedmgr [config.ini] | --interactive");
        return 0;
    }
    return app.run(argc, argv);
}
