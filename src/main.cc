#include "minuniq/config.hh"
#include "minuniq/game/match.hh"
#include "minuniq/logger.hh"
#include "minuniq/sandbox/launcher.hh"
#include "minuniq/script/execute_mode.hh"
#include "minuniq/script/registry.hh"

#include <cstdlib>
#include <exception>

int main(int argc, char** argv) {
    if (std::getenv(minuniq::sandbox::EXECUTE_MODE_ENV)) {
        return minuniq::script::execute_mode_main(
            argc, argv, minuniq::script::Registry::with_builtin_suites()
        );
    }
    if (argc != 2) {
        errlog("usage: ", argc > 0 ? argv[0] : "minuniq", " <path/to/config.yaml>");
        return 1;
    }
    try {
        stdlog("loading config");
        auto config = minuniq::load_config(argv[1]);
        stdlog("Spawning clients");
        auto strategy = minuniq::sandbox::strategy_for(config.image);
        minuniq::game::Match match{minuniq::game::launch_clients(strategy, config.programs)};
        match.wait_ready();
        match.play_rounds(config.rounds);
        match.finish();
    } catch (const std::exception& e) {
        errlog("error: ", e.what());
        return 1;
    }
    return 0;
}
