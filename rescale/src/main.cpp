#include "engine_factory.hpp"
#include "errors.hpp"
#include "modes/file_mode.hpp"
#include "options.hpp"
#include "utils/logger.hpp"

#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    Options opts;
    try {
        if (!parse_options(argc, argv, opts)) {
            return 0;
        }
    } catch (const rescale::Error& e) {
        logger::error(e.what());
        return 1;
    }

    logger::set_level(opts.debug ? logger::Level::Info : logger::Level::Warn);
    logger::info("Parsed arguments: " + describe_options(opts));

    auto engine = make_engine(opts);
    if (!engine) {
        logger::error("Failed to initialize engine");
        return 1;
    }

    const int exit_code = run_file_mode(engine.get(), opts, std::cerr);

    engine->cleanup();
    return exit_code;
}
