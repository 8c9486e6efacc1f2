#include "engine_factory.hpp"

std::unique_ptr<BaseEngine> make_engine(const Options& opts) {
    auto engine = std::make_unique<StbEngine>();
    if (engine->init(opts)) {
        return engine;
    }
    return nullptr;
}
