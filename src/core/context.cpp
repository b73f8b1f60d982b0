/**
 * @file context.cpp
 * @brief Context implementation
 */

#include "cotlink/context.h"

namespace cotlink {

Context::Context(const routing::IWorldView& world, ContextOptions options)
    : router_(std::move(options.router), world)
    , output_(std::make_unique<network::OutputService>(std::move(options.config_store),
                                                       std::move(options.transport_factory),
                                                       options.broadcaster)) {
    log::get()->debug("CotLink context created");
}

Context::~Context() {
    output_->shutdown();
}

std::unique_ptr<cot::CotEmitter> Context::make_emitter(const cot::EmitterConfig& config,
                                                       const cot::IEntitySource& source,
                                                       std::shared_ptr<const geo::Georeference> georeference) {
    return std::make_unique<cot::CotEmitter>(config, router_, source, *output_, std::move(georeference));
}

} // namespace cotlink
