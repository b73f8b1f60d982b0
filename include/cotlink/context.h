#pragma once
/**
 * @file context.h
 * @brief Process-scoped CotLink services
 *
 * A Context is created once at process start and destroyed at process end.
 * It owns the output service and the visibility router and hands out
 * emitters wired to both.
 */

#include "cotlink/cot/cot_emitter.h"
#include "cotlink/geo/georeference.h"
#include "cotlink/network/config_store.h"
#include "cotlink/network/output_service.h"
#include "cotlink/routing/visibility_router.h"
#include "cotlink/routing/world_view.h"
#include <memory>

namespace cotlink {

struct ContextOptions {
    routing::VisibilityRouterConfig router{routing::VisibilityRouterConfig::defaults()};

    /// Remembered-configuration storage; nullptr disables persistence
    std::shared_ptr<network::IConfigStore> config_store;

    network::TransportFactory transport_factory{network::create_transport};
    network::BroadcasterOptions broadcaster;
};

class Context {
public:
    /**
     * @param world Simulation view; must outlive the context
     */
    explicit Context(const routing::IWorldView& world, ContextOptions options = {});

    /// Stops output
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    network::OutputService& output() noexcept { return *output_; }
    const routing::VisibilityRouter& router() const noexcept { return router_; }

    /**
     * @brief Create an emitter bound to this context's router and output
     */
    std::unique_ptr<cot::CotEmitter> make_emitter(const cot::EmitterConfig& config,
                                                  const cot::IEntitySource& source,
                                                  std::shared_ptr<const geo::Georeference> georeference);

private:
    routing::VisibilityRouter router_;
    std::unique_ptr<network::OutputService> output_;
};

} // namespace cotlink
