/**
 * @file main.cpp
 * @brief CotLink demo feed
 *
 * Runs a scripted two-player skirmish and streams it as CoT. Player 1 is
 * the local viewpoint; player 2's units appear only while detected, with
 * generic hostile symbology.
 */

#include "cotlink/cotlink.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <map>
#include <thread>

using namespace cotlink;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down...\n";
    g_running = false;
}

// ============================================================================
// Scripted World
// ============================================================================

constexpr PlayerId BLUE = 1;
constexpr PlayerId RED = 2;

struct Unit {
    EntityId id;
    PlayerId owner;
    std::string callsign;
    std::string cot_type;
    std::string milsym_id;
    routing::CotDomain domain;
    Real x, y, height;
    Real speed;       // cells per tick
    Real course_deg;  // grid course
    bool cloaked{false};
    std::optional<Real> depth;
};

class ScriptedWorld : public routing::IWorldView, public cot::IEntitySource {
public:
    ScriptedWorld() {
        players_ = {routing::PlayerInfo{BLUE}, routing::PlayerInfo{RED}};

        add({1, BLUE, "BLUE-ARMOR-1", "a-f-G-U-C-A", "SFGPUCA----K---", routing::CotDomain::GroundMobile,
             1000, 1000, 0, 0.5, 90});
        add({2, BLUE, "BLUE-HAWK", "a-f-A-M-H", "SFAPMH---------", routing::CotDomain::Aircraft,
             990, 1010, 300, 3.0, 45});
        add({10, RED, "RED-ARMOR-1", "a-h-G-U-C-A", "SHGPUCA----K---", routing::CotDomain::GroundMobile,
             1100, 1000, 0, 0.5, 270});
        add({11, RED, "RED-HQ", "a-h-G-I-B", "SHGPIB---------", routing::CotDomain::Building,
             1200, 950, 0, 0.0, 0});
        add({12, RED, "RED-SUB", "a-h-U-S", "SHUPS----------", routing::CotDomain::Vessel,
             1050, 1100, 0, 0.2, 0, true, 40.0});
    }

    const std::map<EntityId, Unit>& units() const { return units_; }

    void step(UInt64 tick) {
        tick_ = tick;
        for (auto& [id, unit] : units_) {
            Real rad = unit.course_deg * constants::DEG_TO_RAD;
            unit.x += unit.speed * std::sin(rad);
            unit.y -= unit.speed * std::cos(rad);
        }
    }

    void destroy(EntityId id) { units_.erase(id); }

    // IWorldView
    std::optional<PlayerId> owner_of(EntityId entity) const override {
        auto it = units_.find(entity);
        if (it == units_.end()) return std::nullopt;
        return it->second.owner;
    }

    bool is_allied(PlayerId a, PlayerId b) const override { return a == b; }

    bool can_be_viewed_by(EntityId entity, PlayerId viewer) const override {
        auto target = units_.find(entity);
        if (target == units_.end()) return false;
        for (const auto& [id, unit] : units_) {
            if (unit.owner != viewer) continue;
            Real dx = unit.x - target->second.x;
            Real dy = unit.y - target->second.y;
            if (dx * dx + dy * dy <= SIGHT_RANGE_CELLS * SIGHT_RANGE_CELLS) {
                return true;
            }
        }
        return false;
    }

    const std::vector<routing::PlayerInfo>& players() const override { return players_; }

    bool is_cloaked(EntityId entity) const override {
        auto it = units_.find(entity);
        return it != units_.end() && it->second.cloaked;
    }

    // The submarine fires a salvo every 40 ticks
    bool is_aiming(EntityId entity) const override {
        return is_cloaked(entity) && (tick_ % 40) < 5;
    }

    std::optional<PlayerId> local_player() const override { return BLUE; }

    // IEntitySource
    std::optional<cot::EntitySnapshot> snapshot(EntityId entity) const override {
        auto it = units_.find(entity);
        if (it == units_.end()) return std::nullopt;

        const auto& u = it->second;
        cot::EntitySnapshot s;
        s.id = u.id;
        s.callsign = u.callsign;
        s.cot_type = u.cot_type;
        s.milsym_id = u.milsym_id;
        s.domain = u.domain;
        s.cell_x = u.x;
        s.cell_y = u.y;
        s.height_m = u.height;
        s.speed_mps = u.speed * CELL_SIZE_M * TICK_RATE_HZ;
        s.grid_course_deg = u.course_deg;
        s.depth_m = u.depth;
        return s;
    }

    static constexpr Real SIGHT_RANGE_CELLS = 60.0;
    static constexpr Real CELL_SIZE_M = 4.0;
    static constexpr Real TICK_RATE_HZ = 10.0;

private:
    void add(Unit unit) { units_.emplace(unit.id, unit); }

    std::map<EntityId, Unit> units_;
    std::vector<routing::PlayerInfo> players_;
    UInt64 tick_{0};
};

void print_usage(const char* program) {
    std::cout << "CotLink demo feed\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --host <host>        Default destination host (default: 127.0.0.1)\n"
              << "  --port <port>        Default destination port (default: 4242)\n"
              << "  --mode <mode>        Force localhost | unicast | multicast\n"
              << "  --ttl <n>            Multicast TTL (default: 1)\n"
              << "  --interface <name>   Multicast interface name or address\n"
              << "  --remember           Persist the forced configuration\n"
              << "  --router <file>      Router configuration XML\n"
              << "  --georef <file>      Georeference XML\n"
              << "  --ticks <n>          Ticks to run, 0 = until interrupted (default: 600)\n"
              << "  --log-level <level>  trace | debug | info | warn | error (default: info)\n"
              << "  --help               Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    UInt16 port = network::DEFAULT_UNICAST_PORT;
    std::optional<network::DeliveryMode> mode;
    UInt8 ttl = network::DEFAULT_MULTICAST_TTL;
    std::string interface_name;
    bool remember = false;
    std::string router_path;
    std::string georef_path;
    UInt64 ticks = 600;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                port = static_cast<UInt16>(std::stoi(argv[++i]));
            } else if (arg == "--mode" && i + 1 < argc) {
                mode = network::parse_delivery_mode(argv[++i]);
                if (!mode) {
                    std::cerr << "Unknown mode: " << argv[i] << "\n";
                    return 1;
                }
            } else if (arg == "--ttl" && i + 1 < argc) {
                ttl = static_cast<UInt8>(std::stoi(argv[++i]));
            } else if (arg == "--interface" && i + 1 < argc) {
                interface_name = argv[++i];
            } else if (arg == "--remember") {
                remember = true;
            } else if (arg == "--router" && i + 1 < argc) {
                router_path = argv[++i];
            } else if (arg == "--georef" && i + 1 < argc) {
                georef_path = argv[++i];
            } else if (arg == "--ticks" && i + 1 < argc) {
                ticks = std::stoull(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                cotlink::log::set_level(cotlink::log::level_from_string(argv[++i]));
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ScriptedWorld world;

    ContextOptions options;
    options.config_store = std::make_shared<network::JsonFileConfigStore>(
        network::JsonFileConfigStore::default_path());

    std::shared_ptr<const geo::Georeference> georeference;
    try {
        if (!router_path.empty()) {
            options.router = routing::VisibilityRouterConfig::load(router_path);
        }
        if (!georef_path.empty()) {
            georeference = std::make_shared<geo::Georeference>(geo::Georeference::load(georef_path));
        } else {
            geo::GeoreferenceConfig geo_config;
            geo_config.origin_lat_deg = 34.2367;
            geo_config.origin_lon_deg = -116.0560;
            geo_config.origin_alt_m = 600.0;
            geo_config.meters_per_cell = ScriptedWorld::CELL_SIZE_M;
            geo_config.origin_cell_x = 1024;
            geo_config.origin_cell_y = 1024;
            georeference = std::make_shared<geo::Georeference>(geo_config);
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    Context context(world, std::move(options));

    network::ConfigResult result;
    if (mode) {
        network::DeliveryConfig config;
        config.mode = *mode;
        config.host = host;
        config.port = port;
        if (*mode == network::DeliveryMode::Multicast) {
            config.multicast_ttl = ttl;
        }
        if (!interface_name.empty()) {
            config.bind_interface = interface_name;
        }
        result = context.output().configure_and_start(config, remember);
    } else {
        result = context.output().ensure_initialized_from(host, port);
    }

    if (result == network::ConfigResult::PersistFailed) {
        std::cerr << "Warning: output configuration could not be saved\n";
    } else if (result != network::ConfigResult::Success) {
        std::cerr << "Failed to start CoT output: " << network::config_result_to_string(result) << "\n";
        return 1;
    }

    std::cout << "CotLink " << GetVersionString() << " streaming to "
              << context.output().current_config()->to_string() << "\n";

    cot::EmitterConfig emitter_config;
    emitter_config.emit_interval_ticks = 5;
    emitter_config.default_host = host;
    emitter_config.default_port = port;
    auto emitter = context.make_emitter(emitter_config, world, georeference);

    for (const auto& [id, unit] : world.units()) {
        emitter->on_spawn(id);
    }

    auto tick_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / ScriptedWorld::TICK_RATE_HZ));
    auto next_tick = std::chrono::steady_clock::now();

    for (UInt64 tick = 1; g_running && (ticks == 0 || tick <= ticks); ++tick) {
        world.step(tick);

        // Scripted engagement: the armor trade hits, the red tank dies at tick 300
        if (tick % 50 == 0 && world.units().count(10) != 0) {
            emitter->on_health_changed(10, 1.0 - static_cast<Real>(tick) / 300.0);
        }
        if (tick == 300 && world.units().count(10) != 0) {
            emitter->on_destroyed(10);
            world.destroy(10);
        }

        emitter->on_tick(std::chrono::system_clock::now());

        next_tick += tick_period;
        std::this_thread::sleep_until(next_tick);
    }

    const auto& s = emitter->stats();
    auto out = context.output().stats();
    std::cout << "Emitted " << s.emitted << ", suppressed " << s.suppressed
              << ", sent " << out.sent << ", dropped " << out.dropped_overflow << "\n";

    return 0;
}
