/**
 * @file cot_event.cpp
 * @brief CoT event serialization
 */

#include "cotlink/cot/cot_event.h"
#include <pugixml.hpp>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace cotlink::cot {

namespace {

std::string fixed(Real value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

void set_fixed(pugi::xml_node node, const char* name, Real value, int decimals) {
    node.append_attribute(name).set_value(fixed(value, decimals).c_str());
}

} // anonymous namespace

std::string format_cot_time(TimePoint time) {
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    return buffer;
}

std::string CotEvent::to_xml() const {
    pugi::xml_document doc;

    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version").set_value("1.0");
    decl.append_attribute("encoding").set_value("UTF-8");

    auto event = doc.append_child("event");
    event.append_attribute("version").set_value("2.0");
    event.append_attribute("uid").set_value(uid.c_str());
    event.append_attribute("type").set_value(type.c_str());
    event.append_attribute("how").set_value(how.c_str());
    event.append_attribute("time").set_value(format_cot_time(time).c_str());
    event.append_attribute("start").set_value(format_cot_time(start).c_str());
    event.append_attribute("stale").set_value(format_cot_time(stale).c_str());

    auto pt = event.append_child("point");
    set_fixed(pt, "lat", point.lat_deg, 7);
    set_fixed(pt, "lon", point.lon_deg, 7);
    set_fixed(pt, "hae", point.hae_m, 2);
    set_fixed(pt, "ce", point.ce_m, 1);
    set_fixed(pt, "le", point.le_m, 1);

    auto detail = event.append_child("detail");
    detail.append_child("contact").append_attribute("callsign").set_value(callsign.c_str());

    if (!milsym_id.empty()) {
        detail.append_child("__milsym").append_attribute("id").set_value(milsym_id.c_str());
    }

    if (speed_mps || course_deg) {
        auto track = detail.append_child("track");
        set_fixed(track, "speed", speed_mps.value_or(0.0), 2);
        set_fixed(track, "course", course_deg.value_or(0.0), 2);
    }

    if (depth_m) {
        set_fixed(detail.append_child("__depth"), "meters", *depth_m, 2);
    }

    if (health) {
        set_fixed(detail.append_child("status"), "health", *health, 2);
    }

    std::ostringstream oss;
    doc.save(oss, "", pugi::format_raw, pugi::encoding_utf8);
    return oss.str();
}

std::vector<UInt8> CotEvent::to_bytes() const {
    auto xml = to_xml();
    return std::vector<UInt8>(xml.begin(), xml.end());
}

} // namespace cotlink::cot
