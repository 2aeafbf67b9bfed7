/// @file observation_window.cpp
/// @brief Observation window derivation.

#include "column/observation_window.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace slantcol::column
{

ObservationWindow ObservationWindowFilter::derive_window(std::span<const ObservationRecord> records,
                                                         Seconds cadence,
                                                         std::optional<Timestamp> clip_end)
{
    ObservationWindow window{
        .condition    = Condition::NoObservationData,
        .start        = Timestamp{},
        .end          = Timestamp{},
        .instrument   = InstrumentPosition{.latitude = 0.0, .longitude = 0.0, .elevation_asl = 0.0},
        .record_count = records.size(),
    };

    if (records.empty())
    {
        SLC_CORE_INFO("ObservationWindowFilter: No observation records in window");
        return window;
    }

    const ObservationRecord& first = records.front();
    const auto moved = std::find_if(records.begin(), records.end(), [&first](const ObservationRecord& r) {
        return r.latitude != first.latitude
            || r.longitude != first.longitude
            || r.elevation_asl != first.elevation_asl;
    });

    if (moved != records.end())
    {
        SLC_CORE_ERROR("ObservationWindowFilter: Instrument moved from ({:.6f}, {:.6f}, {:.1f} m) "
                       "to ({:.6f}, {:.6f}, {:.1f} m) at {}",
                       first.latitude, first.longitude, first.elevation_asl,
                       moved->latitude, moved->longitude, moved->elevation_asl,
                       astro::TimeSystem::format_iso8601(moved->timestamp));
        window.condition = Condition::InconsistentInstrumentPosition;
        return window;
    }

    const auto [earliest, latest] = std::minmax_element(
        records.begin(), records.end(),
        [](const ObservationRecord& a, const ObservationRecord& b) { return a.timestamp < b.timestamp; });

    Timestamp start = earliest->timestamp;
    Timestamp end = latest->timestamp;
    if (cadence > Seconds{0})
    {
        start = astro::TimeSystem::floor_to(start, cadence);
        end = astro::TimeSystem::ceil_to(end, cadence);
    }
    else
    {
        SLC_CORE_WARN("ObservationWindowFilter: Non-positive cadence, using the raw observation span");
    }

    if (clip_end && end > *clip_end)
    {
        end = *clip_end;
    }

    window.condition = Condition::None;
    window.start = start;
    window.end = end;
    window.instrument = InstrumentPosition{
        .latitude      = first.latitude,
        .longitude     = first.longitude,
        .elevation_asl = first.elevation_asl,
    };

    SLC_CORE_DEBUG("ObservationWindowFilter: {} records -> {} .. {}", records.size(),
                   astro::TimeSystem::format_iso8601(start), astro::TimeSystem::format_iso8601(end));

    return window;
}

} // namespace slantcol::column
