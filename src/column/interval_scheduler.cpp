/// @file interval_scheduler.cpp
/// @brief Timestamp expansion and the multi-threaded profile loop.

#include "column/interval_scheduler.hpp"

#include "astro/time_system.hpp"
#include "column/ground_level_resolver.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace
{

constexpr slantcol::u32 kMaxWorkers = 64;

} // anonymous namespace

namespace slantcol::column
{

IntervalScheduler::IntervalScheduler(const geodesy::SolarGeodesyOptions& solar, const SchedulerOptions& options)
    : m_builder{solar}
    , m_options{options}
{
}

// -----------------------------------------------------------------
// Timestamp expansion: last = start + floor((end - start) / cadence) * cadence
// -----------------------------------------------------------------

std::optional<std::vector<Timestamp>> IntervalScheduler::expand_timestamps(Timestamp start,
                                                                           Timestamp end,
                                                                           Seconds cadence)
{
    if (cadence <= Seconds{0})
    {
        SLC_CORE_ERROR("IntervalScheduler: Cadence must be positive (got {} s)", cadence.count());
        return std::nullopt;
    }

    if (end < start)
    {
        SLC_CORE_ERROR("IntervalScheduler: End {} precedes start {}",
                       astro::TimeSystem::format_iso8601(end), astro::TimeSystem::format_iso8601(start));
        return std::nullopt;
    }

    const i64 steps = (end - start) / cadence;

    std::vector<Timestamp> timestamps;
    timestamps.reserve(static_cast<std::size_t>(steps) + 1);
    for (i64 k = 0; k <= steps; ++k)
    {
        timestamps.push_back(start + k * cadence);
    }

    return timestamps;
}

bool IntervalScheduler::validate_heights(std::span<const f64> heights)
{
    if (heights.empty())
    {
        SLC_CORE_ERROR("IntervalScheduler: No heights above instrument requested");
        return false;
    }

    for (const f64 h : heights)
    {
        if (!std::isfinite(h) || h < 0.0)
        {
            SLC_CORE_ERROR("IntervalScheduler: Invalid height above instrument {} m", h);
            return false;
        }
    }

    std::vector<f64> sorted(heights.begin(), heights.end());
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
    {
        SLC_CORE_ERROR("IntervalScheduler: Duplicate heights above instrument");
        return false;
    }

    return true;
}

// -----------------------------------------------------------------
// Run
// -----------------------------------------------------------------

std::optional<ReceptorTable> IntervalScheduler::run(const InstrumentPosition& instrument,
                                                    Timestamp start,
                                                    Timestamp end,
                                                    Seconds cadence,
                                                    std::span<const f64> heights,
                                                    const terrain::ElevationIndex& index) const
{
    if (!validate_heights(heights))
    {
        return std::nullopt;
    }

    auto timestamps = expand_timestamps(start, end, cadence);
    if (!timestamps)
    {
        return std::nullopt;
    }

    std::vector<f64> sorted_heights(heights.begin(), heights.end());
    std::sort(sorted_heights.begin(), sorted_heights.end());

    const std::size_t total = timestamps->size();

    u32 workers = m_options.workers;
    if (workers == 0)
    {
        workers = std::max(std::thread::hardware_concurrency(), 1u);
    }
    workers = std::clamp<u32>(workers, 1, std::min<u32>(kMaxWorkers, static_cast<u32>(total)));

    SLC_CORE_INFO("IntervalScheduler: {} timestamps x {} heights from {} to {} every {} s on {} worker(s)",
                  total, sorted_heights.size(),
                  astro::TimeSystem::format_iso8601(start), astro::TimeSystem::format_iso8601(end),
                  cadence.count(), workers);

    // Arena of per-timestamp slots; each slot is written by exactly one worker
    std::vector<std::optional<SlantProfile>> arena(total);
    std::atomic<std::size_t> next{0};

    auto work = [&]() {
        for (;;)
        {
            if (m_options.cancel != nullptr && m_options.cancel->load(std::memory_order_relaxed))
            {
                return;
            }

            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= total)
            {
                return;
            }

            const SlantProfile profile = m_builder.build_profile(instrument, (*timestamps)[i], sorted_heights);
            arena[i] = GroundLevelResolver::resolve(profile, index);
        }
    };

    if (workers == 1)
    {
        work();
    }
    else
    {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (u32 w = 0; w < workers; ++w)
        {
            threads.emplace_back(work);
        }
        for (std::thread& thread : threads)
        {
            thread.join();
        }
    }

    // Claims are handed out in order, so the filled slots form a prefix
    std::vector<SlantProfile> profiles;
    profiles.reserve(total);
    for (std::optional<SlantProfile>& slot : arena)
    {
        if (!slot)
        {
            break;
        }
        profiles.push_back(std::move(*slot));
    }

    if (profiles.size() < total)
    {
        SLC_CORE_WARN("IntervalScheduler: Cancelled after {} of {} timestamps", profiles.size(), total);
    }

    const std::size_t night = static_cast<std::size_t>(std::count_if(
        profiles.begin(), profiles.end(), [](const SlantProfile& p) { return !p.usable(); }));
    if (night > 0)
    {
        SLC_CORE_DEBUG("IntervalScheduler: {} timestamp(s) without solar geometry", night);
    }

    return ReceptorTable::assemble(std::move(profiles), std::move(sorted_heights), total);
}

} // namespace slantcol::column
