/// @file application.cpp
/// @brief Application implementation: init, per-window loop, summary.

#include "core/application.hpp"

#include "astro/time_system.hpp"
#include "column/interval_scheduler.hpp"
#include "core/logger.hpp"
#include "io/oof_reader.hpp"
#include "io/receptor_writer.hpp"
#include "terrain/terrain_loader.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

namespace
{

constexpr int kExitSuccess   = 0;
constexpr int kExitFailure   = 1;
constexpr int kExitCancelled = 130;

} // anonymous namespace

namespace slantcol::core
{

Application::Application(io::RunConfig config, const std::atomic<bool>* cancel)
    : m_config{std::move(config)}
    , m_cancel{cancel}
{
}

Application::Application(io::RunConfig config,
                         std::shared_ptr<const terrain::ElevationSource> terrain,
                         const std::atomic<bool>* cancel)
    : m_config{std::move(config)}
    , m_cancel{cancel}
    , m_terrain{std::move(terrain)}
{
}

int Application::run()
{
    if (!init())
    {
        return kExitFailure;
    }

    const auto windows = m_config.split_daily_ranges();
    SLC_INFO("Processing {} window(s) from {} to {} ({})", windows.size(),
             astro::TimeSystem::format_iso8601(m_config.start),
             astro::TimeSystem::format_iso8601(m_config.end),
             column::column_type(*m_instrument));

    for (const column::RunWindow& window : windows)
    {
        if (cancel_requested())
        {
            m_summary.cancelled = true;
            break;
        }
        run_window(window);
    }

    SLC_INFO("Summary: {} written, {} skipped, {} failed; {} rows ({} valid, {} below ground)",
             m_summary.windows_written, m_summary.windows_skipped, m_summary.windows_failed,
             m_summary.rows, m_summary.valid_rows, m_summary.below_ground_rows);

    if (m_summary.cancelled)
    {
        SLC_WARN("Run cancelled");
        return kExitCancelled;
    }
    return m_summary.windows_failed > 0 ? kExitFailure : kExitSuccess;
}

// =================================================================
// Initialization
// =================================================================

bool Application::init()
{
    // 1. Terrain dataset, unless one was handed in
    if (!m_terrain)
    {
        m_terrain = terrain::TerrainLoader::load(m_config.terrain.path, m_config.terrain.format,
                                                 m_config.terrain.vertical_scale, m_config.terrain.netcdf);
        if (!m_terrain)
        {
            SLC_CRITICAL("Cannot load terrain from {}", m_config.terrain.path.string());
            return false;
        }
    }

    // 2. Instrument mode
    return load_instrument();
}

bool Application::load_instrument()
{
    if (m_config.column_type == io::ColumnType::Ground)
    {
        m_instrument = column::FixedInstrument{.position = m_config.instrument};
        return true;
    }

    auto records = io::OofReader::load_range(m_config.observations.folder,
                                             m_config.start, m_config.end,
                                             m_config.utc_offset,
                                             m_config.observations.filter_flag_zero);
    if (!records)
    {
        SLC_CRITICAL("Cannot read observations from {}", m_config.observations.folder.string());
        return false;
    }

    m_instrument = column::ObservationDerivedInstrument{.records = std::move(*records)};
    return true;
}

// =================================================================
// Per-window processing
// =================================================================

void Application::run_window(const column::RunWindow& window)
{
    const std::string label = fmt::format("{} .. {}",
                                          astro::TimeSystem::format_iso8601(window.start),
                                          astro::TimeSystem::format_iso8601(window.end));

    const column::RunPlan plan = column::resolve_plan(*m_instrument, window, m_config.interval);
    if (!plan.runnable())
    {
        if (plan.condition == Condition::InconsistentInstrumentPosition)
        {
            SLC_ERROR("Window {}: instrument position is not constant, skipping", label);
        }
        else
        {
            SLC_INFO("Window {}: {}, skipping", label, to_string(plan.condition));
        }
        ++m_summary.windows_skipped;
        return;
    }

    const column::IntervalScheduler scheduler(
        m_config.solar,
        column::SchedulerOptions{.workers = m_config.workers, .cancel = m_cancel});

    const auto table = scheduler.run(plan.instrument, plan.start, plan.end, m_config.interval,
                                     m_config.heights, index_for(plan.instrument));
    if (!table)
    {
        SLC_ERROR("Window {}: scheduling failed", label);
        ++m_summary.windows_failed;
        return;
    }

    if (!table->complete())
    {
        m_summary.cancelled = true;
    }

    const io::ReceptorFileHeader header{
        .column_type = std::string(column::column_type(*m_instrument)),
        .instrument  = plan.instrument,
        .created     = astro::TimeSystem::now(),
        .range_start = window.start,
        .range_end   = window.end,
    };

    const auto path = io::ReceptorWriter::write_file(m_config.output_folder, header, *table);
    if (!path)
    {
        ++m_summary.windows_failed;
        return;
    }

    ++m_summary.windows_written;
    m_summary.rows += table->size();
    m_summary.valid_rows += table->valid_count();
    m_summary.below_ground_rows += table->below_ground_count();

    SLC_INFO("Window {}: {} rows, {} valid, {} below ground, {} without sun, {} outside terrain -> {}",
             label, table->size(), table->valid_count(), table->below_ground_count(),
             table->count(Condition::SolarGeometryUndefined), table->count(Condition::CoverageGap),
             path->string());
}

const terrain::ElevationIndex& Application::index_for(const column::InstrumentPosition& position)
{
    if (!m_index || !m_index_center || *m_index_center != position)
    {
        m_index = std::make_unique<terrain::ElevationIndex>(m_terrain, m_config.terrain.bucket_deg);
        m_index->load_subgrid(position.latitude, position.longitude, m_config.terrain.subgrid_radius_m);
        m_index_center = position;
        ++m_summary.index_loads;
    }
    return *m_index;
}

bool Application::cancel_requested() const
{
    return m_cancel != nullptr && m_cancel->load(std::memory_order_relaxed);
}

} // namespace slantcol::core
