#pragma once

/// @file interval_scheduler.hpp
/// @brief Drives profile construction across a timestamp sequence.

#include "column/receptor.hpp"
#include "column/slant_column_builder.hpp"
#include "core/types.hpp"
#include "geodesy/solar_geodesy.hpp"
#include "terrain/elevation_index.hpp"

#include <atomic>
#include <optional>
#include <span>
#include <vector>

namespace slantcol::column
{
    /// @brief Execution settings for IntervalScheduler::run().
    struct SchedulerOptions
    {
        u32 workers{1};                             ///< Worker threads; 0 picks the hardware count
        const std::atomic<bool>* cancel{nullptr};   ///< Set to request a stop between timestamps
    };

    /// @brief Expands [start, end] at a fixed cadence and builds one resolved profile per timestamp.
    ///
    /// Timestamps are start + k * cadence for every k with the result <= end,
    /// so both ends are included when the span divides evenly.
    ///
    /// Work is claimed in timestamp order from a shared counter. On
    /// cancellation every worker finishes the timestamp it holds and stops,
    /// so the produced table is always a gap-free prefix of the full run.
    class IntervalScheduler
    {
    public:
        explicit IntervalScheduler(const geodesy::SolarGeodesyOptions& solar = {},
                                   const SchedulerOptions& options = {});

        /// @brief Run the full pipeline.
        /// @return std::nullopt on a configuration contradiction (logged).
        [[nodiscard]] std::optional<ReceptorTable> run(const InstrumentPosition& instrument,
                                                       Timestamp start,
                                                       Timestamp end,
                                                       Seconds cadence,
                                                       std::span<const f64> heights,
                                                       const terrain::ElevationIndex& index) const;

        /// @brief Ascending timestamp sequence for [start, end] at `cadence`.
        /// @return std::nullopt when cadence <= 0 or end < start.
        [[nodiscard]] static std::optional<std::vector<Timestamp>> expand_timestamps(Timestamp start,
                                                                                     Timestamp end,
                                                                                     Seconds cadence);

        /// @brief Heights must be non-empty, non-negative, finite and distinct.
        [[nodiscard]] static bool validate_heights(std::span<const f64> heights);

        [[nodiscard]] const SlantColumnBuilder& builder() const { return m_builder; }

    private:
        SlantColumnBuilder m_builder;
        SchedulerOptions   m_options;
    };

} // namespace slantcol::column
