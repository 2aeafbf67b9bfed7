#pragma once

/// @file observation_window.hpp
/// @brief Aligns a run window to the span of real instrument observations.

#include "column/receptor.hpp"
#include "core/condition.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>

namespace slantcol::column
{
    /// @brief One instrument observation with the position it was taken from.
    struct ObservationRecord
    {
        Timestamp timestamp;
        f64       latitude;
        f64       longitude;
        f64       elevation_asl;
    };

    /// @brief Outcome of ObservationWindowFilter::derive_window().
    ///
    /// start, end and instrument are meaningful only when condition is None.
    struct ObservationWindow
    {
        Condition          condition;  ///< None, NoObservationData or InconsistentInstrumentPosition
        Timestamp          start;
        Timestamp          end;
        InstrumentPosition instrument;
        std::size_t        record_count;

        [[nodiscard]] bool ok() const { return condition == Condition::None; }
    };

    /// @brief Static utility class deriving the effective run window from observations.
    class ObservationWindowFilter
    {
    public:
        ObservationWindowFilter() = delete;

        /// @brief Derive the window and instrument position from observation records.
        ///
        /// The instrument must sit at exactly the same latitude, longitude and
        /// elevation in every record; any difference is reported as
        /// InconsistentInstrumentPosition. The earliest record is floored and
        /// the latest ceiled to `cadence` buckets. A positive cadence is
        /// expected; with a non-positive one the raw record span is used.
        ///
        /// @param clip_end When set, the effective end never exceeds this instant.
        [[nodiscard]] static ObservationWindow derive_window(std::span<const ObservationRecord> records,
                                                             Seconds cadence,
                                                             std::optional<Timestamp> clip_end = std::nullopt);
    };

} // namespace slantcol::column
