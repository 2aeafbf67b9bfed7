#pragma once

/// @file instrument_source.hpp
/// @brief Fixed and observation-derived instrument modes behind one variant.

#include "column/observation_window.hpp"
#include "column/receptor.hpp"
#include "core/condition.hpp"
#include "core/types.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace slantcol::column
{
    /// @brief Nominal [start, end] window a run is requested for.
    struct RunWindow
    {
        Timestamp start;
        Timestamp end;
    };

    /// @brief Effective position and window to hand to the scheduler.
    struct RunPlan
    {
        Condition          condition;  ///< None when the window should be generated
        InstrumentPosition instrument;
        Timestamp          start;
        Timestamp          end;

        [[nodiscard]] bool runnable() const { return condition == Condition::None; }
    };

    /// @brief Instrument at a configured position for the whole run.
    struct FixedInstrument
    {
        InstrumentPosition position;

        [[nodiscard]] RunPlan resolve(const RunWindow& window, Seconds cadence) const;
    };

    /// @brief Instrument whose position and coverage come from observation records.
    ///
    /// Records may span several windows; resolve() only considers those
    /// inside the requested window.
    struct ObservationDerivedInstrument
    {
        std::vector<ObservationRecord> records;

        [[nodiscard]] RunPlan resolve(const RunWindow& window, Seconds cadence) const;
    };

    using InstrumentSource = std::variant<FixedInstrument, ObservationDerivedInstrument>;

    /// @brief Resolve whichever instrument mode `source` holds.
    [[nodiscard]] RunPlan resolve_plan(const InstrumentSource& source, const RunWindow& window, Seconds cadence);

    /// @brief Column type label written to output headers ("ground" or "em27").
    [[nodiscard]] std::string_view column_type(const InstrumentSource& source);

} // namespace slantcol::column
