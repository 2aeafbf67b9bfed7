/// @file instrument_source.cpp
/// @brief Instrument mode resolution.

#include "column/instrument_source.hpp"

#include <algorithm>
#include <iterator>

namespace slantcol::column
{

RunPlan FixedInstrument::resolve(const RunWindow& window, Seconds /*cadence*/) const
{
    return RunPlan{
        .condition  = Condition::None,
        .instrument = position,
        .start      = window.start,
        .end        = window.end,
    };
}

RunPlan ObservationDerivedInstrument::resolve(const RunWindow& window, Seconds cadence) const
{
    std::vector<ObservationRecord> in_window;
    std::copy_if(records.begin(), records.end(), std::back_inserter(in_window),
                 [&window](const ObservationRecord& r) {
                     return r.timestamp >= window.start && r.timestamp <= window.end;
                 });

    const ObservationWindow derived = ObservationWindowFilter::derive_window(in_window, cadence, window.end);

    return RunPlan{
        .condition  = derived.condition,
        .instrument = derived.instrument,
        .start      = derived.start,
        .end        = derived.end,
    };
}

RunPlan resolve_plan(const InstrumentSource& source, const RunWindow& window, Seconds cadence)
{
    return std::visit([&](const auto& instrument) { return instrument.resolve(window, cadence); }, source);
}

std::string_view column_type(const InstrumentSource& source)
{
    return std::holds_alternative<FixedInstrument>(source) ? "ground" : "em27";
}

} // namespace slantcol::column
