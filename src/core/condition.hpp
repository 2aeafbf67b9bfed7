#pragma once

/// @file condition.hpp
/// @brief Recoverable conditions carried on profiles, points and run windows.

#include "core/types.hpp"

#include <string_view>

namespace slantcol
{
    /// @brief Reason a receptor, profile or run window could not be produced.
    ///
    /// None of these end a run. They travel with the affected result so a
    /// caller (or a human reading the receptor table) can see exactly which
    /// timestamps and heights failed and why.
    enum class Condition : u8
    {
        None,
        SolarGeometryUndefined,          ///< Sun at or below the horizon
        CoverageGap,                     ///< Point outside the loaded terrain extent
        InconsistentInstrumentPosition,  ///< Instrument moved within an observation window
        NoObservationData,               ///< No observation records in the window
    };

    [[nodiscard]] constexpr std::string_view to_string(Condition condition)
    {
        switch (condition)
        {
            case Condition::None:                           return "ok";
            case Condition::SolarGeometryUndefined:         return "solar_geometry_undefined";
            case Condition::CoverageGap:                    return "coverage_gap";
            case Condition::InconsistentInstrumentPosition: return "inconsistent_instrument_position";
            case Condition::NoObservationData:              return "no_observation_data";
        }
        return "unknown";
    }
}
