#pragma once

/// @file receptor.hpp
/// @brief Receptor points, slant profiles and the assembled receptor table.

#include "core/condition.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace slantcol::column
{
    /// @brief Geographic position of the instrument. Elevation in metres above sea level.
    struct InstrumentPosition
    {
        f64 latitude;
        f64 longitude;
        f64 elevation_asl;

        [[nodiscard]] bool operator==(const InstrumentPosition&) const = default;
    };

    /// @brief One release point on a slant column.
    ///
    /// Latitude and longitude are NaN when the profile has no solar geometry.
    /// The surface fields stay empty until ground level is resolved.
    struct ReceptorPoint
    {
        Timestamp          timestamp;
        f64                height_above_instrument;
        f64                latitude;
        f64                longitude;
        f64                elevation_asl;
        std::optional<f64> surface_elevation;
        std::optional<f64> height_above_ground_level;
        bool               is_above_ground;
        Condition          condition;

        /// @brief Fully resolved with no condition attached.
        [[nodiscard]] bool valid() const
        {
            return condition == Condition::None && height_above_ground_level.has_value();
        }
    };

    /// @brief All receptor points for one timestamp, ascending by height.
    struct SlantProfile
    {
        Timestamp                  timestamp;
        Condition                  condition;  ///< None or SolarGeometryUndefined
        std::vector<ReceptorPoint> points;

        [[nodiscard]] bool usable() const { return condition == Condition::None; }
    };

    /// @brief Receptor rows for a run, ordered by (timestamp, height).
    ///
    /// Every timestamp carries exactly the same set of heights. Invalid rows
    /// are kept in place; filtering them is left to the caller.
    class ReceptorTable
    {
    public:
        ReceptorTable() = default;

        /// @brief Flatten profiles into one table in a single pass.
        ///
        /// @param profiles Profiles in ascending timestamp order.
        /// @param heights Ascending heights every profile must carry.
        /// @param requested_timestamps Number of timestamps the run was asked for.
        /// @return std::nullopt if a profile breaks the ordering or the uniform height set.
        [[nodiscard]] static std::optional<ReceptorTable> assemble(std::vector<SlantProfile>&& profiles,
                                                                   std::vector<f64> heights,
                                                                   std::size_t requested_timestamps);

        [[nodiscard]] const std::vector<ReceptorPoint>& rows() const { return m_rows; }
        [[nodiscard]] const std::vector<f64>& heights() const { return m_heights; }

        [[nodiscard]] std::size_t size() const { return m_rows.size(); }
        [[nodiscard]] bool empty() const { return m_rows.empty(); }

        [[nodiscard]] std::size_t timestamp_count() const;
        [[nodiscard]] Timestamp timestamp_at(std::size_t index) const;

        /// @brief Row for the index-th timestamp and height.
        [[nodiscard]] const ReceptorPoint& at(std::size_t timestamp_index, std::size_t height_index) const;

        /// @brief Row for an exact (timestamp, height) key, or nullptr.
        [[nodiscard]] const ReceptorPoint* find(Timestamp timestamp, f64 height) const;

        /// @brief False when the run stopped before every requested timestamp was produced.
        [[nodiscard]] bool complete() const { return timestamp_count() == m_requested_timestamps; }

        [[nodiscard]] std::size_t valid_count() const;
        [[nodiscard]] std::size_t below_ground_count() const;
        [[nodiscard]] std::size_t count(Condition condition) const;

    private:
        std::vector<ReceptorPoint> m_rows;
        std::vector<f64>           m_heights;
        std::size_t                m_requested_timestamps{0};
    };

} // namespace slantcol::column
