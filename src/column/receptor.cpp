/// @file receptor.cpp
/// @brief ReceptorTable assembly and queries.

#include "column/receptor.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <iterator>

namespace slantcol::column
{

std::optional<ReceptorTable> ReceptorTable::assemble(std::vector<SlantProfile>&& profiles,
                                                     std::vector<f64> heights,
                                                     std::size_t requested_timestamps)
{
    if (heights.empty() || !std::is_sorted(heights.begin(), heights.end()))
    {
        SLC_CORE_ERROR("ReceptorTable: Heights must be non-empty and ascending");
        return std::nullopt;
    }

    for (std::size_t p = 0; p < profiles.size(); ++p)
    {
        const SlantProfile& profile = profiles[p];

        if (p > 0 && profile.timestamp <= profiles[p - 1].timestamp)
        {
            SLC_CORE_ERROR("ReceptorTable: Profile {} is out of timestamp order", p);
            return std::nullopt;
        }

        if (profile.points.size() != heights.size())
        {
            SLC_CORE_ERROR("ReceptorTable: Profile {} has {} points, expected {}",
                           p, profile.points.size(), heights.size());
            return std::nullopt;
        }

        for (std::size_t h = 0; h < heights.size(); ++h)
        {
            if (profile.points[h].height_above_instrument != heights[h])
            {
                SLC_CORE_ERROR("ReceptorTable: Profile {} height {} is {} m, expected {} m",
                               p, h, profile.points[h].height_above_instrument, heights[h]);
                return std::nullopt;
            }
        }
    }

    ReceptorTable table;
    table.m_heights = std::move(heights);
    table.m_requested_timestamps = requested_timestamps;
    table.m_rows.reserve(profiles.size() * table.m_heights.size());

    for (SlantProfile& profile : profiles)
    {
        std::move(profile.points.begin(), profile.points.end(), std::back_inserter(table.m_rows));
    }
    profiles.clear();

    return table;
}

std::size_t ReceptorTable::timestamp_count() const
{
    return m_heights.empty() ? 0 : m_rows.size() / m_heights.size();
}

Timestamp ReceptorTable::timestamp_at(std::size_t index) const
{
    return m_rows[index * m_heights.size()].timestamp;
}

const ReceptorPoint& ReceptorTable::at(std::size_t timestamp_index, std::size_t height_index) const
{
    return m_rows[timestamp_index * m_heights.size() + height_index];
}

const ReceptorPoint* ReceptorTable::find(Timestamp timestamp, f64 height) const
{
    const auto h = std::find(m_heights.begin(), m_heights.end(), height);
    if (h == m_heights.end())
    {
        return nullptr;
    }

    // Rows are grouped by timestamp; binary search on the first row of each group
    std::size_t lo = 0;
    std::size_t hi = timestamp_count();
    while (lo < hi)
    {
        const std::size_t mid = lo + (hi - lo) / 2;
        if (timestamp_at(mid) < timestamp)
        {
            lo = mid + 1;
        }
        else
        {
            hi = mid;
        }
    }

    if (lo == timestamp_count() || timestamp_at(lo) != timestamp)
    {
        return nullptr;
    }

    return &at(lo, static_cast<std::size_t>(std::distance(m_heights.begin(), h)));
}

std::size_t ReceptorTable::valid_count() const
{
    return static_cast<std::size_t>(std::count_if(m_rows.begin(), m_rows.end(),
                                                  [](const ReceptorPoint& row) { return row.valid(); }));
}

std::size_t ReceptorTable::below_ground_count() const
{
    return static_cast<std::size_t>(std::count_if(m_rows.begin(), m_rows.end(),
                                                  [](const ReceptorPoint& row) {
                                                      return row.valid() && !row.is_above_ground;
                                                  }));
}

std::size_t ReceptorTable::count(Condition condition) const
{
    return static_cast<std::size_t>(std::count_if(m_rows.begin(), m_rows.end(),
                                                  [condition](const ReceptorPoint& row) {
                                                      return row.condition == condition;
                                                  }));
}

} // namespace slantcol::column
