#pragma once

/// @file application.hpp
/// @brief Command-line run driver: terrain, instrument resolution, scheduling, output.

#include "column/instrument_source.hpp"
#include "core/types.hpp"
#include "io/run_config.hpp"
#include "terrain/elevation_index.hpp"
#include "terrain/elevation_source.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace slantcol::core
{
    /// @brief Counters reported at the end of a run.
    struct RunSummary
    {
        u32         windows_written{0};
        u32         windows_skipped{0};
        u32         windows_failed{0};
        std::size_t rows{0};
        std::size_t valid_rows{0};
        std::size_t below_ground_rows{0};
        u32         index_loads{0};   ///< Subgrid loads; one per distinct instrument position
        bool        cancelled{false};
    };

    /// @brief Top-level driver that owns the run's terrain and instrument state.
    ///
    /// Lifecycle: construct with a validated configuration, then run() walks
    /// the daily windows in order. For each window the instrument mode is
    /// resolved; NoObservationData and InconsistentInstrumentPosition skip
    /// the window, everything else is scheduled and written.
    class Application
    {
    public:
        /// @param cancel Optional flag checked between timestamps and windows.
        explicit Application(io::RunConfig config, const std::atomic<bool>* cancel = nullptr);

        /// @brief Run over an already opened terrain dataset; `config.terrain.path` is not read.
        Application(io::RunConfig config,
                    std::shared_ptr<const terrain::ElevationSource> terrain,
                    const std::atomic<bool>* cancel = nullptr);

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Process every window.
        /// @return Process exit code: 0 success, 1 failure, 130 cancelled.
        [[nodiscard]] int run();

        [[nodiscard]] const RunSummary& summary() const { return m_summary; }

    private:
        [[nodiscard]] bool init();
        [[nodiscard]] bool load_instrument();
        void run_window(const column::RunWindow& window);

        /// @brief Index around `position`, reloaded only when the instrument moves.
        [[nodiscard]] const terrain::ElevationIndex& index_for(const column::InstrumentPosition& position);

        [[nodiscard]] bool cancel_requested() const;

        io::RunConfig                             m_config;
        const std::atomic<bool>*                  m_cancel{nullptr};
        std::shared_ptr<const terrain::ElevationSource> m_terrain;
        std::unique_ptr<terrain::ElevationIndex>  m_index;
        std::optional<column::InstrumentPosition> m_index_center;
        std::optional<column::InstrumentSource>   m_instrument;
        RunSummary                                m_summary{};
    };

} // namespace slantcol::core
