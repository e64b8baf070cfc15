#pragma once

/// @file application.hpp
/// @brief Command-line application: load catalogs, compute the schedule, export reports.

#include "app/config.hpp"
#include "catalog/catalog_entry.hpp"
#include "core/result.hpp"
#include "visibility/visibility_scanner.hpp"

#include <string>
#include <vector>

namespace uptime::app
{
    /// @brief One scheduling run driven by an AppConfig.
    ///
    /// Lifecycle: construct with a validated config → run() loads the
    /// catalogs, builds the observation window, computes every pair and
    /// writes the reports. run() returns the process exit code.
    class Application
    {
    public:
        explicit Application(AppConfig config);

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        /// @return 0 on success, 1 if catalogs, window or computation failed.
        [[nodiscard]] int run();

        /// @brief Observation window for a config, resolving "today" against `now_jd`.
        [[nodiscard]] static core::Result<visibility::ObservationWindow> build_window(
            const AppConfig& config, f64 now_jd);

        /// @brief Keep only records whose id is listed; an empty list keeps everything.
        template <typename Record>
        [[nodiscard]] static std::vector<Record> select(const std::vector<Record>& records,
                                                        const std::vector<std::string>& ids,
                                                        const char* kind);

    private:
        bool load_catalogs();

        AppConfig m_config;
        std::vector<catalog::Station> m_stations;
        std::vector<catalog::Source> m_sources;
    };

} // namespace uptime::app
