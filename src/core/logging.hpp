/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: logging.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide log helper. Every line goes to stdout and into a bounded ring
 * buffer that administrators can read back over the API.
 * Levels: DEBUG, INFO, WARN, ERROR, FATAL, AUDIT, INTEGRITY.
 * ============================================================================
 */

#ifndef ATL_LOGGING_HPP
#define ATL_LOGGING_HPP

#include <string>
#include <vector>

namespace atl {

    void atl_log(const std::string& level, const std::string& message);

    // Oldest first.
    std::vector<std::string> recent_logs();

    // Lines carrying the given level tag, oldest first.
    std::vector<std::string> recent_logs(const std::string& level);

} // namespace atl

#endif // ATL_LOGGING_HPP
