#ifndef WSPLUS_METRICS_LOGGER_HPP
#define WSPLUS_METRICS_LOGGER_HPP

#include <iosfwd>
#include <nlohmann/json.hpp>

namespace wsplus {

/**Note on design
 *  Keep this class as a simple formatting/output utility.
 *  Periodic logging belongs to whoever owns the io_context and timers; the
 *  logger only turns one statistics snapshot into text.
 *
 *  Format: one key=value per line, keys sorted, nested objects flattened with
 *  dots (queue.size=3). Strings are printed bare, null as "null".
 */
class MetricsLogger {
    public:
        void log_statistics(const nlohmann::json& statistics, std::ostream& os) const;
};

} // namespace wsplus

#endif // WSPLUS_METRICS_LOGGER_HPP
