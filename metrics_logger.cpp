#include "metrics_logger.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace wsplus {

namespace {

using KV = std::pair<std::string, std::string>;

void flatten(const nlohmann::json& node, const std::string& prefix, std::vector<KV>& out) {
    if( node.is_object() && !node.empty() ) {
        for( const auto& [key, value] : node.items() )
            flatten(value, prefix.empty() ? key : prefix + "." + key, out);
        return;
    }
    out.emplace_back(prefix, node.is_string() ? node.get<std::string>() : node.dump());
}

} // namespace

void MetricsLogger::log_statistics(const nlohmann::json& s, std::ostream& os) const {
    // Stable, grep-friendly format: one key=value per line.
    std::vector<KV> items;
    flatten(s, "", items);

    std::sort(items.begin(), items.end(), [](const KV& a, const KV& b){ return a.first < b.first; });
    for( const auto& item : items ) {
        os << item.first << "=" << item.second << "\n";
    }
}

} // namespace wsplus
