#include "row_merger.hpp"
#include "rank.hpp"
#include <algorithm>
#include <climits>
#include <map>
#include <set>

void sort_rows_by_group_and_rank(std::vector<ExtractedRow>& rows) {
    std::map<std::string, int> group_order;
    for (const auto& row : rows) {
        group_order.emplace(chart_group_key(row), static_cast<int>(group_order.size()));
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [&group_order](const ExtractedRow& a, const ExtractedRow& b) {
        int ga = group_order.at(chart_group_key(a));
        int gb = group_order.at(chart_group_key(b));
        if (ga != gb) return ga < gb;
        auto ra = coerce_rank(a.this_week_rank);
        auto rb = coerce_rank(b.this_week_rank);
        int ka = ra ? *ra : INT_MAX;
        int kb = rb ? *rb : INT_MAX;
        return ka < kb;
    });
}

MergeResult merge_missing_rows(const std::vector<ExtractedRow>& existing,
                               const std::vector<ExtractedRow>& incoming,
                               const std::vector<MissingChartGroup>& missing_groups) {
    MergeResult result;
    result.merged = existing;

    std::map<std::string, std::set<int>> wanted;
    for (const auto& g : missing_groups) {
        auto& ranks = wanted[chart_group_key(g.chart_section, g.chart_title)];
        ranks.insert(g.missing_ranks.begin(), g.missing_ranks.end());
    }

    std::map<std::string, std::set<int>> present;
    for (const auto& row : existing) {
        if (auto r = coerce_rank(row.this_week_rank)) {
            present[chart_group_key(row)].insert(*r);
        }
    }

    for (const auto& row : incoming) {
        auto key = chart_group_key(row);
        auto it = wanted.find(key);
        if (it == wanted.end() || it->second.empty()) continue;

        auto rank = coerce_rank(row.this_week_rank);
        if (!rank) continue;
        if (!it->second.count(*rank)) continue;

        auto& seen = present[key];
        if (seen.count(*rank)) continue;

        seen.insert(*rank);
        it->second.erase(*rank);
        result.merged.push_back(row);
        result.rows_added++;
    }

    sort_rows_by_group_and_rank(result.merged);
    return result;
}
