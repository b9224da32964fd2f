#pragma once

#include "completeness.hpp"
#include "extracted_row.hpp"
#include <vector>

struct MergeResult {
    std::vector<ExtractedRow> merged;
    int rows_added = 0;
};

// Folds rows from a targeted retry into an existing extraction. An incoming
// row is accepted only when its group still has that this-week rank missing;
// nothing already present is ever duplicated. The result is ordered by group
// discovery, then numeric rank, rows without a rank last.
MergeResult merge_missing_rows(const std::vector<ExtractedRow>& existing,
                               const std::vector<ExtractedRow>& incoming,
                               const std::vector<MissingChartGroup>& missing_groups);

// Stable re-sort used by the merge; exposed for callers that combine rows
// from several sources.
void sort_rows_by_group_and_rank(std::vector<ExtractedRow>& rows);
