#include "prompts.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

std::string extraction_system_prompt() {
    return
        "You are a high-precision OCR + table extraction engine for scanned Billboard chart pages.\n"
        "Return only JSON that matches the provided schema (no commentary, no markdown).\n"
        "Never guess: if you cannot confidently read something, prefer null (for rank fields) "
        "or omit the row (for required text fields).\n"
        "Never mix data across different chart tables on the same page.";
}

std::string full_extraction_prompt() {
    return
        "Extract chart table rows from this scanned Billboard page.\n"
        "\n"
        "Output format: a JSON object with `rows` (an array). Each row is one chart entry.\n"
        "\n"
        "Terminology:\n"
        "- A \"chart block\" is one chart table with its own chart title and column headers. "
        "Pages can have multiple chart blocks.\n"
        "- chartTitle: the specific chart title for the chart block (e.g. \"12 INCH SINGLES SALES\", "
        "\"CLUB PLAY\", \"DISCO TOP 80\"). Do not include the \"Billboard\" masthead.\n"
        "- chartSection: the broader page/category header that groups charts on the page "
        "(e.g. \"HOT DANCE/DISCO\"). If none, use \"\" (empty string).\n"
        "\n"
        "Critical rules (do not violate):\n"
        "1) Multi-chart pages: if there are multiple chart blocks (side-by-side or stacked), "
        "treat them as completely separate tables.\n"
        "   - NEVER copy ranks from one chart block onto rows from another chart block, "
        "even if the rows line up horizontally.\n"
        "   - Extract all rows for one chart block before moving to the next chart block.\n"
        "   - If a single chart is laid out in multiple columns (same chartTitle repeated with "
        "separate column headers), treat each column as an independent table region and never "
        "combine cells across columns.\n"
        "2) Ranks (thisWeekRank/lastWeekRank/twoWeeksAgoRank/weeksOnChart):\n"
        "   - Only read rank values from the columns in the SAME chart block as the row's "
        "title/artist/label.\n"
        "   - Ignore decorative icons/symbols (stars, circles, bullets) printed near or around "
        "ranks; they are not part of the number.\n"
        "   - If a rank cell is blank, a dash (like \"-\"), \"NEW\", or unreadable, return null "
        "for that field.\n"
        "   - Return ranks as digits only (e.g. \"12\"), not \"12*\", \"(12)\", or \"star 12\".\n"
        "3) Text fields (title/artist/label):\n"
        "   - Copy the printed text from the SAME row of the SAME chart block.\n"
        "   - Trim whitespace and remove trailing separator dashes "
        "(e.g. \"SONG TITLE -\" => \"SONG TITLE\").\n"
        "   - Ignore decorative bullets/symbols that are not part of the text.\n"
        "4) Scope: extract ONLY chart table rows. Ignore articles, ads, and sidebars that are "
        "not chart tables.\n"
        "\n"
        "Ordering: preserve row order top-to-bottom within each table region; output regions in "
        "reading order (left-to-right, then top-to-bottom).\n"
        "\n"
        "Example mapping: if the page header says \"HOT DANCE/DISCO\" and it contains two charts "
        "titled \"12 INCH SINGLES SALES\" and \"CLUB PLAY\", then chartSection=\"HOT DANCE/DISCO\" "
        "for both charts, and chartTitle is the chart's own title.\n"
        "\n"
        "If you cannot confidently extract a row's title OR artist OR label, omit that row "
        "(do not guess).\n"
        "\n"
        "Return only valid JSON.";
}

std::string missing_rows_prompt(const std::vector<MissingChartGroup>& missing) {
    std::string list;
    for (size_t i = 0; i < missing.size(); ++i) {
        const auto& g = missing[i];
        std::string label = g.chart_title.empty() ? "(unknown chart)" : g.chart_title;
        if (!g.chart_section.empty()) label += " [" + g.chart_section + "]";
        std::string ranks = format_rank_ranges(g.missing_ranks, PROMPT_MAX_RANK_RANGES);
        if (ranks.empty()) ranks = "(unknown)";
        if (i > 0) list += "\n";
        list += fmt::format("{}) {}: extracted {}/{}; missing thisWeekRank {}",
                            i + 1, label, g.actual_row_count, g.expected_row_count, ranks);
    }

    return
        "You previously extracted chart table rows from this scanned Billboard page, but some "
        "rows were missed. Base their location off of the ranks you can clearly read, and the "
        "chart titles/sections they belong to.\n"
        "\n"
        "Task: find the missing rows and output ONLY those missing rows.\n"
        "\n"
        "Rules:\n"
        "- Output ONLY missing rows; do not repeat already-extracted ranks.\n"
        "- Each output row must include the correct chartTitle and chartSection for its chart "
        "block.\n"
        "- Never guess: if you cannot confidently read a missing row, omit it.\n"
        "\n"
        "Missing rows to find:\n" + list + "\n"
        "\n"
        "Return only valid JSON.";
}
