#include "job_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

std::string resolve_job_id(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        cli.fail("Missing job id");
        return "";
    }
    if (cli.store->get_job(arg)) return arg;

    std::vector<std::string> matches;
    for (const auto& job : cli.store->list_jobs()) {
        if (job.id.compare(0, arg.size(), arg) == 0) {
            matches.push_back(job.id);
        }
    }
    if (matches.empty()) {
        cli.fail("No job matches: " + arg);
        return "";
    }
    if (matches.size() > 1) {
        cli.fail(fmt::format("Ambiguous job id '{}' ({} matches)", arg, matches.size()));
        return "";
    }
    return matches.front();
}

std::string status_label(JobStatus status) {
    std::string name = to_string(status);
    switch (status) {
        case JobStatus::Completed:      return theme::green(name);
        case JobStatus::Processing:     return theme::blue(name);
        case JobStatus::AwaitingReview: return theme::amber(name);
        case JobStatus::Error:          return theme::red(name);
        case JobStatus::Cancelled:      return theme::yellow(name);
        case JobStatus::Deleted:        return theme::dim(name);
        case JobStatus::Queued:         break;
    }
    return name;
}

std::string status_label(RunStatus status) {
    std::string name = to_string(status);
    switch (status) {
        case RunStatus::Completed: return theme::green(name);
        case RunStatus::Error:     return theme::red(name);
        case RunStatus::Cancelled: return theme::yellow(name);
    }
    return name;
}

std::string job_line(const Job& job) {
    std::string line = fmt::format("{} {} [{}]", job.id.substr(0, 8), job.filename, to_string(job.status));
    if (!job.progress_step.empty() && job.status == JobStatus::Processing) {
        line += " " + job.progress_step;
    }
    if (!job.error.empty()) line += ": " + job.error;
    return line;
}

bool parse_int_arg(BaseCLI& cli, const std::string& arg, int& out, const std::string& usage) {
    try {
        size_t used = 0;
        int v = std::stoi(arg, &used);
        if (used != arg.size() || v < 1) throw std::invalid_argument(arg);
        out = v;
        return true;
    } catch (const std::exception&) {
        cli.fail("Usage: " + usage);
        return false;
    }
}
