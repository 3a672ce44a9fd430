#include "restore_report.hpp"
#include <store/records.hpp>
#include <fmt/format.h>

void print_restore_report(JobStore& store, std::ostream& out) {
    auto requests = unfinished_requests(store);
    if (requests.empty()) {
        out << "No active restores.\n";
        return;
    }

    for (const auto& req : requests) {
        out << fmt::format("Restore: {}  [{}]  size: {}  updated: {}\n", req.guid, req.status,
                           req.size ? std::to_string(*req.size) : std::string("unknown"),
                           req.updated_at);
        if (!req.details.empty()) out << fmt::format("    {}\n", req.details);

        auto downloads = downloads_for_request(store, req.id);
        for (const auto& dl : downloads) {
            out << fmt::format("    {:<40} {:>14}  {:<12} attempts: {}  {}\n",
                               dl.remote_filename, dl.size, dl.status,
                               attempt_count(store, dl.id), dl.details);
        }
    }
}
