#include "records.hpp"
#include <core/constants.hpp>

RequestRecord RequestRecord::from_row(const Row& row) {
    RequestRecord r;
    r.id = row.integer("id");
    r.guid = row.text("guid");
    r.status = row.text("status");
    r.size = row.optional_integer("size");
    r.details = row.text("details");
    r.created_at = row.text("created_at");
    r.updated_at = row.text("updated_at");
    return r;
}

DownloadRecord DownloadRecord::from_row(const Row& row) {
    DownloadRecord d;
    d.id = row.integer("id");
    d.request_id = row.integer("request_id");
    d.remote_filename = row.text("remote_filename");
    d.local_path = row.text("filename");
    d.status = row.text("status");
    d.size = row.integer("size");
    d.details = row.text("details");
    d.created_at = row.text("created_at");
    d.updated_at = row.text("updated_at");
    return d;
}

AttemptRecord AttemptRecord::from_row(const Row& row) {
    AttemptRecord a;
    a.id = row.integer("id");
    a.download_id = row.integer("download_id");
    a.status = row.text("status");
    a.details = row.text("details");
    a.created_at = row.text("created_at");
    a.updated_at = row.text("updated_at");
    return a;
}

std::optional<RequestRecord> find_request_by_guid(JobStore& store, const std::string& guid) {
    auto rows = store.query({"SELECT * FROM requests WHERE guid = ?", {guid}});
    if (rows.empty()) return std::nullopt;
    return RequestRecord::from_row(rows.front());
}

std::vector<RequestRecord> unfinished_requests(JobStore& store) {
    std::vector<RequestRecord> out;
    auto rows = store.query({"SELECT * FROM requests WHERE status != ? ORDER BY id",
                             {std::string(REQUEST_FINISHED)}});
    for (const auto& row : rows) out.push_back(RequestRecord::from_row(row));
    return out;
}

std::vector<DownloadRecord> downloads_for_request(JobStore& store, int64_t request_id) {
    std::vector<DownloadRecord> out;
    auto rows = store.query({"SELECT * FROM downloads WHERE request_id = ? ORDER BY id",
                             {request_id}});
    for (const auto& row : rows) out.push_back(DownloadRecord::from_row(row));
    return out;
}

std::vector<AttemptRecord> attempts_for_download(JobStore& store, int64_t download_id) {
    std::vector<AttemptRecord> out;
    auto rows = store.query({"SELECT * FROM download_attempts WHERE download_id = ? ORDER BY id",
                             {download_id}});
    for (const auto& row : rows) out.push_back(AttemptRecord::from_row(row));
    return out;
}

int attempt_count(JobStore& store, int64_t download_id) {
    auto rows = store.query({"SELECT COUNT(*) AS n FROM download_attempts WHERE download_id = ?",
                             {download_id}});
    if (rows.empty()) return 0;
    return static_cast<int>(rows.front().integer("n"));
}
