#pragma once

// ── Request / download statuses (store values) ──────────────
constexpr const char* REQUEST_WAITING    = "waiting";
constexpr const char* REQUEST_READY      = "ready";
constexpr const char* REQUEST_FINISHED   = "finished";
constexpr const char* REQUEST_FAILED     = "failed";

constexpr const char* DOWNLOAD_NEW         = "new";
constexpr const char* DOWNLOAD_DOWNLOADING = "downloading";
constexpr const char* DOWNLOAD_DOWNLOADED  = "downloaded";
constexpr const char* DOWNLOAD_FAILED      = "failed";

// ── Restore service ─────────────────────────────────────────
constexpr const char* RESTORE_FAIL_RESPONSE  = "fail";
constexpr const char* LOCATION_DONE_RESPONSE = "done";

// ── Job log statuses (compared lower-cased) ─────────────────
constexpr const char* JOB_NEW                 = "New job";
constexpr const char* JOB_SUBMITTED           = "Submitted to queue";
constexpr const char* JOB_PROCESSING          = "Processing in progress";
constexpr const char* JOB_PROCESSING_OK       = "Processing successful";
constexpr const char* JOB_PROCESSING_FAILED   = "Processing failed";
constexpr const char* JOB_UPLOAD_OK           = "Upload successful";
constexpr const char* JOB_DELETED             = "Deleted";

// ── Timeouts / intervals ────────────────────────────────────
constexpr int FTP_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single SSH command
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int PIPE_READ_BUF_SIZE         = 4096;

// ── Store timestamps ────────────────────────────────────────
constexpr const char* STORE_TIME_FORMAT  = "%Y-%m-%d %H:%M:%S";
