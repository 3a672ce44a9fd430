#pragma once

#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

// Remote web service that stages ("restores") observation data for FTP
// pickup. A transport failure is an error Result; a service-level refusal
// comes back as the literal response text (e.g. "fail").
class RestoreService {
public:
    virtual ~RestoreService() = default;

    // Ask for a new restore. Returns its guid, or "fail".
    virtual Result<std::string> request_restore() = 0;

    // Returns "done" once the restore directory is ready on the FTP server.
    virtual Result<std::string> query_location(const std::string& guid) = 0;
};

// SOAP 1.1 client (HTTP POST via libcurl).
class SoapRestoreService : public RestoreService {
public:
    explicit SoapRestoreService(const RestoreServiceConfig& config);

    Result<std::string> request_restore() override;
    Result<std::string> query_location(const std::string& guid) override;

private:
    RestoreServiceConfig config_;

    Result<std::string> call(const std::string& operation,
                             const std::vector<std::pair<std::string, std::string>>& params);
};

// ── SOAP helpers ────────────────────────────────────────────

std::string xml_escape(const std::string& s);

std::string build_soap_envelope(const std::string& ns, const std::string& operation,
                                const std::vector<std::pair<std::string, std::string>>& params);

// Pull the text of <{operation}Result> out of a response body. A SOAP fault
// or a missing element is an error.
Result<std::string> extract_soap_result(const std::string& body, const std::string& operation);
