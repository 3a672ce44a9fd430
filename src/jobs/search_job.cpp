#include "search_job.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <stdexcept>

namespace {

const std::string FITS_SUFFIX = ".fits";
const std::string JOB_ID_PREFIX = "Job ID: ";

std::string datafile_list(const std::vector<std::string>& datafiles) {
    std::string out;
    for (const auto& d : datafiles) {
        if (!out.empty()) out += ", ";
        out += d;
    }
    return out;
}

} // namespace

std::string SearchJob::job_name_for(const std::vector<std::string>& datafiles) {
    if (datafiles.empty()) {
        throw std::invalid_argument("A job needs at least one datafile");
    }
    const std::string& primary = datafiles.front();
    if (primary.size() <= FITS_SUFFIX.size() ||
        primary.compare(primary.size() - FITS_SUFFIX.size(), FITS_SUFFIX.size(), FITS_SUFFIX) != 0) {
        throw std::invalid_argument("First data file is not a FITS file! (" + primary + ")");
    }
    return primary.substr(0, primary.size() - FITS_SUFFIX.size());
}

SearchJob::SearchJob(std::vector<std::string> datafiles)
    : datafiles_(std::move(datafiles)),
      name_(job_name_for(datafiles_)),
      log_(name_ + ".log", LogEntry::make(JOB_NEW, "Datafiles: " + datafile_list(datafiles_))) {
    recover_queue_id();
}

std::string SearchJob::status() const {
    return to_lower(log_.last().status);
}

void SearchJob::refresh() {
    if (log_.update()) recover_queue_id();
}

void SearchJob::recover_queue_id() {
    const auto& entries = log_.entries();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->info.rfind(JOB_ID_PREFIX, 0) == 0) {
            std::string id = it->info.substr(JOB_ID_PREFIX.size());
            trim(id);
            if (!id.empty()) queue_id_ = id;
            return;
        }
    }
}
