#include "pbs_queue.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <map>
#include <sstream>

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

std::string strip_quotes(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

// Variable_List is "K=V,K=V,..."; a value may itself contain commas (either
// escaped as "\," or bare), so a piece without '=' continues the previous value.
std::map<std::string, std::string> parse_variable_list(const std::string& text) {
    std::map<std::string, std::string> vars;
    std::string last;
    std::string unescaped;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == ',') {
            unescaped += '\x01';
            i++;
        } else {
            unescaped += text[i];
        }
    }
    for (auto piece : split(unescaped, ',')) {
        for (auto& c : piece) {
            if (c == '\x01') c = ',';
        }
        auto eq = piece.find('=');
        if (eq == std::string::npos || (piece.find('/') != std::string::npos && piece.find('/') < eq)) {
            if (!last.empty()) vars[last] += "," + piece;
            continue;
        }
        last = piece.substr(0, eq);
        vars[last] = piece.substr(eq + 1);
    }
    return vars;
}

} // namespace

std::string build_qsub_command(const QueueConfig& config,
                               const std::vector<std::string>& datafiles,
                               const std::string& outdir) {
    std::string vars = fmt::format("DATAFILES=\"{}\",OUTDIR=\"{}\"", join(datafiles, ","), outdir);
    std::string cmd = "qsub -V -v " + shell_quote(vars);
    if (!config.resource_list.empty()) {
        cmd += " -l " + shell_quote(config.resource_list);
    }
    cmd += " -N " + shell_quote(config.job_basename);
    cmd += " -e " + shell_quote(config.qsublog_dir);
    cmd += " -o " + shell_quote(config.qsublog_dir);
    cmd += " " + config.script;
    return cmd;
}

std::vector<QueueJob> parse_qstat_full(const std::string& text) {
    std::vector<QueueJob> jobs;
    std::map<std::string, std::string> attrs;
    std::string last_key;
    bool in_job = false;

    auto flush = [&]() {
        if (!in_job) return;
        QueueJob& job = jobs.back();
        job.name = attrs["Job_Name"];
        job.state = attrs["job_state"];
        auto vars = parse_variable_list(attrs["Variable_List"]);
        auto it = vars.find("DATAFILES");
        if (it != vars.end()) {
            for (const auto& f : split(strip_quotes(it->second), ',')) {
                if (!f.empty()) job.datafiles.push_back(f);
            }
        }
        attrs.clear();
        last_key.clear();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.rfind("Job Id:", 0) == 0) {
            flush();
            QueueJob job;
            job.id = line.substr(7);
            trim(job.id);
            jobs.push_back(job);
            in_job = true;
            continue;
        }
        if (!in_job || line.empty()) continue;

        if (line[0] == '\t') {
            std::string cont = line;
            trim(cont);
            if (!last_key.empty()) attrs[last_key] += cont;
            continue;
        }
        auto eq = line.find(" = ");
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 3);
        trim(key);
        trim(value);
        attrs[key] = value;
        last_key = key;
    }
    flush();
    return jobs;
}

PbsQueue::PbsQueue(const QueueConfig& config, CommandRunner& runner)
    : config_(config), runner_(runner) {
}

Result<std::string> PbsQueue::submit(const std::vector<std::string>& datafiles,
                                     const std::string& outdir) {
    auto result = runner_.run(build_qsub_command(config_, datafiles, outdir));
    std::string job_id = result.stdout_data;
    trim(job_id);
    if (result.failed()) {
        return Result<std::string>::Err(fmt::format("qsub failed (exit {}): {}",
                                                    result.exit_code, result.get_output()));
    }
    if (job_id.empty()) {
        return Result<std::string>::Err("No job identifier returned by qsub!");
    }
    log_info("queue", fmt::format("Submitted {} as {}", join(datafiles, ","), job_id));
    return Result<std::string>::Ok(job_id);
}

Result<std::vector<QueueJob>> PbsQueue::jobs() {
    auto result = runner_.run("qstat -f");
    if (result.failed()) {
        return Result<std::vector<QueueJob>>::Err(fmt::format("qstat failed (exit {}): {}",
                                                              result.exit_code, result.get_output()));
    }
    return Result<std::vector<QueueJob>>::Ok(parse_qstat_full(result.stdout_data));
}

Result<QueueStatus> PbsQueue::status() {
    auto all = jobs();
    if (all.is_err()) return Result<QueueStatus>::Err(all.error);

    QueueStatus st;
    for (const auto& job : all.value) {
        if (job.name.rfind(config_.job_basename, 0) != 0) continue;
        if (job.state.find('R') != std::string::npos) {
            st.running++;
        } else if (job.state.find('Q') != std::string::npos) {
            st.queued++;
        }
    }
    return Result<QueueStatus>::Ok(st);
}

Result<bool> PbsQueue::is_running(const std::string& job_id) {
    auto all = jobs();
    if (all.is_err()) return Result<bool>::Err(all.error);
    for (const auto& job : all.value) {
        if (job.id == job_id) return Result<bool>::Ok(true);
    }
    return Result<bool>::Ok(false);
}

Result<std::optional<std::string>> PbsQueue::is_processing_file(const std::string& datafile) {
    auto all = jobs();
    if (all.is_err()) return Result<std::optional<std::string>>::Err(all.error);
    for (const auto& job : all.value) {
        if (job.name.rfind(config_.job_basename, 0) != 0) continue;
        if (!job.datafiles.empty() && job.datafiles.front() == datafile) {
            return Result<std::optional<std::string>>::Ok(job.id);
        }
    }
    return Result<std::optional<std::string>>::Ok(std::nullopt);
}

Result<void> PbsQueue::remove(const std::string& job_id) {
    if (job_id.empty()) {
        return Result<void>::Err("Cannot delete a job without an id");
    }
    auto result = runner_.run("qdel " + shell_quote(job_id));
    if (result.failed()) {
        log_warning("queue", fmt::format("qdel {} exited {}: {}", job_id, result.exit_code, result.get_output()));
    }
    platform::sleep_ms(config_.delete_settle_secs * 1000);

    auto all = jobs();
    if (all.is_err()) return Result<void>::Err(all.error);
    for (const auto& job : all.value) {
        if (job.id == job_id && job.state.find('E') == std::string::npos) {
            return Result<void>::Err(fmt::format("Job {} still in queue (state {})", job_id, job.state));
        }
    }
    return Result<void>::Ok();
}

std::string PbsQueue::stderr_path(const std::string& job_id) const {
    std::string jobnum = job_id.substr(0, job_id.find('.'));
    return (std::filesystem::path(config_.qsublog_dir) / (config_.job_basename + ".e" + jobnum)).string();
}

std::string PbsQueue::stdout_path(const std::string& job_id) const {
    std::string jobnum = job_id.substr(0, job_id.find('.'));
    return (std::filesystem::path(config_.qsublog_dir) / (config_.job_basename + ".o" + jobnum)).string();
}

Result<bool> PbsQueue::had_errors(const std::string& job_id) {
    std::string path = shell_quote(stderr_path(job_id));
    auto result = runner_.run(fmt::format(
        "if [ -e {0} ]; then if [ -s {0} ]; then echo yes; else echo no; fi; else echo missing; fi", path));
    std::string answer = result.stdout_data;
    trim(answer);
    if (answer == "yes") return Result<bool>::Ok(true);
    if (answer == "no") return Result<bool>::Ok(false);
    return Result<bool>::Err(fmt::format("Cannot find error log for job ({}): {}", job_id, stderr_path(job_id)));
}

Result<std::string> PbsQueue::read_file(const std::string& path) {
    auto result = runner_.run("cat " + shell_quote(path));
    if (result.failed()) {
        return Result<std::string>::Err("Cannot read " + path + ": " + result.stderr_data);
    }
    return Result<std::string>::Ok(result.stdout_data);
}

Result<std::string> PbsQueue::read_stderr_log(const std::string& job_id) {
    return read_file(stderr_path(job_id));
}

Result<std::string> PbsQueue::read_stdout_log(const std::string& job_id) {
    return read_file(stdout_path(job_id));
}
