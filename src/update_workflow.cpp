#include "userjs/update_workflow.hpp"

#include "userjs/logger.hpp"
#include "userjs/preference_merger.hpp"
#include "userjs/sha256.hpp"
#include "userjs/text_file.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace userjs {

namespace {

constexpr std::string_view kBackupPrefix = "user-backup-";
constexpr std::string_view kBackupSuffix = ".js";
constexpr std::string_view kStampPattern = "dddd-dd-dd_dd-dd-dd";

Result RenameFile(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e,
                            "rename " + from + " -> " + to + " failed (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace

const char* ToString(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::None:      return "none";
        case UpdateOutcome::Committed: return "committed";
        case UpdateOutcome::Discarded: return "discarded";
        case UpdateOutcome::Failed:    return "failed";
    }
    return "unknown";
}

StagingFile::StagingFile(std::string path) : path_(std::move(path)) {}

StagingFile::~StagingFile() {
    if (armed_ && ::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LogWarn("Could not remove staging file %s: %s", path_.c_str(), std::strerror(errno));
    }
}

Result StagingFile::Write(std::string_view content) {
    armed_ = true;
    return WriteTextFileDurable(path_, content);
}

Result StagingFile::Discard() {
    armed_ = false;
    if (::unlink(path_.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e,
                            "cannot remove " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

UpdateWorkflow::UpdateWorkflow(IScriptSource& source, Options opt)
    : source_(source), opt_(std::move(opt)), parser_(opt_.family_token) {}

std::string UpdateWorkflow::BackupFileName(const std::tm& local_time) {
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local_time);
    return std::string(kBackupPrefix) + stamp + std::string(kBackupSuffix);
}

bool UpdateWorkflow::IsBackupFileName(std::string_view name) {
    if (name.size() != kBackupPrefix.size() + kStampPattern.size() + kBackupSuffix.size())
        return false;
    if (!name.starts_with(kBackupPrefix) || !name.ends_with(kBackupSuffix))
        return false;

    const std::string_view stamp = name.substr(kBackupPrefix.size(), kStampPattern.size());
    for (size_t i = 0; i < kStampPattern.size(); ++i) {
        const bool want_digit = kStampPattern[i] == 'd';
        const bool is_digit = std::isdigit(static_cast<unsigned char>(stamp[i])) != 0;
        if (want_digit != is_digit) return false;
        if (!want_digit && stamp[i] != kStampPattern[i]) return false;
    }
    return true;
}

Result UpdateWorkflow::Run(UpdateAttempt& attempt) {
    attempt = UpdateAttempt{};
    attempt.staging_path = opt_.staging_path;

    auto res = RunSteps(attempt);
    if (!res.is_ok()) {
        attempt.outcome = UpdateOutcome::Failed;
        LogDebug("Update failed: %s", res.message().c_str());
    }
    return res;
}

Result UpdateWorkflow::RunSteps(UpdateAttempt& attempt) {
    // The staging write truncates its target and discard unlinks it.
    if (SameFilePath(opt_.staging_path, opt_.script_path) ||
        SameFilePath(opt_.staging_path, opt_.overrides_path) ||
        SameFilePath(opt_.overrides_path, opt_.script_path)) {
        return Result::Fail(ErrorKind::Config,
                            "script, overrides and staging paths must be distinct");
    }

    auto local_res = ReadLocalVersion(attempt.old_version);
    if (!local_res.is_ok())
        return local_res;
    LogInfo("Found version: %s", attempt.old_version.ToString().c_str());

    std::string upstream;
    auto fetch_res = source_.Fetch(upstream);
    if (!fetch_res.is_ok()) {
        fetch_res.kind = ErrorKind::Network;
        return fetch_res;
    }
    attempt.candidate_sha256 = Sha256Hex(upstream);
    LogInfo("Fetched %zu bytes from %s (sha256=%s)",
            upstream.size(),
            source_.Location().c_str(),
            attempt.candidate_sha256.c_str());

    std::string overrides;
    auto ov_res = ReadOverrides(overrides);
    if (!ov_res.is_ok())
        return ov_res;

    std::string candidate;
    auto build_res = BuildCandidate(upstream, overrides, candidate);
    if (!build_res.is_ok())
        return build_res;

    StagingFile staging(opt_.staging_path);
    auto write_res = staging.Write(candidate);
    if (!write_res.is_ok())
        return write_res;
    LogDebug("Staged candidate at %s (%zu bytes)", staging.Path().c_str(), candidate.size());

    auto new_res = parser_.ParseFile(staging.Path(), attempt.new_version);
    if (!new_res.is_ok()) {
        return Result::Fail(ErrorKind::Parse, new_res.err,
                            "candidate rejected: " + new_res.message());
    }

    // Equal records take the commit path ("changed" polarity, see DESIGN.md).
    const bool changed = attempt.old_version == attempt.new_version;
    if (changed) {
        LogInfo("Version changed. Old version: %s, New version: %s",
                attempt.old_version.ToString().c_str(),
                attempt.new_version.ToString().c_str());
        return Commit(staging, attempt);
    }

    auto discard_res = staging.Discard();
    if (!discard_res.is_ok())
        return discard_res;
    attempt.outcome = UpdateOutcome::Discarded;
    LogInfo("Update completed without any changes");
    return Result::Ok();
}

Result UpdateWorkflow::ReadLocalVersion(VersionRecord& out) const {
    auto res = parser_.ParseFile(opt_.script_path, out);
    if (IsNotFound(res)) {
        return Result::Fail(ErrorKind::MissingScript, ENOENT, opt_.script_path);
    }
    return res;
}

Result UpdateWorkflow::ReadOverrides(std::string& out) const {
    auto res = ReadTextFile(opt_.overrides_path, out);
    if (IsNotFound(res)) {
        return Result::Fail(ErrorKind::MissingOverrides, ENOENT, opt_.overrides_path);
    }
    if (res.is_ok()) {
        LogDebug("Read %zu bytes of overrides from %s", out.size(), opt_.overrides_path.c_str());
    }
    return res;
}

Result UpdateWorkflow::BuildCandidate(const std::string& upstream,
                                      const std::string& overrides,
                                      std::string& out) const {
    if (opt_.mode == BuildMode::Merge) {
        const PreferenceMerger merger;
        auto merged = merger.Merge(upstream, overrides);
        if (!merged) {
            return Result::Fail(ErrorKind::Parse, merged.error());
        }
        out = std::move(*merged);
        LogInfo("Merged overrides into upstream script");
        return Result::Ok();
    }

    out.clear();
    out.reserve(upstream.size() + 1 + overrides.size());
    out.append(upstream);
    out.push_back('\n');
    out.append(overrides);
    LogInfo("Appended overrides to upstream script");
    return Result::Ok();
}

Result UpdateWorkflow::Commit(StagingFile& staging, UpdateAttempt& attempt) const {
    const std::time_t now = opt_.clock ? opt_.clock() : std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        return Result::Fail(ErrorKind::Io, "cannot determine local time for backup name");
    }

    const std::string dir = BackupDirectory();
    const std::string backup_name = BackupFileName(tm);
    const std::string backup_path =
        dir.empty() ? backup_name : (std::filesystem::path(dir) / backup_name).string();

    LogInfo("Backing up to %s", backup_path.c_str());
    auto backup_res = RenameFile(opt_.script_path, backup_path);
    if (!backup_res.is_ok())
        return backup_res;
    attempt.backup_path = backup_path;

    LogInfo("Renaming new file...");
    auto promote_res = RenameFile(staging.Path(), opt_.script_path);
    if (!promote_res.is_ok()) {
        // Leave both files in place so the user can restore by hand.
        staging.Release();
        return Result::Fail(ErrorKind::Io, promote_res.err,
                            promote_res.message() + "; " + opt_.script_path +
                                " is missing, previous version kept at " + backup_path);
    }
    staging.Release();
    attempt.outcome = UpdateOutcome::Committed;

    if (opt_.single_backup) {
        PruneBackups(backup_path);
    }

    LogInfo("Update complete!");
    return Result::Ok();
}

void UpdateWorkflow::PruneBackups(const std::string& keep_path) const {
    namespace fs = std::filesystem;

    const std::string dir = BackupDirectory();
    const fs::path root = dir.empty() ? fs::path(".") : fs::path(dir);
    const std::string keep_name = fs::path(keep_path).filename().string();

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name == keep_name || !IsBackupFileName(name))
            continue;

        std::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) {
            LogInfo("Removed old backup %s", name.c_str());
        } else if (rm_ec) {
            LogWarn("Cannot remove old backup %s: %s", name.c_str(), rm_ec.message().c_str());
        }
    }
    if (ec) {
        LogWarn("Cannot list %s for old backups: %s", root.c_str(), ec.message().c_str());
    }
}

std::string UpdateWorkflow::BackupDirectory() const {
    return std::filesystem::path(opt_.script_path).parent_path().string();
}

} // namespace userjs
