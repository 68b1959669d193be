#pragma once

#include "userjs/header_parser.hpp"
#include "userjs/result.hpp"
#include "userjs/script_source.hpp"

#include <ctime>
#include <string>
#include <string_view>

namespace userjs {

enum class UpdateOutcome {
    None,
    Committed,
    Discarded,
    Failed,
};

const char* ToString(UpdateOutcome outcome);

// What happened during one UpdateWorkflow::Run. Not persisted.
struct UpdateAttempt {
    VersionRecord old_version;
    VersionRecord new_version;
    std::string staging_path;
    std::string backup_path;
    std::string candidate_sha256;
    UpdateOutcome outcome = UpdateOutcome::None;
};

// Owns the staging file on disk: it is unlinked on destruction unless
// Release() was called after a successful promote.
class StagingFile {
  public:
    explicit StagingFile(std::string path);
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;
    ~StagingFile();

    Result Write(std::string_view content);
    Result Discard();
    void Release() { armed_ = false; }

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    bool armed_ = false;
};

class UpdateWorkflow {
  public:
    enum class BuildMode {
        Append, // upstream text, blank line, overrides text
        Merge,  // PreferenceMerger output
    };

    struct Options {
        std::string script_path = "user.js";
        std::string overrides_path = "user-overrides.js";
        std::string staging_path = "user.js.new";
        std::string family_token = kDefaultFamilyToken;
        BuildMode mode = BuildMode::Append;
        bool single_backup = false; // keep only the backup made by this run
        std::time_t (*clock)() = nullptr; // backup timestamp source; std::time when null
    };

    UpdateWorkflow(IScriptSource& source, Options opt);

    Result Run(UpdateAttempt& attempt);

    // "user-backup-YYYY-MM-DD_HH-MM-SS.js"
    static std::string BackupFileName(const std::tm& local_time);
    static bool IsBackupFileName(std::string_view name);

  private:
    Result RunSteps(UpdateAttempt& attempt);
    Result ReadLocalVersion(VersionRecord& out) const;
    Result ReadOverrides(std::string& out) const;
    Result BuildCandidate(const std::string& upstream,
                          const std::string& overrides,
                          std::string& out) const;
    Result Commit(StagingFile& staging, UpdateAttempt& attempt) const;
    void PruneBackups(const std::string& keep_path) const;
    std::string BackupDirectory() const;

    IScriptSource& source_;
    Options opt_;
    HeaderParser parser_;
};

} // namespace userjs
