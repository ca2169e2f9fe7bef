#pragma once

#include "janitor/upload_path_resolver.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace janitor {

// Outcome of one batch. `removed` is always a subset of `candidates`; both
// hold absolute paths below the uploads root. Entry order is unspecified
// unless DeleteOptions::sort_results is set.
struct DeletionReport {
    std::vector<std::string> removed;
    std::vector<std::string> candidates;
};

struct DeleteOptions {
    bool sort_results = false;
    bool dry_run = false; // report what would be removed, unlink nothing
};

enum class RemovalStatus {
    Removed,
    Missing, // vanished before unlink, counts as removed
    Failed,
};

struct RemovalOutcome {
    RemovalStatus status{RemovalStatus::Removed};
    Result detail;
};

// unlink(2) a single file. ENOENT is reported as Missing, everything else
// (EACCES, EISDIR, EBUSY...) as Failed with errno in detail.err.
RemovalOutcome RemoveUploadFile(const std::filesystem::path& path);

class UploadDeleter {
  public:
    explicit UploadDeleter(UploadPathResolver resolver, DeleteOptions opts = {});
    virtual ~UploadDeleter() = default;

    // Never throws on filesystem errors; per-file failures only show up as
    // a candidate missing from `removed`.
    DeletionReport DeleteLocalUploads(const std::vector<std::string>& urls) const;

    const UploadPathResolver& Resolver() const { return resolver_; }

  protected:
    // Called once per existing candidate. Defaults to RemoveUploadFile.
    virtual RemovalOutcome RemoveFile(const std::filesystem::path& path) const;

  private:
    UploadPathResolver resolver_;
    DeleteOptions opts_;
};

} // namespace janitor
