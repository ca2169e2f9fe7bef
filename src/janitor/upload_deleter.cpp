#include "janitor/upload_deleter.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <unistd.h>
#include <unordered_set>
#include <utility>

namespace janitor {

namespace fs = std::filesystem;

RemovalOutcome RemoveUploadFile(const fs::path& path) {
    if (::unlink(path.c_str()) == 0) {
        return {RemovalStatus::Removed, Result::Ok()};
    }
    const int e = errno;
    if (e == ENOENT) {
        return {RemovalStatus::Missing, Result::Ok()};
    }
    return {RemovalStatus::Failed,
            Result::FromErrno(e, "unlink " + path.string())};
}

UploadDeleter::UploadDeleter(UploadPathResolver resolver, DeleteOptions opts)
    : resolver_(std::move(resolver)), opts_(opts) {}

RemovalOutcome UploadDeleter::RemoveFile(const fs::path& path) const {
    return RemoveUploadFile(path);
}

DeletionReport UploadDeleter::DeleteLocalUploads(const std::vector<std::string>& urls) const {
    DeletionReport report;

    std::unordered_set<std::string> unique_urls;
    for (const auto& u : urls) {
        if (!IsBlank(u)) unique_urls.insert(u);
    }

    std::unordered_set<std::string> seen_paths;
    for (const auto& url : unique_urls) {
        const auto path = resolver_.Resolve(url);
        if (!path) continue;

        const std::string path_str = path->string();
        if (!seen_paths.insert(path_str).second) continue;
        report.candidates.push_back(path_str);

        std::error_code ec;
        const bool exists = fs::exists(*path, ec);
        if (ec) {
            LogWarn("cannot stat %s: %s", path_str.c_str(), ec.message().c_str());
            continue;
        }
        if (!exists) {
            LogDebug("already absent: %s", path_str.c_str());
            continue;
        }

        if (opts_.dry_run) {
            LogInfo("would remove %s", path_str.c_str());
            report.removed.push_back(path_str);
            continue;
        }

        const auto outcome = RemoveFile(*path);
        switch (outcome.status) {
            case RemovalStatus::Removed:
                LogInfo("removed %s", path_str.c_str());
                report.removed.push_back(path_str);
                break;
            case RemovalStatus::Missing:
                LogDebug("removed concurrently: %s", path_str.c_str());
                report.removed.push_back(path_str);
                break;
            case RemovalStatus::Failed:
                LogWarn("%s", outcome.detail.msg.c_str());
                break;
        }
    }

    if (opts_.sort_results) {
        std::sort(report.removed.begin(), report.removed.end());
        std::sort(report.candidates.begin(), report.candidates.end());
    }
    return report;
}

} // namespace janitor
