#pragma once

#include <coderag/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coderag::session {

/**
 * @brief JSON side file holding a session's repository context and generated reports.
 *
 * Layout: {"repo_url": ..., "global_context": {...}, "reports": {"<lang>": "..."},
 * "report": ..., "report_language": ...}. The last two mirror the most recent report for
 * readers of the single-report layout. Every write merges into what is already on disk.
 */
class SessionContext {
public:
    explicit SessionContext(std::filesystem::path path);

    Result<void> save(const std::string& repo_url, const nlohmann::json& global_context);

    // FileNotFound when nothing was saved yet, CorruptedData when the file is unreadable
    Result<nlohmann::json> load() const;

    Result<void> saveReport(const std::string& report, const std::string& language = "en");

    std::optional<std::string> report(const std::string& language = "en") const;

    std::vector<std::string> availableLanguages() const;

    // True when a context with a repository URL has been saved
    bool hasIndex() const;

    Result<void> remove();

    const std::filesystem::path& path() const { return path_; }

private:
    Result<nlohmann::json> loadLocked() const;
    Result<void> writeLocked(const nlohmann::json& data);

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace coderag::session
