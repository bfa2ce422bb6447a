#include <coderag/core/atomic_file.h>
#include <coderag/session/session_context.h>

#include <spdlog/spdlog.h>

namespace coderag::session {

using json = nlohmann::json;

SessionContext::SessionContext(std::filesystem::path path) : path_(std::move(path)) {}

Result<json> SessionContext::loadLocked() const {
    auto text = readFile(path_);
    if (!text) {
        return text.error();
    }
    try {
        auto data = json::parse(text.value());
        if (!data.is_object()) {
            return Error{ErrorCode::CorruptedData, path_.string() + " is not a JSON object"};
        }
        return data;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, path_.string() + ": " + e.what()};
    }
}

Result<void> SessionContext::writeLocked(const json& data) {
    return atomicWrite(path_, data.dump(2, ' ', false, json::error_handler_t::replace));
}

Result<void> SessionContext::save(const std::string& repo_url, const json& global_context) {
    std::lock_guard<std::mutex> lock(mutex_);
    json data = json::object();
    if (auto existing = loadLocked(); existing) {
        data = std::move(existing).value();
    } else if (existing.error().code == ErrorCode::CorruptedData) {
        spdlog::warn("Overwriting unreadable context {}: {}", path_.string(),
                     existing.error().message);
    }
    data["repo_url"] = repo_url;
    data["global_context"] = global_context.is_null() ? json::object() : global_context;
    return writeLocked(data);
}

Result<json> SessionContext::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadLocked();
}

Result<void> SessionContext::saveReport(const std::string& report, const std::string& language) {
    std::lock_guard<std::mutex> lock(mutex_);
    json data = json::object();
    if (auto existing = loadLocked(); existing) {
        data = std::move(existing).value();
    }
    if (!data.contains("reports") || !data["reports"].is_object()) {
        data["reports"] = json::object();
    }
    data["reports"][language] = report;
    data["report"] = report;
    data["report_language"] = language;
    auto written = writeLocked(data);
    if (written) {
        spdlog::info("Report saved: {} ({})", path_.stem().string(), language);
    }
    return written;
}

std::optional<std::string> SessionContext::report(const std::string& language) const {
    auto data = load();
    if (!data) {
        return std::nullopt;
    }
    const auto& ctx = data.value();
    if (auto reports = ctx.find("reports"); reports != ctx.end() && reports->is_object()) {
        if (auto it = reports->find(language); it != reports->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    if (auto legacy = ctx.find("report"); legacy != ctx.end() && legacy->is_string()) {
        std::string stored = ctx.value("report_language", std::string("en"));
        if (stored == language) {
            return legacy->get<std::string>();
        }
    }
    return std::nullopt;
}

std::vector<std::string> SessionContext::availableLanguages() const {
    std::vector<std::string> languages;
    auto data = load();
    if (!data) {
        return languages;
    }
    const auto& ctx = data.value();
    if (auto reports = ctx.find("reports"); reports != ctx.end() && reports->is_object()) {
        for (auto it = reports->begin(); it != reports->end(); ++it) {
            languages.push_back(it.key());
        }
    }
    return languages;
}

bool SessionContext::hasIndex() const {
    auto data = load();
    if (!data) {
        return false;
    }
    auto url = data.value().find("repo_url");
    return url != data.value().end() && !url->is_null();
}

Result<void> SessionContext::remove() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, "Cannot remove " + path_.string() + ": " +
                                                      ec.message()};
    }
    return {};
}

} // namespace coderag::session
