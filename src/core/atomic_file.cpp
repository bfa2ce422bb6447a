#include <coderag/core/atomic_file.h>

#include <spdlog/spdlog.h>
#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace coderag {

namespace {

std::filesystem::path tempPathFor(const std::filesystem::path& path) {
    static std::atomic<unsigned> counter{0};
    auto name = "." + path.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
                std::to_string(counter.fetch_add(1));
    return path.parent_path() / name;
}

} // namespace

Result<void> atomicWrite(const std::filesystem::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create directory {}: {}", path.parent_path().string(),
                          ec.message());
            return Error{ErrorCode::PermissionDenied, ec.message()};
        }
    }

    auto tempPath = tempPathFor(path);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::PermissionDenied, "Cannot create " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Short write to " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(),
                      ec.message());
        return Error{ErrorCode::WriteError, ec.message()};
    }
    return {};
}

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Error{ErrorCode::FileNotFound, path.string()};
        }
        return Error{ErrorCode::PermissionDenied, "Cannot read " + path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace coderag
