#include <coderag/session/session_id.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <chrono>
#include <random>
#include <vector>

namespace coderag::session {

namespace {

std::string toHex(const unsigned char* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view stripGitSuffix(std::string_view path) {
    constexpr std::string_view kGit = ".git";
    if (path.size() >= kGit.size() && path.substr(path.size() - kGit.size()) == kGit) {
        path.remove_suffix(kGit.size());
    }
    return path;
}

std::string alnumPrefix(std::string_view s, std::size_t limit) {
    std::string out;
    for (char c : s) {
        if (out.size() >= limit) {
            break;
        }
        if (std::isalnum(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string normalizeRepoUrl(std::string_view url) {
    url = trim(url);

    constexpr std::string_view kSshPrefix = "git@github.com:";
    if (url.substr(0, kSshPrefix.size()) == kSshPrefix) {
        auto path = stripGitSuffix(url.substr(kSshPrefix.size()));
        if (!path.empty()) {
            return "https://github.com/" + std::string(path);
        }
    }

    // Path component: drop scheme and authority when present
    std::string_view path = url;
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view() : path.substr(slash);
    }
    if (auto cut = path.find_first_of("?#"); cut != std::string_view::npos) {
        path = path.substr(0, cut);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    path = stripGitSuffix(path);

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }

    std::string normalized(path);
    if (parts.size() >= 2) {
        normalized = std::string(parts[0]) + "/" + std::string(parts[1]);
    }
    return "https://github.com/" + normalized;
}

std::pair<std::string, std::string> extractRepoInfo(std::string_view url) {
    constexpr std::string_view kPrefix = "https://github.com/";
    std::string normalized = normalizeRepoUrl(url);
    std::string_view path = std::string_view(normalized).substr(kPrefix.size());
    auto slash = path.find('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return {std::string(path.substr(0, slash)), std::string(path.substr(slash + 1))};
}

std::string repoSessionId(std::string_view url) {
    std::string normalized = normalizeRepoUrl(url);
    auto [owner, repo] = extractRepoInfo(url);
    return "repo_" + sha256Hex(normalized).substr(0, 8) + "_" + alnumPrefix(owner, 10) + "_" +
           alnumPrefix(repo, 15);
}

std::string chatSessionId() {
    std::array<unsigned char, 8> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        std::random_device rd;
        std::mt19937_64 gen(rd() ^ static_cast<std::uint64_t>(
                                       std::chrono::steady_clock::now().time_since_epoch().count()));
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(gen() & 0xff);
        }
    }
    return "chat_" + toHex(bytes.data(), bytes.size());
}

bool isRepoSessionId(std::string_view session_id) {
    return session_id.substr(0, 5) == "repo_";
}

Result<std::string> sanitizeSessionId(std::string_view session_id) {
    std::string clean;
    clean.reserve(session_id.size());
    for (char c : session_id) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            clean.push_back(c);
        }
    }
    if (clean.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid session id: '" + std::string(session_id) + "'"};
    }
    return clean;
}

std::string sha256Hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return toHex(digest, length);
}

} // namespace coderag::session
