/**
 * @file hosts_file.cpp
 * @brief HostsFileSync implementation.
 */

#include "registry/hosts_file.hpp"

#include "network/subnet.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace lan_beacon {

namespace {

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// Letters, digits, '-', '.' and '_'
bool is_valid_hostname(std::string_view name) {
    if (name.empty() || name.size() > 253) return false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '.' && c != '_') return false;
    }
    return true;
}

std::string format_entry(const std::string& ip, const std::string& hostname) {
    std::string entry = ip;
    if (entry.size() < 16) entry.append(16 - entry.size(), ' ');
    entry.push_back(' ');
    entry += hostname;
    return entry;
}

}  // anonymous namespace

HostsFileSync::HostsFileSync(std::filesystem::path path) : path_(std::move(path)) {}

std::string HostsFileSync::render(std::string_view existing,
                                  const std::vector<HostRecord>& records) {
    std::vector<std::string_view> kept;
    bool in_managed = false;

    size_t pos = 0;
    while (pos < existing.size()) {
        auto eol = existing.find('\n', pos);
        auto line = existing.substr(pos, eol == std::string_view::npos ? std::string_view::npos
                                                                         : eol - pos);
        pos = (eol == std::string_view::npos) ? existing.size() : eol + 1;

        auto trimmed = trim(line);
        if (trimmed.starts_with(HOSTS_BEGIN_MARKER)) {
            in_managed = true;
            continue;
        }
        if (trimmed.starts_with(HOSTS_END_MARKER)) {
            in_managed = false;
            continue;
        }
        if (!in_managed) kept.push_back(line);
    }

    std::string out;
    out.reserve(existing.size() + records.size() * 48 + 64);
    for (auto line : kept) {
        out.append(line);
        out.push_back('\n');
    }
    // Separate the block from preserved content by one blank line
    if (!kept.empty() && !kept.back().empty()) {
        out.push_back('\n');
    }

    out.append(HOSTS_BEGIN_MARKER);
    out.push_back('\n');
    for (const auto& record : records) {
        const auto& m = record.metadata;
        // Announced fields are untrusted
        if (!parse_ipv4(m.ip_address) || !is_valid_hostname(m.hostname)) continue;
        out += format_entry(m.ip_address, m.hostname);
        out.push_back('\n');
    }
    out.append(HOSTS_END_MARKER);
    out.push_back('\n');
    return out;
}

Result<void> HostsFileSync::sync(const std::vector<HostRecord>& records) {
    std::lock_guard lock(mutex_);

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot read " + path_.string() + ": "
                                    + std::strerror(errno)};
    }
    std::ostringstream existing;
    existing << in.rdbuf();
    in.close();

    auto content = render(existing.str(), records);

    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::Io, "Cannot write " + path_.string() + ": "
                                    + std::strerror(errno)};
    }
    out << content;
    out.flush();
    if (!out) {
        return Error{ErrorCode::Io, "Short write to " + path_.string()};
    }
    return Result<void>{};
}

}  // namespace lan_beacon
