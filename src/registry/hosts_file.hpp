/**
 * @file hosts_file.hpp
 * @brief Keeps a managed block of discovered hosts inside a hosts(5) file.
 *
 * Lines between the BEGIN and END markers belong to LanBeacon and are
 * regenerated on every sync. Everything outside the block is preserved
 * byte for byte, and the block is always written at the end of the file.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lan_beacon {

inline constexpr std::string_view HOSTS_BEGIN_MARKER = "# BEGIN LANBEACON MANAGED HOSTS";
inline constexpr std::string_view HOSTS_END_MARKER = "# END LANBEACON MANAGED HOSTS";

class HostsFileSync {
public:
    explicit HostsFileSync(std::filesystem::path path);

    /// Rewrite the managed block from @p records.
    Result<void> sync(const std::vector<HostRecord>& records);

    /**
     * @brief Produce the new file content.
     *
     * Records whose IP address is not dotted IPv4, or whose hostname is
     * empty or holds anything besides letters, digits, '-', '.' and '_',
     * are left out. The output
     * always ends with a newline, and rendering its own output again yields
     * the same text.
     */
    static std::string render(std::string_view existing, const std::vector<HostRecord>& records);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

}  // namespace lan_beacon
