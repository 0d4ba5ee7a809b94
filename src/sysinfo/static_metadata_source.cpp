/**
 * @file static_metadata_source.cpp
 * @brief StaticMetadataSource: fixed snapshot for tests and demos.
 */

#include "sysinfo/metadata_source.hpp"

#include <chrono>

namespace lan_beacon {

StaticMetadataSource::StaticMetadataSource(HostMetadata snapshot)
    : snapshot_(std::move(snapshot)) {}

Result<HostMetadata> StaticMetadataSource::read() {
    std::lock_guard lock(mutex_);
    if (!failure_.empty()) {
        return Error{ErrorCode::Io, failure_};
    }
    auto metadata = snapshot_;
    metadata.timestamp = to_unix_seconds(std::chrono::system_clock::now());
    return metadata;
}

void StaticMetadataSource::set_snapshot(HostMetadata snapshot) {
    std::lock_guard lock(mutex_);
    snapshot_ = std::move(snapshot);
}

void StaticMetadataSource::set_failure(std::string message) {
    std::lock_guard lock(mutex_);
    failure_ = std::move(message);
}

}  // namespace lan_beacon
