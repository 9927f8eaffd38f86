#pragma once

#include "dfm/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace dfm::sync {

/**
 * @brief Sidecar recording how far a destination's staging has progressed
 *
 * The sidecar sits beside the destination as `<name>.download` and holds
 * `{"position": N}`. Every operation is best-effort: failures are logged
 * and never reach the caller.
 */
class TransferCheckpoint {
public:
    static constexpr const char* kSuffix = ".download";

    [[nodiscard]] static std::filesystem::path sidecar_path(const std::filesystem::path& destination);

    /// Missing, unreadable or corrupt sidecars load as offset 0
    CheckpointState load(const std::filesystem::path& destination) const;

    void save(const std::filesystem::path& destination, std::uint64_t offset) const;

    void clear(const std::filesystem::path& destination) const;
};

} // namespace dfm::sync
