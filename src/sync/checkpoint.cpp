#include "dfm/sync/checkpoint.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace dfm::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path TransferCheckpoint::sidecar_path(const fs::path& destination) {
    fs::path sidecar = destination;
    sidecar += kSuffix;
    return sidecar;
}

CheckpointState TransferCheckpoint::load(const fs::path& destination) const {
    CheckpointState state{destination, 0};
    const auto sidecar = sidecar_path(destination);

    std::ifstream input(sidecar);
    if (!input) {
        return state;
    }

    const json doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("position") ||
        !doc["position"].is_number_unsigned()) {
        spdlog::warn("Ignoring corrupt checkpoint {}", sidecar.string());
        return state;
    }

    state.last_committed_offset = doc["position"].get<std::uint64_t>();
    return state;
}

void TransferCheckpoint::save(const fs::path& destination, std::uint64_t offset) const {
    const auto sidecar = sidecar_path(destination);
    std::ofstream output(sidecar, std::ios::trunc);
    if (!output) {
        spdlog::warn("Failed to open checkpoint {} for writing", sidecar.string());
        return;
    }
    output << json{{"position", offset}}.dump();
    output.flush();
    if (!output) {
        spdlog::warn("Failed to write checkpoint {}", sidecar.string());
    }
}

void TransferCheckpoint::clear(const fs::path& destination) const {
    const auto sidecar = sidecar_path(destination);
    std::error_code ec;
    fs::remove(sidecar, ec);
    if (ec) {
        spdlog::warn("Failed to remove checkpoint {}: {}", sidecar.string(), ec.message());
    }
}

} // namespace dfm::sync
