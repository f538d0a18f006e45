#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <cstddef>
#include <optional>

namespace Persistence
{
    struct TransferOptions
    {
        // Bytes moved per read/write pair.
        std::optional<std::size_t> chunkSize{std::nullopt};
        // How long a single remote call may take before the connection is considered lost.
        std::optional<int> operationTimeoutSeconds{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);

        std::size_t effectiveChunkSize() const;
        std::chrono::seconds effectiveOperationTimeout() const;

        static TransferOptions defaults();
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
