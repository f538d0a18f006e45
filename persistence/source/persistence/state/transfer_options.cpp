#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    namespace
    {
        constexpr std::size_t defaultChunkSize = 8192;
        constexpr int defaultOperationTimeoutSeconds = 30;
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        fillUnset(chunkSize, other.chunkSize);
        fillUnset(operationTimeoutSeconds, other.operationTimeoutSeconds);
    }

    std::size_t TransferOptions::effectiveChunkSize() const
    {
        if (!chunkSize || *chunkSize == 0)
            return defaultChunkSize;
        return *chunkSize;
    }

    std::chrono::seconds TransferOptions::effectiveOperationTimeout() const
    {
        if (!operationTimeoutSeconds || *operationTimeoutSeconds <= 0)
            return std::chrono::seconds{defaultOperationTimeoutSeconds};
        return std::chrono::seconds{*operationTimeoutSeconds};
    }

    TransferOptions TransferOptions::defaults()
    {
        return TransferOptions{
            .chunkSize = defaultChunkSize,
            .operationTimeoutSeconds = defaultOperationTimeoutSeconds,
        };
    }

    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        writeOptional(j, "chunkSize", options.chunkSize);
        writeOptional(j, "operationTimeoutSeconds", options.operationTimeoutSeconds);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        readOptional(j, "chunkSize", options.chunkSize);
        readOptional(j, "operationTimeoutSeconds", options.operationTimeoutSeconds);
    }
}
