#pragma once

#include <ids/id.hpp>

namespace Ids
{
    // Identifies one connected remote session. Backends with the same session id share storage.
    using SessionId = Id<struct SessionIdTag>;
    // Identifies one transfer or delete run in the logs.
    using TransferId = Id<struct TransferIdTag>;

    inline SessionId generateSessionId()
    {
        return SessionId::generate();
    }

    inline TransferId generateTransferId()
    {
        return TransferId::generate();
    }
}
