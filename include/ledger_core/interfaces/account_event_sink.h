#pragma once

#include "ledger_core/contracts/account_event.h"

namespace ledger_core {

class IAccountEventSink {
public:
    virtual ~IAccountEventSink() = default;
    virtual bool Append(const AccountEvent& event) = 0;
    virtual bool Flush() = 0;
};

}  // namespace ledger_core
