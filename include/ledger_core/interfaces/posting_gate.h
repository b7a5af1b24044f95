#pragma once

#include "ledger_core/common/timestamp.h"

namespace ledger_core {

class IPostingGate {
public:
    virtual ~IPostingGate() = default;
    virtual bool CanPostToDate(const CivilDate& date) const = 0;
};

}  // namespace ledger_core
