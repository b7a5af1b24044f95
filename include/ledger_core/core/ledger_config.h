#pragma once

#include <string>

namespace ledger_core {

struct LedgerRuntimeConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
    std::string wal_path;
    int metrics_port{0};
    int executor_worker_threads{2};
};

}  // namespace ledger_core
