#pragma once

#include "history/HistoryRecorder.hpp"

namespace lc::history {

// Inserts into transfer_history. Requires db::Transactions to be initialized.
class PostgresHistory final : public HistoryRecorder {
public:
    void record(const types::History& entry) override;
};

}
