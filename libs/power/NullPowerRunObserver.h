#pragma once
#include "IPowerRunObserver.h"

namespace psepower::diagnostics {

class NullPowerRunObserver : public IPowerRunObserver {
public:
    NullPowerRunObserver() = default;
    ~NullPowerRunObserver() override = default;

    void onReplicationResult(const power::ReplicationResult& /*result*/) override {}
};

} // namespace psepower::diagnostics
