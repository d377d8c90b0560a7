#pragma once
#include "PowerRunTypes.h"

namespace psepower::diagnostics {

class IPowerRunObserver {
public:
    virtual ~IPowerRunObserver() = default;
    virtual void onReplicationResult(const power::ReplicationResult& result) = 0;
};

} // namespace psepower::diagnostics
