#pragma once

#include <string>

#include <orchestrator.pb.h>

namespace Overlook {

/**
 * Outbound calls to the cluster orchestrator.
 * Implementations must not block: results show up later as status events.
 */
class ISchedulerDriver {
public:
    virtual ~ISchedulerDriver() = default;

    // Accepts the offer, launching the task on its agent
    virtual void LaunchTask(const std::string& offer_id,
                            const orchestrator_protocol::TaskInfo& task) = 0;

    virtual void DeclineOffer(const std::string& offer_id) = 0;

    virtual void KillTask(const std::string& task_id) = 0;
};

} // namespace Overlook
