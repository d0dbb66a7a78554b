#include "workflow_engine/service_management/service_manager_impl.h"
#include "common_utils/utilities/logging_utils.h"

#include <string>

namespace archflow::workflow_engine::service_management {

std::shared_ptr<void> ServiceManagerImpl::getServiceInternal(std::type_index serviceType) {
    std::lock_guard<std::mutex> lock(mutex_);

    // 1. already created
    auto it = services_.find(serviceType);
    if (it != services_.end()) {
        return it->second;
    }

    // 2. lazy creation through a registered factory
    auto factory_it = serviceFactories_.find(serviceType);
    if (factory_it == serviceFactories_.end()) {
        ARCHFLOW_LOG_DEBUG(ServiceManager, "Service not registered: {}", serviceType.name());
        return nullptr;
    }

    ARCHFLOW_LOG_INFO(ServiceManager, "Lazily creating service '{}'", serviceType.name());
    try {
        auto instance = factory_it->second();
        // cached even when null so a failing factory is not retried
        services_[serviceType] = instance;
        if (!instance) {
            ARCHFLOW_LOG_WARN(ServiceManager, "Service '{}' factory returned nullptr.", serviceType.name());
        }
        return instance;
    } catch (const std::exception& e) {
        ARCHFLOW_LOG_ERROR(ServiceManager, "Failed to create service '{}': {}", serviceType.name(), e.what());
        services_[serviceType] = nullptr;
        return nullptr;
    }
}

} // namespace archflow::workflow_engine::service_management
