#pragma once

#include "workflow_engine/service_management/i_service_manager.h"

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>

namespace archflow::workflow_engine::service_management {

    /**
     * @brief Thread-safe, lazily loading IServiceManager.
     */
    class ServiceManagerImpl : public IServiceManager {
    public:
        ServiceManagerImpl() = default;
        ~ServiceManagerImpl() override = default;

        /**
         * @brief Registers an existing instance under an interface type.
         */
        template<typename ServiceInterface>
        void registerService(std::shared_ptr<ServiceInterface> instance) {
            std::lock_guard<std::mutex> lock(mutex_);
            services_[typeid(ServiceInterface)] = std::static_pointer_cast<void>(std::move(instance));
        }

        /**
         * @brief Registers a factory called on first lookup of the interface type.
         */
        template<typename ServiceInterface>
        void registerServiceFactory(std::function<std::shared_ptr<ServiceInterface>()> factory) {
            std::lock_guard<std::mutex> lock(mutex_);
            serviceFactories_[typeid(ServiceInterface)] = [factory]() -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(factory());
            };
        }

    protected:
        std::shared_ptr<void> getServiceInternal(std::type_index serviceType) override;

    private:
        std::mutex mutex_;

        // created instances
        std::unordered_map<std::type_index, std::shared_ptr<void>> services_;

        using ServiceFactory = std::function<std::shared_ptr<void>()>;
        std::unordered_map<std::type_index, ServiceFactory> serviceFactories_;
    };

} // namespace archflow::workflow_engine::service_management
