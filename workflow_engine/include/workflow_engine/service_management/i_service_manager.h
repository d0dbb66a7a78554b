#pragma once

#include <memory>
#include <typeindex>

namespace archflow::workflow_engine::service_management {

    /**
     * @brief Host service locator
     * @details Gives operations typed access to host-owned services (for example
     *          the open building document) without the engine knowing their types.
     *          Implementations are thread-safe.
     */
    class IServiceManager {
    public:
        virtual ~IServiceManager() = default;

        /**
         * @brief Returns the service registered for an interface type.
         * @tparam ServiceInterface Interface type the service was registered under
         * @return The instance, or nullptr if nothing is registered for the type
         */
        template<typename ServiceInterface>
        std::shared_ptr<ServiceInterface> getService() {
            return std::static_pointer_cast<ServiceInterface>(getServiceInternal(typeid(ServiceInterface)));
        }

    protected:
        virtual std::shared_ptr<void> getServiceInternal(std::type_index serviceType) = 0;
    };

} // namespace archflow::workflow_engine::service_management
