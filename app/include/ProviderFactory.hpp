#pragma once

#include "IProvider.hpp"
#include "ITransport.hpp"
#include "RequestExecutor.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * Factory for creating provider adapters by handler name
 */
class ProviderFactory {
public:
    /**
     * Create the adapter for a handler
     * @param handler Handler identifier ("openai", "gigachat", ...)
     * @param transport Transport shared by the adapter's executor
     * @param retry_policy Connection retry policy for the adapter
     * @return Adapter instance, or nullptr for an unknown handler
     */
    static ProviderPtr create(const std::string& handler,
                              TransportPtr transport,
                              RetryPolicy retry_policy = {});

    /**
     * Whether create() knows the handler
     */
    static bool is_known_handler(const std::string& handler);

    /**
     * All handler identifiers
     */
    static const std::vector<std::string>& known_handlers();
};
