#pragma once

#include "ILLMAdapter.hpp"
#include "ProviderTypes.hpp"
#include <memory>

/**
 * Maps an LLMProvider to its adapter.
 */
class ProviderFactory {
public:
    /**
     * Adapters are stateless; the returned instance may be shared freely
     * between threads and calls.
     */
    static std::shared_ptr<const ILLMAdapter> create_adapter(LLMProvider provider);
};
