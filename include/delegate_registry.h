#pragma once

#include "delegate.h"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace conductor {

/**
 * @brief Name -> Delegate table consulted by a reasoning loop
 *
 * Populated at startup (see delegate_manifest.h) and read-only afterwards.
 */
class DelegateRegistry {
public:
    /**
     * @brief Register a delegate
     * @return true if registered, false if null or a delegate with the same name exists
     */
    bool register_delegate(std::shared_ptr<Delegate> delegate);

    /**
     * @brief Get a delegate by name
     * @return Delegate, or nullptr if not found
     */
    std::shared_ptr<Delegate> get(const std::string& name) const;

    bool has(const std::string& name) const;

    /// Sorted names
    std::vector<std::string> names() const;

    /**
     * @brief Catalogue text listing every delegate with type, description and usage
     *
     * Empty when no delegates are registered.
     */
    std::string catalogue() const;

    size_t size() const { return delegates_.size(); }

    void clear();

private:
    std::map<std::string, std::shared_ptr<Delegate>> delegates_;
};

} // namespace conductor
