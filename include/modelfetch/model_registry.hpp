#pragma once

#include "download_record.hpp"
#include "state_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace modelfetch {

// Models the user linked from elsewhere on disk. They are listed next to the
// downloaded ones but never copied, moved or deleted; the list is one JSON
// array under its own key.
class ExternalModelRegistry {
public:
    static constexpr const char* kRegistryKey = "modelfetch.external_models";

    explicit ExternalModelRegistry(StateStore& store);

    // An unreadable list is logged and treated as empty.
    void load();

    // Both throw PersistenceError and leave the list unchanged on failure.
    void add(StoredModel model);
    bool removeByPath(const std::string& path);
    void clear();

    [[nodiscard]] const std::vector<StoredModel>& models() const noexcept { return models_; }
    [[nodiscard]] std::optional<StoredModel> findByName(const std::string& name) const;
    [[nodiscard]] std::optional<StoredModel> findByPath(const std::string& path) const;

private:
    void save(const std::vector<StoredModel>& models);

    StateStore& store_;
    std::vector<StoredModel> models_;
};

} // namespace modelfetch
