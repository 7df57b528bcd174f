#include "modelfetch/model_registry.hpp"

#include "modelfetch/errors.hpp"
#include "modelfetch/log.hpp"

#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace modelfetch {

namespace {

using nlohmann::json;

// 相对路径与 "a/../b" 之类的写法统一成绝对路径再比较
std::string normalizedPath(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal().string();
}

} // namespace

ExternalModelRegistry::ExternalModelRegistry(StateStore& store) : store_(store) {}

void ExternalModelRegistry::load() {
    models_.clear();
    const auto text = store_.get(kRegistryKey);
    if (!text) {
        return;
    }

    const auto document = json::parse(*text, nullptr, false);
    if (!document.is_array()) {
        MODELFETCH_ERROR("External model list is unreadable, ignoring it");
        return;
    }
    for (const auto& entry : document) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() || !entry.contains("path") ||
            !entry["path"].is_string()) {
            MODELFETCH_WARN("Skipping malformed external model entry");
            continue;
        }
        StoredModel model;
        model.name = entry["name"].get<std::string>();
        model.path = entry["path"].get<std::string>();
        if (entry.contains("size") && entry["size"].is_number_unsigned()) {
            model.size = entry["size"].get<std::uint64_t>();
        }
        if (entry.contains("modified") && entry["modified"].is_string()) {
            model.modified = entry["modified"].get<std::string>();
        }
        model.is_external = true;
        models_.push_back(std::move(model));
    }
}

void ExternalModelRegistry::add(StoredModel model) {
    model.path = normalizedPath(model.path);
    model.is_external = true;
    auto next = models_;
    next.push_back(std::move(model));
    save(next);
    models_ = std::move(next);
}

bool ExternalModelRegistry::removeByPath(const std::string& path) {
    const auto wanted = normalizedPath(path);
    auto next = models_;
    const auto it = std::find_if(next.begin(), next.end(),
                                 [&](const StoredModel& model) { return model.path == wanted; });
    if (it == next.end()) {
        return false;
    }
    next.erase(it);
    save(next);
    models_ = std::move(next);
    return true;
}

void ExternalModelRegistry::clear() {
    if (models_.empty()) {
        return;
    }
    save({});
    models_.clear();
}

std::optional<StoredModel> ExternalModelRegistry::findByName(const std::string& name) const {
    for (const auto& model : models_) {
        if (model.name == name) {
            return model;
        }
    }
    return std::nullopt;
}

std::optional<StoredModel> ExternalModelRegistry::findByPath(const std::string& path) const {
    const auto wanted = normalizedPath(path);
    for (const auto& model : models_) {
        if (model.path == wanted) {
            return model;
        }
    }
    return std::nullopt;
}

void ExternalModelRegistry::save(const std::vector<StoredModel>& models) {
    json document = json::array();
    for (const auto& model : models) {
        document.push_back(json{
            {"name", model.name},
            {"path", model.path},
            {"size", model.size},
            {"modified", model.modified},
        });
    }

    std::string text;
    try {
        text = document.dump();
    } catch (const json::exception& ex) {
        throw PersistenceError(std::string("Cannot encode external model list: ") + ex.what());
    }
    store_.set(kRegistryKey, text);
}

} // namespace modelfetch
