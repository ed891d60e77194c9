#include "habitat_seg/model/model_registry.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

namespace habitat_seg::model {

ModelRegistry ModelRegistry::from_config_dir(const fs::path& dir) {
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw ConfigError("Model config directory not found: " + dir.string());
    }

    ModelRegistry reg;
    for (const auto& path : core::list_files_with_extension(dir, ".json")) {
        reg.register_model(ModelConfig::load(path));
    }
    return reg;
}

void ModelRegistry::register_model(const ModelConfig& cfg) {
    if (cfg.name.empty() || cfg.revision.empty()) {
        throw ConfigError("model config needs a name and a revision");
    }
    models_[cfg.name][cfg.revision] = cfg;
}

std::vector<std::pair<std::string, std::string>> ModelRegistry::list_models() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, revs] : models_) {
        for (const auto& [rev, cfg] : revs) {
            out.emplace_back(name, rev);
        }
    }
    return out;
}

std::vector<std::string> ModelRegistry::list_model_names() const {
    std::vector<std::string> out;
    for (const auto& [name, revs] : models_) {
        out.push_back(name);
    }
    return out;
}

std::vector<std::string> ModelRegistry::revisions(const std::string& name) const {
    auto it = models_.find(name);
    if (it == models_.end()) {
        throw ConfigError("Model '" + name + "' is not registered. Available: " +
                          core::join(list_model_names(), ", "));
    }
    std::vector<std::string> out;
    for (const auto& [rev, cfg] : it->second) {
        out.push_back(rev);
    }
    return out;
}

std::string ModelRegistry::latest_revision(const std::string& name) const {
    return revisions(name).back();
}

const ModelConfig& ModelRegistry::get(const std::string& name) const {
    return get(name, latest_revision(name));
}

const ModelConfig& ModelRegistry::get(const std::string& name, const std::string& revision) const {
    const auto revs = revisions(name);
    const auto& by_rev = models_.at(name);
    auto it = by_rev.find(revision);
    if (it == by_rev.end()) {
        throw ConfigError("Revision '" + revision + "' of model '" + name +
                          "' is not registered. Available revisions: " + core::join(revs, ", "));
    }
    return it->second;
}

bool ModelRegistry::contains(const std::string& name) const {
    return models_.count(name) > 0;
}

bool ModelRegistry::contains(const std::string& name, const std::string& revision) const {
    auto it = models_.find(name);
    return it != models_.end() && it->second.count(revision) > 0;
}

size_t ModelRegistry::size() const {
    size_t n = 0;
    for (const auto& [name, revs] : models_) {
        n += revs.size();
    }
    return n;
}

} // namespace habitat_seg::model
