#pragma once

#include "habitat_seg/model/model_config.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace habitat_seg::model {

// Index of model configs by name and revision. Revisions are date based,
// so the lexicographically greatest one is the latest.
class ModelRegistry {
public:
    // Registers every *.json in `dir`; throws ConfigError on a bad file.
    static ModelRegistry from_config_dir(const fs::path& dir);

    // Replaces an existing entry with the same name and revision.
    void register_model(const ModelConfig& cfg);

    std::vector<std::pair<std::string, std::string>> list_models() const;
    std::vector<std::string> list_model_names() const;
    std::vector<std::string> revisions(const std::string& name) const;
    std::string latest_revision(const std::string& name) const;

    // Latest revision, or an exact one. Unknown names or revisions throw
    // ConfigError listing what is available.
    const ModelConfig& get(const std::string& name) const;
    const ModelConfig& get(const std::string& name, const std::string& revision) const;

    bool contains(const std::string& name) const;
    bool contains(const std::string& name, const std::string& revision) const;

    size_t size() const;
    bool empty() const { return models_.empty(); }

private:
    std::map<std::string, std::map<std::string, ModelConfig>> models_;
};

} // namespace habitat_seg::model
