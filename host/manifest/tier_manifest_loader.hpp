#pragma once
#include <string>
#include <yaml-cpp/yaml.h>

#include "result.h"
#include "tier_manifest.hpp"

namespace manifest {

class TierManifestLoader {
public:
    inline static constexpr const char* LOG_TAG = "manifest";

    static Result<TierManifest> load(const std::string& path);
    static Result<TierManifest> parse(const YAML::Node& root);
    static Result<void> validate(const TierManifest& m);
};

} // namespace manifest
