#pragma once

#include "registry/source_loader.hpp"

namespace scriptbox::registry {

// Delegates execution to another HTTP execution service.
class RemoteServerLoader : public SourceLoader {
public:
    explicit RemoteServerLoader(int default_timeout_s);

    SourceType Type() const override { return SourceType::kRemoteServer; }
    ScriptOutcome LoadAndRun(const ScriptRegistryEntry& entry,
                             const nlohmann::json& input_data) const override;

private:
    int default_timeout_s_;
};

}  // namespace scriptbox::registry
