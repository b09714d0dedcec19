#include "registry/loaders/inline_source_loader.hpp"

namespace scriptbox::registry {

InlineSourceLoader::InlineSourceLoader(const ModuleRunner& runner)
    : runner_(runner) {}

ScriptOutcome InlineSourceLoader::LoadAndRun(const ScriptRegistryEntry& entry,
                                             const nlohmann::json& input_data) const {
    const auto& source = entry.script_content.empty() ? entry.source_location : entry.script_content;
    if (source.empty()) {
        return MakeErrorOutcome(sandbox::ErrorKind::kValidation, "No script content provided", entry.id);
    }
    return runner_.RunSource(source, entry, input_data);
}

}  // namespace scriptbox::registry
