#include "pipeline_config.hpp"

#include "mapped_file.hpp"
#include "tools.hpp"

#include <ryml.hpp>
#include <ryml_std.hpp>

#include <stdexcept>


//------------------------------------------------------------------------------
// YAML helpers

static const char* const kKnownKeys[] = {
    "alphabet", "collator", "pad", "backwards", "seed",
    "bucket_size", "num_shards", "shard_rank", "max_tokens", "max_batch",
    "structure", "p_drop_structure", "n_connections",
    "mask_fraction", "keep_fraction", "replace_fraction", "log_level",
};

struct YamlParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// rapidyaml requires the error callback not to return; the default one aborts
static void OnYamlError(const char* msg, size_t msg_len, ryml::Location location, void* /*user_data*/)
{
    throw YamlParseError(std::string(msg, msg_len) + " at line " + std::to_string(location.line));
}

// Routes rapidyaml errors to OnYamlError while in scope
class ScopedYamlErrorHandler {
public:
    ScopedYamlErrorHandler()
        : previous_(ryml::get_callbacks())
    {
        ryml::Callbacks callbacks = previous_;
        callbacks.m_error = &OnYamlError;
        ryml::set_callbacks(callbacks);
    }
    ~ScopedYamlErrorHandler() {
        ryml::set_callbacks(previous_);
    }

private:
    ryml::Callbacks previous_;
};

// Leaves value_out untouched when the key is absent
template<typename T>
static bool ReadKey(ryml::ConstNodeRef root, const char* key, T& value_out)
{
    const ryml::csubstr name = ryml::to_csubstr(key);
    if (!root.has_child(name)) {
        return true;
    }

    ryml::ConstNodeRef node = root[name];
    if (!node.is_keyval()) {
        LOG_ERROR() << "PipelineConfig: '" << key << "' must be a scalar";
        return false;
    }
    if (!ryml::from_chars(node.val(), &value_out)) {
        LOG_ERROR() << "PipelineConfig: invalid value for '" << key << "': " << std::string(node.val().str, node.val().len);
        return false;
    }
    return true;
}


//------------------------------------------------------------------------------
// PipelineConfig

bool PipelineConfig::ReadYamlFile(const std::string& path)
{
    MappedFileReader reader;
    if (!reader.Open(path)) {
        LOG_ERROR() << "Failed to open config file at " << path;
        return false;
    }

    const std::string text(reader.GetData() ? reader.GetData() : "", reader.GetSize());
    if (!ParseYaml(text)) {
        LOG_ERROR() << "Invalid config file " << path;
        return false;
    }

    return true;
}

bool PipelineConfig::ParseYaml(const std::string& text)
{
    // An empty document keeps every default
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Validate();
    }

    ScopedYamlErrorHandler handler;

    ryml::Tree tree;
    try {
        tree = ryml::parse_in_arena(ryml::to_csubstr(text));
    } catch (const YamlParseError& e) {
        LOG_ERROR() << "PipelineConfig: malformed YAML: " << e.what();
        return false;
    }
    ryml::ConstNodeRef root = tree.crootref();
    if (!root.is_map()) {
        LOG_ERROR() << "PipelineConfig: top level must be a mapping";
        return false;
    }

    for (ryml::ConstNodeRef child : root.children()) {
        const std::string key(child.key().str, child.key().len);
        bool known = false;
        for (const char* name : kKnownKeys) {
            if (key == name) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN() << "PipelineConfig: ignoring unknown key '" << key << "'";
        }
    }

    std::string collator_name = CollatorKindString(Collator.Kind);
    std::string log_level_name;

    if (!ReadKey(root, "alphabet", Alphabet) ||
        !ReadKey(root, "collator", collator_name) ||
        !ReadKey(root, "pad", Collator.Pad) ||
        !ReadKey(root, "backwards", Collator.Backwards) ||
        !ReadKey(root, "seed", Collator.Seed) ||
        !ReadKey(root, "mask_fraction", Collator.MaskFraction) ||
        !ReadKey(root, "keep_fraction", Collator.KeepFraction) ||
        !ReadKey(root, "replace_fraction", Collator.ReplaceFraction) ||
        !ReadKey(root, "bucket_size", BucketSize) ||
        !ReadKey(root, "num_shards", NumShards) ||
        !ReadKey(root, "shard_rank", ShardRank) ||
        !ReadKey(root, "max_tokens", MaxTokens) ||
        !ReadKey(root, "max_batch", MaxBatch) ||
        !ReadKey(root, "structure", UseStructure) ||
        !ReadKey(root, "p_drop_structure", PDropStructure) ||
        !ReadKey(root, "n_connections", NConnections) ||
        !ReadKey(root, "log_level", log_level_name)) {
        return false;
    }

    if (!ParseCollatorKind(collator_name, Collator.Kind)) {
        LOG_ERROR() << "PipelineConfig: unknown collator '" << collator_name << "'";
        return false;
    }

    if (!log_level_name.empty() && !Logger::ParseLogLevel(log_level_name, Verbosity)) {
        LOG_ERROR() << "PipelineConfig: unknown log_level '" << log_level_name << "'";
        return false;
    }

    return Validate();
}

bool PipelineConfig::Validate() const
{
    if (Alphabet.empty()) {
        LOG_ERROR() << "PipelineConfig: alphabet is empty";
        return false;
    }
    if (BucketSize == 0) {
        LOG_ERROR() << "PipelineConfig: bucket_size must be positive";
        return false;
    }
    if (NumShards == 0 || ShardRank >= NumShards) {
        LOG_ERROR() << "PipelineConfig: shard_rank " << ShardRank << " is not below num_shards " << NumShards;
        return false;
    }
    if (MaxTokens == 0 || MaxBatch == 0) {
        LOG_ERROR() << "PipelineConfig: max_tokens and max_batch must be positive";
        return false;
    }
    if (PDropStructure < 0.0 || PDropStructure > 1.0) {
        LOG_ERROR() << "PipelineConfig: p_drop_structure must be in [0, 1]";
        return false;
    }
    if (NConnections == 0) {
        LOG_ERROR() << "PipelineConfig: n_connections must be positive";
        return false;
    }
    return true;
}
