#pragma once

#include <cstdint>
#include <string>

#include "collator.hpp"


//------------------------------------------------------------------------------
// PipelineConfig

/*
    Pipeline settings, usually read from a YAML mapping such as:

        alphabet: "ACDEFGHIKLMNPQRSTVWYBZXJOU-*#@"
        collator: masked          # simple | next_token | masked | ancestor
        pad: true
        backwards: false
        seed: 1
        bucket_size: 1000
        num_shards: 8
        shard_rank: 0
        max_tokens: 6000
        max_batch: 100
        structure: true
        p_drop_structure: 0.1
        n_connections: 20
        mask_fraction: 0.15
        keep_fraction: 0.1
        replace_fraction: 0.1
        log_level: info           # debug | info | warn | error

    Every key is optional.  Unknown keys are ignored with a warning.
*/
struct PipelineConfig {
    std::string Alphabet = SEQBATCH_PROTEIN_ALPHABET;

    CollatorConfig Collator;

    uint32_t BucketSize = 1000;
    uint32_t NumShards = 1;
    uint32_t ShardRank = 0;

    uint32_t MaxTokens = 6000;
    uint32_t MaxBatch = 100;

    bool UseStructure = false;
    double PDropStructure = kDefaultStructureDrop;
    uint32_t NConnections = kDefaultConnections;

    Logger::LogLevel Verbosity = Logger::INFO;

    // Reads the whole file and parses it with ParseYaml()
    bool ReadYamlFile(const std::string& path);

    // Keys not present keep their current values
    bool ParseYaml(const std::string& text);

    // Range checks that do not need the other components
    bool Validate() const;
};
