#pragma once

#include "hmem-common.h"

#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// H-Mem run configuration
// Mirrors the bAbI single-task command line. Defaults match the reference runs.
struct hmem_config {
    // Paths
    char data_file[512];            // bAbI task file (qaN_*_test.txt)
    char vocab_file[512];           // one word per line, index = line + 1
    char model_file[512];           // GGUF model to load (empty: fresh init)
    char save_file[512];            // GGUF path to save the model to (empty: skip)

    // Data
    int32_t task_id;
    int32_t max_num_sentences;      // -1: longest story in the data
    char    training_set_size[8];   // "1k" or "10k"

    // Training (consumed by the external trainer)
    int32_t epochs;
    float   learning_rate;
    int32_t batch_size_per_replica;
    int32_t random_state;           // < 0: seed from the clock
    float   max_grad_norm;
    float   validation_split;

    // Model
    int32_t hops;
    int32_t memory_size;
    int32_t embeddings_size;
    bool    read_before_write;
    float   gamma_pos;
    float   gamma_neg;
    float   w_assoc_max;
    char    encodings_type[32];     // identity_encoding, position_encoding, learned_encoding

    // Runtime
    int32_t n_threads;
    int32_t verbose;
    bool    logging;
};

// Initialize config with defaults
void hmem_config_init_defaults(struct hmem_config * config);

// Apply HMEM_* environment variables on top of the current values
// (HMEM_HOPS, HMEM_MEMORY_SIZE, HMEM_ENCODINGS_TYPE, ...)
void hmem_config_load_from_env(struct hmem_config * config);

// Load config from a flat JSON object ({"hops": 3, "encodings_type": "..."}).
// Keys not present keep their current value.
// Returns HMEM_STATUS_IO_ERROR if the file cannot be read and
// HMEM_STATUS_CONFIGURATION_ERROR on malformed content or unknown keys.
enum hmem_status hmem_config_load_from_json(struct hmem_config * config, const char * json_path);

// Save config to JSON file
enum hmem_status hmem_config_save_to_json(const struct hmem_config * config, const char * json_path);

// Get config value by key, formatted as text into out
enum hmem_status hmem_config_get(const struct hmem_config * config, const char * key, char * out, size_t out_size);

// Set config value by key from text
// Returns HMEM_STATUS_CONFIGURATION_ERROR for unknown keys or unparsable values
enum hmem_status hmem_config_set(struct hmem_config * config, const char * key, const char * value);

// Parse "--key value" pairs. "--config path" loads a JSON file at that point.
enum hmem_status hmem_config_parse_args(struct hmem_config * config, int argc, char ** argv);

// Check ranges and enumerations
enum hmem_status hmem_config_validate(const struct hmem_config * config);

// Learning rate for an epoch. read_before_write selects the schedule:
//   staged exponential decay after epoch 150, or x0.85 every 20 epochs.
float hmem_config_learning_rate(const struct hmem_config * config, int32_t epoch);

#ifdef __cplusplus
}
#endif
