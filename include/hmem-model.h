#pragma once

#include "ggml.h"
#include "hmem-common.h"
#include "hmem-config.h"
#include "hmem-encoding.h"
#include "hmem-extracting.h"
#include "hmem-reading.h"
#include "hmem-writing.h"

#ifdef __cplusplus
extern "C" {
#endif

// H-Mem model
//
//   story [n_words, n_sentences, n_batch] (I32)
//     -> embedding -> encoding -> norm -> extracting -> writing scan  => memory
//   query [n_words, n_hops, n_batch] (I32)
//     -> embedding -> encoding -> norm -> reading scan (memory const) => queried value
//   queried value -> output projection => logits [n_vocab, n_batch]

struct hmem_model_params {
    int32_t n_vocab;          // nil + words + time words
    int32_t n_sentences;      // max_num_sentences
    int32_t n_words;          // max_words (sentences and queries)
    int32_t n_embd;           // embeddings_size
    int32_t n_units;          // memory_size
    int32_t n_hops;

    enum hmem_encoding_type encoding_type;
    bool  read_before_write;
    float gamma_pos;
    float gamma_neg;
    float w_assoc_max;

    enum hmem_activation extracting_activation;
    enum hmem_activation reading_activation;
    float l2;                 // kernel penalty of extracting, writing and reading
    float norm_eps;
};

struct hmem_model {
    struct hmem_model_params params;

    struct ggml_context * ctx;              // owns all weights

    struct ggml_tensor * tok_embd;          // [n_embd, n_vocab]
    struct ggml_tensor * nil_mask;          // [1, n_vocab], zero for the nil word

    struct hmem_encoding encoding;

    struct ggml_tensor * story_norm_w;      // [n_embd]
    struct ggml_tensor * story_norm_b;      // [n_embd]
    struct ggml_tensor * query_norm_w;      // [n_embd]
    struct ggml_tensor * query_norm_b;      // [n_embd]

    struct hmem_extracting   extracting;
    struct hmem_writing_cell writing;
    struct hmem_reading_cell reading;

    struct ggml_tensor * output;            // [n_embd, n_vocab]
};

// Nodes of one forward graph
struct hmem_model_graph {
    struct ggml_tensor * entities;   // [n_units, n_sentences, n_batch]
    struct ggml_tensor * memory;     // [n_embd, n_units, n_batch]
    struct ggml_tensor * queried;    // [n_embd, n_batch]
    struct ggml_tensor * logits;     // [n_vocab, n_batch]
};

void hmem_model_params_init(struct hmem_model_params * params);

// Shape parameters come from the data, the rest from the config
enum hmem_status hmem_model_params_from_config(
    const struct hmem_config  * config,
    int32_t                     n_vocab,
    int32_t                     n_sentences,
    int32_t                     n_words,
    struct hmem_model_params  * out
);

enum hmem_status hmem_model_params_validate(const struct hmem_model_params * params);

// Allocate and initialize all weights (He-uniform from rng)
enum hmem_status hmem_model_init(
    const struct hmem_model_params * params,
    struct hmem_rng                * rng,
    struct hmem_model             ** out
);

void hmem_model_free(struct hmem_model * model);

// Input tensors in a compute context
struct ggml_tensor * hmem_model_new_story(const struct hmem_model * model, struct ggml_context * ctx, int64_t n_batch);
struct ggml_tensor * hmem_model_new_query(const struct hmem_model * model, struct ggml_context * ctx, int64_t n_batch);

// Build the forward graph. All shape checks happen here, before any compute.
enum hmem_status hmem_model_build(
    const struct hmem_model  * model,
    struct ggml_context      * ctx,
    struct ggml_tensor       * story,
    struct ggml_tensor       * query,
    struct hmem_model_graph  * out
);

// Sum of L2 penalties, for an external loss
struct ggml_tensor * hmem_model_l2(const struct hmem_model * model, struct ggml_context * ctx);

// Parameter tensors in a fixed order. Returns the count, writes up to max_tensors.
int32_t hmem_model_get_tensors(const struct hmem_model * model, struct ggml_tensor ** tensors, int32_t max_tensors);

// Bytes a compute context needs for one forward graph over n_batch stories
size_t hmem_model_compute_mem_size(const struct hmem_model_params * params, int64_t n_batch);

// GGUF persistence
enum hmem_status hmem_model_save(const struct hmem_model * model, const char * path);
enum hmem_status hmem_model_load(const char * path, struct hmem_model ** out);

#ifdef __cplusplus
}
#endif
