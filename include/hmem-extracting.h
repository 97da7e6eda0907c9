#pragma once

#include "ggml.h"
#include "hmem-common.h"

#ifdef __cplusplus
extern "C" {
#endif

// Entity extraction
// Time-distributed dense projection of encoded sentences to memory_size entity
// vectors: y = act(K x), no bias, weights shared across sentence positions.
struct hmem_extracting {
    int32_t n_embd;
    int32_t n_units;                 // memory_size
    enum hmem_activation activation;
    float l2;                        // weight penalty coefficient
    struct ggml_tensor * kernel;     // [n_embd, n_units]
};

enum hmem_status hmem_extracting_init(
    struct ggml_context    * ctx,
    int32_t                  n_embd,
    int32_t                  n_units,
    enum hmem_activation     activation,
    float                    l2,
    struct hmem_rng        * rng,
    struct hmem_extracting * out
);

// x: [n_embd, n_sentences, n_batch] -> [n_units, n_sentences, n_batch]
enum hmem_status hmem_extracting_apply(
    struct ggml_context          * ctx,
    const struct hmem_extracting * extracting,
    struct ggml_tensor           * x,
    struct ggml_tensor          ** out
);

struct ggml_tensor * hmem_extracting_l2(
    struct ggml_context          * ctx,
    const struct hmem_extracting * extracting
);

#ifdef __cplusplus
}
#endif
