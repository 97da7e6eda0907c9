#pragma once

#include "ggml.h"
#include "hmem-common.h"
#include "hmem-rnn.h"

#ifdef __cplusplus
extern "C" {
#endif

// Associative memory writer
//
// State: memory matrix W with n_units rows of n_embd values, ggml shape
// [n_embd, n_units, n_batch], zero at the start of every story.
// Input per step: entity vector k [n_units, n_batch].
//
//   v_hat = W^T k                                  (read_before_write only)
//   v     = relu(K_v k)  or  relu(K_v k + K_r v_hat)
//   A     = gamma_pos * (w_assoc_max - W)           association-strength gate
//   D_i   = gamma_neg * k_i^2                       decay gate per row
//   W'    = clip(W + A * (k outer v) - D * W, -w_assoc_max, w_assoc_max)
//
// Output per step: W' (also the carried state).

struct hmem_writing_cell_params {
    int32_t n_units;           // memory_size (rows)
    int32_t n_embd;            // embeddings_size (columns)
    bool    read_before_write;
    float   gamma_pos;
    float   gamma_neg;
    float   w_assoc_max;
    float   l2;
};

struct hmem_writing_cell {
    struct hmem_writing_cell_params params;
    struct ggml_tensor * kernel_v;  // [n_units, n_embd]: entity -> target vector
    struct ggml_tensor * kernel_r;  // [n_embd, n_embd]: predicted content -> target, NULL unless read_before_write
};

void hmem_writing_cell_params_init(struct hmem_writing_cell_params * params, int32_t n_units, int32_t n_embd);

enum hmem_status hmem_writing_cell_init(
    struct ggml_context                   * ctx,
    const struct hmem_writing_cell_params * params,
    struct hmem_rng                       * rng,
    struct hmem_writing_cell              * out
);

// Zero memory [n_embd, n_units, n_batch]
struct ggml_tensor * hmem_writing_cell_initial_state(
    const struct hmem_writing_cell * cell,
    struct ggml_context            * ctx,
    int64_t                          n_batch
);

// One write. memory: [n_embd, n_units, n_batch], entity: [n_units, n_batch]
enum hmem_status hmem_writing_cell_step(
    const struct hmem_writing_cell * cell,
    struct ggml_context            * ctx,
    struct ggml_tensor             * memory,
    struct ggml_tensor             * entity,
    struct hmem_cell_step          * out
);

// Cell view for hmem_rnn_scan (no constant)
struct hmem_cell hmem_writing_cell_as_cell(const struct hmem_writing_cell * cell);

struct ggml_tensor * hmem_writing_cell_l2(
    struct ggml_context            * ctx,
    const struct hmem_writing_cell * cell
);

#ifdef __cplusplus
}
#endif
