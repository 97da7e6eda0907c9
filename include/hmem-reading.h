#pragma once

#include "ggml.h"
#include "hmem-common.h"
#include "hmem-rnn.h"

#ifdef __cplusplus
extern "C" {
#endif

// Multi-hop memory reader
//
// State: reader vector h [n_embd, n_batch], zero before the first hop.
// Constant: memory matrix W [n_embd, n_units, n_batch] from the writer.
// Input per hop: encoded query x [n_embd, n_batch] (the same on every hop).
//
//   q  = K_q x + h
//   p  = softmax(W q)          attention over the n_units memory rows
//   r  = W^T p                 retrieved content
//   h' = act(K_h (q + r))
//
// Output per hop: h'. The last hop's output is the queried value.

struct hmem_reading_cell_params {
    int32_t n_units;                 // memory_size
    int32_t n_embd;                  // embeddings_size
    enum hmem_activation activation;
    float l2;
};

struct hmem_reading_cell {
    struct hmem_reading_cell_params params;
    struct ggml_tensor * kernel_q;   // [n_embd, n_embd]
    struct ggml_tensor * kernel_h;   // [n_embd, n_embd]
};

void hmem_reading_cell_params_init(struct hmem_reading_cell_params * params, int32_t n_units, int32_t n_embd);

enum hmem_status hmem_reading_cell_init(
    struct ggml_context                   * ctx,
    const struct hmem_reading_cell_params * params,
    struct hmem_rng                       * rng,
    struct hmem_reading_cell              * out
);

struct ggml_tensor * hmem_reading_cell_initial_state(
    const struct hmem_reading_cell * cell,
    struct ggml_context            * ctx,
    int64_t                          n_batch
);

// One hop. state: [n_embd, n_batch], query: [n_embd, n_batch],
// memory: [n_embd, n_units, n_batch]
enum hmem_status hmem_reading_cell_step(
    const struct hmem_reading_cell * cell,
    struct ggml_context            * ctx,
    struct ggml_tensor             * state,
    struct ggml_tensor             * query,
    struct ggml_tensor             * memory,
    struct hmem_cell_step          * out
);

// Cell view for hmem_rnn_scan, the memory is passed as the scan constant
struct hmem_cell hmem_reading_cell_as_cell(const struct hmem_reading_cell * cell);

struct ggml_tensor * hmem_reading_cell_l2(
    struct ggml_context            * ctx,
    const struct hmem_reading_cell * cell
);

#ifdef __cplusplus
}
#endif
