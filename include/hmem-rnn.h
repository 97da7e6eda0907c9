#pragma once

#include "ggml.h"
#include "hmem-common.h"

#ifdef __cplusplus
extern "C" {
#endif

// Recurrent cell contract: (state, input) -> (state, output)
//
// A cell is a plain table of callbacks over an opaque implementation. The scan
// below drives any cell over the step axis of an input sequence; each step only
// sees the previous state, its own input and an optional constant.

struct hmem_cell_step {
    struct ggml_tensor * state;   // carried into the next step
    struct ggml_tensor * output;  // emitted by this step
};

struct hmem_cell {
    const char * name;
    const void * impl;

    int64_t input_size;           // ne[0] of each step input

    // Zero state for n_batch independent sequences
    struct ggml_tensor * (*initial_state)(const void * impl, struct ggml_context * ctx, int64_t n_batch);

    // input: [input_size, n_batch], constant may be NULL
    enum hmem_status (*step)(
        const void            * impl,
        struct ggml_context   * ctx,
        struct ggml_tensor    * state,
        struct ggml_tensor    * input,
        struct ggml_tensor    * constant,
        struct hmem_cell_step * out);
};

// Scan a cell over inputs [input_size, n_steps, n_batch], strictly in order.
//   initial_state: NULL uses the cell's zero state
//   states_out:    optional, receives n_steps intermediate states
//   out:           last step (final state and output)
enum hmem_status hmem_rnn_scan(
    struct ggml_context     * ctx,
    const struct hmem_cell  * cell,
    struct ggml_tensor      * inputs,
    struct ggml_tensor      * initial_state,
    struct ggml_tensor      * constant,
    struct ggml_tensor     ** states_out,
    struct hmem_cell_step   * out
);

#ifdef __cplusplus
}
#endif
