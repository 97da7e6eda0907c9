#include "hmem-rnn.h"

enum hmem_status hmem_rnn_scan(
    struct ggml_context     * ctx,
    const struct hmem_cell  * cell,
    struct ggml_tensor      * inputs,
    struct ggml_tensor      * initial_state,
    struct ggml_tensor      * constant,
    struct ggml_tensor     ** states_out,
    struct hmem_cell_step   * out
) {
    if (!ctx || !cell || !cell->step || !inputs || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const int64_t n_steps = inputs->ne[1];
    const int64_t n_batch = inputs->ne[2];

    if (inputs->ne[0] != cell->input_size || inputs->ne[3] != 1 || n_steps < 1) {
        HMEM_LOG_ERROR("%s: %s expects inputs [%lld, n_steps >= 1, n_batch], got [%lld, %lld, %lld, %lld]\n",
                       __func__, cell->name, (long long) cell->input_size,
                       (long long) inputs->ne[0], (long long) inputs->ne[1],
                       (long long) inputs->ne[2], (long long) inputs->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    struct hmem_cell_step step = {
        .state  = initial_state ? initial_state : cell->initial_state(cell->impl, ctx, n_batch),
        .output = NULL,
    };
    if (!step.state) {
        return HMEM_STATUS_ALLOC_ERROR;
    }

    for (int64_t t = 0; t < n_steps; t++) {
        // step t of every sequence: [input_size, n_batch]
        struct ggml_tensor * x = ggml_view_2d(ctx, inputs,
                inputs->ne[0], n_batch,
                inputs->nb[2],
                t * inputs->nb[1]);
        x = ggml_cont(ctx, x);

        struct hmem_cell_step next;
        enum hmem_status status = cell->step(cell->impl, ctx, step.state, x, constant, &next);
        if (status != HMEM_STATUS_OK) {
            HMEM_LOG_ERROR("%s: %s failed at step %lld: %s\n", __func__, cell->name, (long long) t, hmem_status_str(status));
            return status;
        }

        if (states_out) {
            states_out[t] = next.state;
        }
        step = next;
    }

    *out = step;
    return HMEM_STATUS_OK;
}
