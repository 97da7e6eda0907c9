#include "hmem-reading.h"

void hmem_reading_cell_params_init(struct hmem_reading_cell_params * params, int32_t n_units, int32_t n_embd) {
    if (!params) return;
    params->n_units    = n_units;
    params->n_embd     = n_embd;
    params->activation = HMEM_ACTIVATION_RELU;
    params->l2         = 1e-3f;
}

enum hmem_status hmem_reading_cell_init(
    struct ggml_context                   * ctx,
    const struct hmem_reading_cell_params * params,
    struct hmem_rng                       * rng,
    struct hmem_reading_cell              * out
) {
    if (!ctx || !params || !rng || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (params->n_units < 1 || params->n_embd < 1) {
        HMEM_LOG_ERROR("%s: n_units and n_embd must be >= 1 (got %d, %d)\n", __func__, params->n_units, params->n_embd);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    out->params = *params;

    out->kernel_q = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, params->n_embd, params->n_embd);
    out->kernel_h = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, params->n_embd, params->n_embd);
    if (!out->kernel_q || !out->kernel_h) {
        return HMEM_STATUS_ALLOC_ERROR;
    }

    hmem_rng_fill_he_uniform(rng, out->kernel_q, params->n_embd);
    hmem_rng_fill_he_uniform(rng, out->kernel_h, params->n_embd);
    ggml_set_name(out->kernel_q, "reading.kernel_q");
    ggml_set_name(out->kernel_h, "reading.kernel_h");

    return HMEM_STATUS_OK;
}

struct ggml_tensor * hmem_reading_cell_initial_state(
    const struct hmem_reading_cell * cell,
    struct ggml_context            * ctx,
    int64_t                          n_batch
) {
    struct ggml_tensor * h = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, cell->params.n_embd, n_batch);
    if (!h) {
        return NULL;
    }
    ggml_set_zero(h);
    ggml_set_name(h, "reader.init");
    return h;
}

enum hmem_status hmem_reading_cell_step(
    const struct hmem_reading_cell * cell,
    struct ggml_context            * ctx,
    struct ggml_tensor             * state,
    struct ggml_tensor             * query,
    struct ggml_tensor             * memory,
    struct hmem_cell_step          * out
) {
    if (!cell || !ctx || !state || !query || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (!memory) {
        HMEM_LOG_ERROR("%s: the memory matrix is required\n", __func__);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    const int64_t n_units = cell->params.n_units;
    const int64_t n_embd  = cell->params.n_embd;
    const int64_t n_batch = memory->ne[2];

    if (memory->type != GGML_TYPE_F32 || memory->ne[0] != n_embd || memory->ne[1] != n_units || memory->ne[3] != 1) {
        HMEM_LOG_ERROR("%s: memory must be [%lld, %lld, n_batch], got [%lld, %lld, %lld, %lld]\n", __func__,
                       (long long) n_embd, (long long) n_units,
                       (long long) memory->ne[0], (long long) memory->ne[1], (long long) memory->ne[2], (long long) memory->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }
    if (ggml_nrows(state) != n_batch || state->ne[0] != n_embd || ggml_n_dims(state) > 2 ||
        ggml_nrows(query) != n_batch || query->ne[0] != n_embd || ggml_n_dims(query) > 2) {
        HMEM_LOG_ERROR("%s: state and query must be [%lld, %lld]\n", __func__, (long long) n_embd, (long long) n_batch);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    // current query [n_embd, n_batch]
    struct ggml_tensor * q = ggml_add(ctx, ggml_mul_mat(ctx, cell->kernel_q, query), state);

    // similarity of q with each memory row -> distribution over rows [n_units, 1, n_batch]
    struct ggml_tensor * scores = ggml_mul_mat(ctx, memory, ggml_reshape_3d(ctx, q, n_embd, 1, n_batch));
    struct ggml_tensor * attn = ggml_soft_max(ctx, scores);

    // weighted sum of rows [n_embd, 1, n_batch]
    struct ggml_tensor * memory_t = ggml_cont(ctx, ggml_transpose(ctx, memory));
    struct ggml_tensor * r = ggml_mul_mat(ctx, memory_t, attn);
    r = ggml_reshape_2d(ctx, r, n_embd, n_batch);

    struct ggml_tensor * h = ggml_mul_mat(ctx, cell->kernel_h, ggml_add(ctx, q, r));
    h = hmem_activation_apply(ctx, cell->params.activation, h);

    out->state  = h;
    out->output = h;
    return HMEM_STATUS_OK;
}

static struct ggml_tensor * reading_cell_initial_state(const void * impl, struct ggml_context * ctx, int64_t n_batch) {
    return hmem_reading_cell_initial_state((const struct hmem_reading_cell *) impl, ctx, n_batch);
}

static enum hmem_status reading_cell_step(
    const void            * impl,
    struct ggml_context   * ctx,
    struct ggml_tensor    * state,
    struct ggml_tensor    * input,
    struct ggml_tensor    * constant,
    struct hmem_cell_step * out
) {
    return hmem_reading_cell_step((const struct hmem_reading_cell *) impl, ctx, state, input, constant, out);
}

struct hmem_cell hmem_reading_cell_as_cell(const struct hmem_reading_cell * cell) {
    struct hmem_cell result = {
        .name          = "entity_reading",
        .impl          = cell,
        .input_size    = cell->params.n_embd,
        .initial_state = reading_cell_initial_state,
        .step          = reading_cell_step,
    };
    return result;
}

struct ggml_tensor * hmem_reading_cell_l2(
    struct ggml_context            * ctx,
    const struct hmem_reading_cell * cell
) {
    return ggml_add(ctx,
            hmem_l2_penalty(ctx, cell->kernel_q, cell->params.l2),
            hmem_l2_penalty(ctx, cell->kernel_h, cell->params.l2));
}
