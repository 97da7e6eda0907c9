#include "hmem-writing.h"

#include <cmath>

// products of overflowing entities saturate here so that 0 * inf never reaches the memory
static const float HMEM_WRITING_SATURATION = 1e18f;

void hmem_writing_cell_params_init(struct hmem_writing_cell_params * params, int32_t n_units, int32_t n_embd) {
    if (!params) return;
    params->n_units           = n_units;
    params->n_embd            = n_embd;
    params->read_before_write = false;
    params->gamma_pos         = 0.01f;
    params->gamma_neg         = 0.01f;
    params->w_assoc_max       = 1.0f;
    params->l2                = 1e-3f;
}

enum hmem_status hmem_writing_cell_init(
    struct ggml_context                   * ctx,
    const struct hmem_writing_cell_params * params,
    struct hmem_rng                       * rng,
    struct hmem_writing_cell              * out
) {
    if (!ctx || !params || !rng || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (params->n_units < 1 || params->n_embd < 1) {
        HMEM_LOG_ERROR("%s: n_units and n_embd must be >= 1 (got %d, %d)\n", __func__, params->n_units, params->n_embd);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (!(params->w_assoc_max > 0.0f) || !std::isfinite(params->w_assoc_max)) {
        HMEM_LOG_ERROR("%s: w_assoc_max must be > 0 (got %g)\n", __func__, (double) params->w_assoc_max);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (!std::isfinite(params->gamma_pos) || !std::isfinite(params->gamma_neg)) {
        HMEM_LOG_ERROR("%s: gamma_pos and gamma_neg must be finite\n", __func__);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    out->params   = *params;
    out->kernel_r = NULL;

    out->kernel_v = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, params->n_units, params->n_embd);
    if (!out->kernel_v) return HMEM_STATUS_ALLOC_ERROR;
    hmem_rng_fill_he_uniform(rng, out->kernel_v, params->n_units);
    ggml_set_name(out->kernel_v, "writing.kernel_v");

    if (params->read_before_write) {
        out->kernel_r = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, params->n_embd, params->n_embd);
        if (!out->kernel_r) return HMEM_STATUS_ALLOC_ERROR;
        hmem_rng_fill_he_uniform(rng, out->kernel_r, params->n_embd);
        ggml_set_name(out->kernel_r, "writing.kernel_r");
    }

    return HMEM_STATUS_OK;
}

struct ggml_tensor * hmem_writing_cell_initial_state(
    const struct hmem_writing_cell * cell,
    struct ggml_context            * ctx,
    int64_t                          n_batch
) {
    struct ggml_tensor * memory = ggml_new_tensor_3d(ctx, GGML_TYPE_F32,
            cell->params.n_embd, cell->params.n_units, n_batch);
    if (!memory) {
        return NULL;
    }
    ggml_set_zero(memory);
    ggml_set_name(memory, "memory.init");
    return memory;
}

enum hmem_status hmem_writing_cell_step(
    const struct hmem_writing_cell * cell,
    struct ggml_context            * ctx,
    struct ggml_tensor             * memory,
    struct ggml_tensor             * entity,
    struct hmem_cell_step          * out
) {
    if (!cell || !ctx || !memory || !entity || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const struct hmem_writing_cell_params * hp = &cell->params;
    const int64_t n_units = hp->n_units;
    const int64_t n_embd  = hp->n_embd;
    const int64_t n_batch = memory->ne[2];

    if (memory->type != GGML_TYPE_F32 || memory->ne[0] != n_embd || memory->ne[1] != n_units || memory->ne[3] != 1) {
        HMEM_LOG_ERROR("%s: memory must be [%lld, %lld, n_batch], got [%lld, %lld, %lld, %lld]\n", __func__,
                       (long long) n_embd, (long long) n_units,
                       (long long) memory->ne[0], (long long) memory->ne[1], (long long) memory->ne[2], (long long) memory->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }
    if (entity->type != GGML_TYPE_F32 || entity->ne[0] != n_units || entity->ne[1] != n_batch || entity->ne[2] != 1 || entity->ne[3] != 1) {
        HMEM_LOG_ERROR("%s: entity must be [%lld, %lld], got [%lld, %lld, %lld, %lld]\n", __func__,
                       (long long) n_units, (long long) n_batch,
                       (long long) entity->ne[0], (long long) entity->ne[1], (long long) entity->ne[2], (long long) entity->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    struct ggml_tensor * k = ggml_is_contiguous(entity) ? entity : ggml_cont(ctx, entity);

    // target vector [n_embd, n_batch]
    struct ggml_tensor * v = ggml_mul_mat(ctx, cell->kernel_v, k);

    if (hp->read_before_write) {
        // predicted content v_hat = W^T k, read with the entity as query
        struct ggml_tensor * memory_t = ggml_cont(ctx, ggml_transpose(ctx, memory));       // [n_units, n_embd, n_batch]
        struct ggml_tensor * v_hat = ggml_mul_mat(ctx, memory_t,
                ggml_reshape_3d(ctx, k, n_units, 1, n_batch));                              // [n_embd, 1, n_batch]
        v_hat = ggml_reshape_2d(ctx, v_hat, n_embd, n_batch);
        v = ggml_add(ctx, v, ggml_mul_mat(ctx, cell->kernel_r, v_hat));
    }
    v = ggml_relu(ctx, v);

    // k outer v: [n_embd, n_units, n_batch]
    struct ggml_tensor * kv = ggml_mul_mat(ctx,
            ggml_reshape_3d(ctx, v, 1, n_embd,  n_batch),
            ggml_reshape_3d(ctx, k, 1, n_units, n_batch));
    kv = ggml_clamp(ctx, kv, -HMEM_WRITING_SATURATION, HMEM_WRITING_SATURATION);

    // A * kv with A = gamma_pos * (w_assoc_max - W)
    struct ggml_tensor * write = ggml_sub(ctx,
            ggml_scale(ctx, kv, hp->gamma_pos * hp->w_assoc_max),
            ggml_scale(ctx, ggml_mul(ctx, memory, kv), hp->gamma_pos));

    // D * W with D_i = gamma_neg * k_i^2, broadcast along each row
    struct ggml_tensor * decay_gate = ggml_scale(ctx,
            ggml_clamp(ctx, ggml_sqr(ctx, k), 0.0f, HMEM_WRITING_SATURATION), hp->gamma_neg);
    struct ggml_tensor * decay = ggml_mul(ctx, memory,
            ggml_reshape_3d(ctx, decay_gate, 1, n_units, n_batch));

    struct ggml_tensor * next = ggml_sub(ctx, ggml_add(ctx, memory, write), decay);
    next = ggml_clamp(ctx, next, -hp->w_assoc_max, hp->w_assoc_max);

    out->state  = next;
    out->output = next;
    return HMEM_STATUS_OK;
}

static struct ggml_tensor * writing_cell_initial_state(const void * impl, struct ggml_context * ctx, int64_t n_batch) {
    return hmem_writing_cell_initial_state((const struct hmem_writing_cell *) impl, ctx, n_batch);
}

static enum hmem_status writing_cell_step(
    const void            * impl,
    struct ggml_context   * ctx,
    struct ggml_tensor    * state,
    struct ggml_tensor    * input,
    struct ggml_tensor    * constant,
    struct hmem_cell_step * out
) {
    (void) constant;
    return hmem_writing_cell_step((const struct hmem_writing_cell *) impl, ctx, state, input, out);
}

struct hmem_cell hmem_writing_cell_as_cell(const struct hmem_writing_cell * cell) {
    struct hmem_cell result = {
        .name          = "entity_writing",
        .impl          = cell,
        .input_size    = cell->params.n_units,
        .initial_state = writing_cell_initial_state,
        .step          = writing_cell_step,
    };
    return result;
}

struct ggml_tensor * hmem_writing_cell_l2(
    struct ggml_context            * ctx,
    const struct hmem_writing_cell * cell
) {
    struct ggml_tensor * l2 = hmem_l2_penalty(ctx, cell->kernel_v, cell->params.l2);
    if (cell->kernel_r) {
        l2 = ggml_add(ctx, l2, hmem_l2_penalty(ctx, cell->kernel_r, cell->params.l2));
    }
    return l2;
}
