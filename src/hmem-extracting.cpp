#include "hmem-extracting.h"

enum hmem_status hmem_extracting_init(
    struct ggml_context    * ctx,
    int32_t                  n_embd,
    int32_t                  n_units,
    enum hmem_activation     activation,
    float                    l2,
    struct hmem_rng        * rng,
    struct hmem_extracting * out
) {
    if (!ctx || !rng || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (n_embd < 1 || n_units < 1) {
        HMEM_LOG_ERROR("%s: n_embd and n_units must be >= 1 (got %d, %d)\n", __func__, n_embd, n_units);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (l2 < 0.0f) {
        HMEM_LOG_ERROR("%s: l2 must be >= 0 (got %g)\n", __func__, (double) l2);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    out->n_embd     = n_embd;
    out->n_units    = n_units;
    out->activation = activation;
    out->l2         = l2;
    out->kernel     = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, n_embd, n_units);
    if (!out->kernel) {
        return HMEM_STATUS_ALLOC_ERROR;
    }

    hmem_rng_fill_he_uniform(rng, out->kernel, n_embd);
    ggml_set_name(out->kernel, "extracting.kernel");

    return HMEM_STATUS_OK;
}

enum hmem_status hmem_extracting_apply(
    struct ggml_context          * ctx,
    const struct hmem_extracting * extracting,
    struct ggml_tensor           * x,
    struct ggml_tensor          ** out
) {
    if (!ctx || !extracting || !x || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (x->type != GGML_TYPE_F32 || x->ne[0] != extracting->n_embd || x->ne[3] != 1) {
        HMEM_LOG_ERROR("%s: expected [%d, n_sentences, n_batch], got [%lld, %lld, %lld, %lld]\n", __func__,
                       extracting->n_embd,
                       (long long) x->ne[0], (long long) x->ne[1], (long long) x->ne[2], (long long) x->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    // kernel [n_embd, n_units] is broadcast over sentences and batch
    struct ggml_tensor * y = ggml_mul_mat(ctx, extracting->kernel, x);
    *out = hmem_activation_apply(ctx, extracting->activation, y);

    return HMEM_STATUS_OK;
}

struct ggml_tensor * hmem_extracting_l2(
    struct ggml_context          * ctx,
    const struct hmem_extracting * extracting
) {
    return hmem_l2_penalty(ctx, extracting->kernel, extracting->l2);
}
