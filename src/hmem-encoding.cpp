#include "hmem-encoding.h"

#include <cstring>

enum hmem_status hmem_encoding_type_parse(const char * name, enum hmem_encoding_type * out) {
    if (!name || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (strcmp(name, "identity_encoding") == 0) { *out = HMEM_ENCODING_IDENTITY; return HMEM_STATUS_OK; }
    if (strcmp(name, "position_encoding") == 0) { *out = HMEM_ENCODING_POSITION; return HMEM_STATUS_OK; }
    if (strcmp(name, "learned_encoding")  == 0) { *out = HMEM_ENCODING_LEARNED;  return HMEM_STATUS_OK; }

    HMEM_LOG_ERROR("%s: unknown encodings_type '%s'\n", __func__, name);
    return HMEM_STATUS_CONFIGURATION_ERROR;
}

const char * hmem_encoding_type_name(enum hmem_encoding_type type) {
    switch (type) {
        case HMEM_ENCODING_IDENTITY: return "identity_encoding";
        case HMEM_ENCODING_POSITION: return "position_encoding";
        case HMEM_ENCODING_LEARNED:  return "learned_encoding";
    }
    return "unknown";
}

void hmem_position_encoding_fill(float * out, int32_t n_words, int32_t n_embd) {
    const float J = (float) n_words;
    const float d = (float) n_embd;
    for (int32_t j = 1; j <= n_words; j++) {
        for (int32_t k = 1; k <= n_embd; k++) {
            out[(j - 1) * n_embd + (k - 1)] = (1.0f - j / J) - (k / d) * (1.0f - 2.0f * j / J);
        }
    }
}

enum hmem_status hmem_encoding_init(
    struct ggml_context  * ctx,
    enum hmem_encoding_type type,
    int32_t                n_words,
    int32_t                n_embd,
    struct hmem_encoding * out
) {
    if (!ctx || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (n_words < 1 || n_embd < 1) {
        HMEM_LOG_ERROR("%s: n_words and n_embd must be >= 1 (got %d, %d)\n", __func__, n_words, n_embd);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    out->type    = type;
    out->n_words = n_words;
    out->n_embd  = n_embd;
    out->weights = NULL;

    switch (type) {
        case HMEM_ENCODING_IDENTITY:
            return HMEM_STATUS_OK;
        case HMEM_ENCODING_POSITION: {
            out->weights = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, n_embd, n_words);
            if (!out->weights) return HMEM_STATUS_ALLOC_ERROR;
            hmem_position_encoding_fill((float *) out->weights->data, n_words, n_embd);
            ggml_set_name(out->weights, "encoding.position");
            return HMEM_STATUS_OK;
        }
        case HMEM_ENCODING_LEARNED: {
            out->weights = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, n_embd, n_words);
            if (!out->weights) return HMEM_STATUS_ALLOC_ERROR;
            // starts as a plain bag of words
            float * data = (float *) out->weights->data;
            for (int64_t i = 0; i < ggml_nelements(out->weights); i++) {
                data[i] = 1.0f;
            }
            ggml_set_name(out->weights, "encoding.learned");
            return HMEM_STATUS_OK;
        }
    }

    return HMEM_STATUS_CONFIGURATION_ERROR;
}

struct ggml_tensor * hmem_encoding_sum_words(
    struct ggml_context * ctx,
    struct ggml_tensor  * x
) {
    const int64_t n_embd = x->ne[0];
    const int64_t n      = x->ne[2];

    // [n_embd, n_words, n] -> [n_words, n_embd, n] so the word axis is summed by sum_rows
    struct ggml_tensor * t = ggml_cont(ctx, ggml_permute(ctx, x, 1, 0, 2, 3));
    t = ggml_sum_rows(ctx, t);  // [1, n_embd, n]
    return ggml_reshape_2d(ctx, t, n_embd, n);
}

enum hmem_status hmem_encoding_apply(
    struct ggml_context        * ctx,
    const struct hmem_encoding * encoding,
    struct ggml_tensor         * x,
    struct ggml_tensor        ** out
) {
    if (!ctx || !encoding || !x || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (x->type != GGML_TYPE_F32 || x->ne[0] != encoding->n_embd || x->ne[1] != encoding->n_words || x->ne[3] != 1) {
        HMEM_LOG_ERROR("%s: expected [%d, %d, n], got [%lld, %lld, %lld, %lld]\n", __func__,
                       encoding->n_embd, encoding->n_words,
                       (long long) x->ne[0], (long long) x->ne[1], (long long) x->ne[2], (long long) x->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    switch (encoding->type) {
        case HMEM_ENCODING_IDENTITY:
            *out = x;
            return HMEM_STATUS_OK;
        case HMEM_ENCODING_POSITION:
        case HMEM_ENCODING_LEARNED: {
            // weights [n_embd, n_words] broadcast over sentences
            struct ggml_tensor * weighted = ggml_mul(ctx, x, encoding->weights);
            *out = hmem_encoding_sum_words(ctx, weighted);
            return HMEM_STATUS_OK;
        }
    }

    return HMEM_STATUS_CONFIGURATION_ERROR;
}
