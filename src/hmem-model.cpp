#include "hmem-model.h"

#if defined(__has_include)
#  if __has_include("gguf.h")
#    include "gguf.h"
#  endif
#endif

#include <cmath>
#include <cstring>
#include <vector>

#define HMEM_MAX_TENSORS 16

// GGUF metadata keys
#define HMEM_KV_ARCHITECTURE          "general.architecture"
#define HMEM_KV_VOCAB_SIZE            "hmem.vocab_size"
#define HMEM_KV_MAX_NUM_SENTENCES     "hmem.max_num_sentences"
#define HMEM_KV_MAX_WORDS             "hmem.max_words"
#define HMEM_KV_EMBEDDINGS_SIZE       "hmem.embeddings_size"
#define HMEM_KV_MEMORY_SIZE           "hmem.memory_size"
#define HMEM_KV_HOPS                  "hmem.hops"
#define HMEM_KV_ENCODINGS_TYPE        "hmem.encodings_type"
#define HMEM_KV_READ_BEFORE_WRITE     "hmem.read_before_write"
#define HMEM_KV_GAMMA_POS             "hmem.gamma_pos"
#define HMEM_KV_GAMMA_NEG             "hmem.gamma_neg"
#define HMEM_KV_W_ASSOC_MAX           "hmem.w_assoc_max"
#define HMEM_KV_EXTRACTING_ACTIVATION "hmem.extracting_activation"
#define HMEM_KV_READING_ACTIVATION    "hmem.reading_activation"
#define HMEM_KV_L2                    "hmem.l2"
#define HMEM_KV_NORM_EPS              "hmem.norm_eps"

void hmem_model_params_init(struct hmem_model_params * params) {
    if (!params) return;
    params->n_vocab     = 0;
    params->n_sentences = 0;
    params->n_words     = 0;
    params->n_embd      = 80;
    params->n_units     = 100;
    params->n_hops      = 3;

    params->encoding_type     = HMEM_ENCODING_LEARNED;
    params->read_before_write = false;
    params->gamma_pos         = 0.01f;
    params->gamma_neg         = 0.01f;
    params->w_assoc_max       = 1.0f;

    params->extracting_activation = HMEM_ACTIVATION_RELU;
    params->reading_activation    = HMEM_ACTIVATION_RELU;
    params->l2       = 1e-3f;
    params->norm_eps = 1e-3f;
}

enum hmem_status hmem_model_params_from_config(
    const struct hmem_config  * config,
    int32_t                     n_vocab,
    int32_t                     n_sentences,
    int32_t                     n_words,
    struct hmem_model_params  * out
) {
    if (!config || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    hmem_model_params_init(out);

    enum hmem_status status = hmem_encoding_type_parse(config->encodings_type, &out->encoding_type);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    out->n_vocab           = n_vocab;
    out->n_sentences       = n_sentences;
    out->n_words           = n_words;
    out->n_embd            = config->embeddings_size;
    out->n_units           = config->memory_size;
    out->n_hops            = config->hops;
    out->read_before_write = config->read_before_write;
    out->gamma_pos         = config->gamma_pos;
    out->gamma_neg         = config->gamma_neg;
    out->w_assoc_max       = config->w_assoc_max;

    return hmem_model_params_validate(out);
}

enum hmem_status hmem_model_params_validate(const struct hmem_model_params * params) {
    if (!params) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (params->n_vocab < 2 || params->n_sentences < 1 || params->n_words < 1 ||
        params->n_embd < 1 || params->n_units < 1 || params->n_hops < 1) {
        HMEM_LOG_ERROR("%s: invalid dimensions: vocab %d, sentences %d, words %d, embd %d, units %d, hops %d\n",
                       __func__, params->n_vocab, params->n_sentences, params->n_words,
                       params->n_embd, params->n_units, params->n_hops);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (!(params->w_assoc_max > 0.0f) || !std::isfinite(params->w_assoc_max)) {
        HMEM_LOG_ERROR("%s: w_assoc_max must be > 0 (got %g)\n", __func__, (double) params->w_assoc_max);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (params->l2 < 0.0f || !(params->norm_eps > 0.0f)) {
        HMEM_LOG_ERROR("%s: l2 must be >= 0 and norm_eps > 0\n", __func__);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    return HMEM_STATUS_OK;
}

static size_t model_weights_mem_size(const struct hmem_model_params * hp) {
    const size_t E = hp->n_embd;
    const size_t V = hp->n_vocab;
    const size_t M = hp->n_units;
    const size_t W = hp->n_words;

    size_t n_floats = 0;
    n_floats += E * V * 2;            // tok_embd, output
    n_floats += V;                    // nil_mask
    n_floats += E * W;                // encoding weights
    n_floats += E * 4;                // norms
    n_floats += E * M * 2;            // extracting, writing.kernel_v
    n_floats += E * E * 3;            // writing.kernel_r, reading.kernel_q, reading.kernel_h

    return n_floats * sizeof(float) + 2 * HMEM_MAX_TENSORS * ggml_tensor_overhead() + 1024 * 1024;
}

static struct ggml_tensor * new_filled_1d(struct ggml_context * ctx, int64_t n, float value, const char * name) {
    struct ggml_tensor * t = ggml_new_tensor_1d(ctx, GGML_TYPE_F32, n);
    if (!t) return NULL;
    float * data = (float *) t->data;
    for (int64_t i = 0; i < n; i++) {
        data[i] = value;
    }
    ggml_set_name(t, name);
    return t;
}

enum hmem_status hmem_model_init(
    const struct hmem_model_params * params,
    struct hmem_rng                * rng,
    struct hmem_model             ** out
) {
    if (!params || !rng || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    *out = NULL;

    enum hmem_status status = hmem_model_params_validate(params);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    struct ggml_init_params ctx_params = {
        .mem_size   = model_weights_mem_size(params),
        .mem_buffer = NULL,
        .no_alloc   = false,
    };
    struct ggml_context * ctx = ggml_init(ctx_params);
    if (!ctx) {
        HMEM_LOG_ERROR("%s: failed to allocate the weights context\n", __func__);
        return HMEM_STATUS_ALLOC_ERROR;
    }

    struct hmem_model * model = new hmem_model;
    memset(model, 0, sizeof(struct hmem_model));
    model->params = *params;
    model->ctx    = ctx;

    const int32_t E = params->n_embd;
    const int32_t V = params->n_vocab;

    // embedding table, fan_in follows the [n_vocab, n_embd] kernel shape
    model->tok_embd = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, E, V);
    if (!model->tok_embd) {
        hmem_model_free(model);
        return HMEM_STATUS_ALLOC_ERROR;
    }
    hmem_rng_fill_he_uniform(rng, model->tok_embd, V);
    ggml_set_name(model->tok_embd, "token_embd");

    model->nil_mask = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, 1, V);
    if (!model->nil_mask) {
        hmem_model_free(model);
        return HMEM_STATUS_ALLOC_ERROR;
    }
    {
        float * data = (float *) model->nil_mask->data;
        data[0] = 0.0f;
        for (int32_t i = 1; i < V; i++) {
            data[i] = 1.0f;
        }
        ggml_set_name(model->nil_mask, "nil_mask");
    }

    status = hmem_encoding_init(ctx, params->encoding_type, params->n_words, E, &model->encoding);
    if (status != HMEM_STATUS_OK) {
        hmem_model_free(model);
        return status;
    }

    model->story_norm_w = new_filled_1d(ctx, E, 1.0f, "story_norm.weight");
    model->story_norm_b = new_filled_1d(ctx, E, 0.0f, "story_norm.bias");
    model->query_norm_w = new_filled_1d(ctx, E, 1.0f, "query_norm.weight");
    model->query_norm_b = new_filled_1d(ctx, E, 0.0f, "query_norm.bias");
    if (!model->story_norm_w || !model->story_norm_b || !model->query_norm_w || !model->query_norm_b) {
        hmem_model_free(model);
        return HMEM_STATUS_ALLOC_ERROR;
    }

    status = hmem_extracting_init(ctx, E, params->n_units, params->extracting_activation, params->l2, rng, &model->extracting);
    if (status != HMEM_STATUS_OK) {
        hmem_model_free(model);
        return status;
    }

    struct hmem_writing_cell_params wparams;
    hmem_writing_cell_params_init(&wparams, params->n_units, E);
    wparams.read_before_write = params->read_before_write;
    wparams.gamma_pos         = params->gamma_pos;
    wparams.gamma_neg         = params->gamma_neg;
    wparams.w_assoc_max       = params->w_assoc_max;
    wparams.l2                = params->l2;

    status = hmem_writing_cell_init(ctx, &wparams, rng, &model->writing);
    if (status != HMEM_STATUS_OK) {
        hmem_model_free(model);
        return status;
    }

    struct hmem_reading_cell_params rparams;
    hmem_reading_cell_params_init(&rparams, params->n_units, E);
    rparams.activation = params->reading_activation;
    rparams.l2         = params->l2;

    status = hmem_reading_cell_init(ctx, &rparams, rng, &model->reading);
    if (status != HMEM_STATUS_OK) {
        hmem_model_free(model);
        return status;
    }

    model->output = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, E, V);
    if (!model->output) {
        hmem_model_free(model);
        return HMEM_STATUS_ALLOC_ERROR;
    }
    hmem_rng_fill_he_uniform(rng, model->output, E);
    ggml_set_name(model->output, "output");

    *out = model;
    return HMEM_STATUS_OK;
}

void hmem_model_free(struct hmem_model * model) {
    if (!model) return;
    if (model->ctx) {
        ggml_free(model->ctx);
    }
    delete model;
}

struct ggml_tensor * hmem_model_new_story(const struct hmem_model * model, struct ggml_context * ctx, int64_t n_batch) {
    struct ggml_tensor * story = ggml_new_tensor_3d(ctx, GGML_TYPE_I32,
            model->params.n_words, model->params.n_sentences, n_batch);
    if (story) {
        ggml_set_name(story, "story_input");
    }
    return story;
}

struct ggml_tensor * hmem_model_new_query(const struct hmem_model * model, struct ggml_context * ctx, int64_t n_batch) {
    struct ggml_tensor * query = ggml_new_tensor_3d(ctx, GGML_TYPE_I32,
            model->params.n_words, model->params.n_hops, n_batch);
    if (query) {
        ggml_set_name(query, "query_input");
    }
    return query;
}

// indices [n_words, n_seq, n_batch] -> encoded, normalized [n_embd, n_seq, n_batch]
static enum hmem_status build_sentences(
    const struct hmem_model * model,
    struct ggml_context     * ctx,
    struct ggml_tensor      * indices,
    struct ggml_tensor      * norm_w,
    struct ggml_tensor      * norm_b,
    struct ggml_tensor     ** out
) {
    const struct hmem_model_params * hp = &model->params;
    const int64_t n_words = indices->ne[0];
    const int64_t n_seq   = indices->ne[1];
    const int64_t n_batch = indices->ne[2];

    // nil word embeds to zero
    struct ggml_tensor * table = ggml_mul(ctx, model->tok_embd, model->nil_mask);

    struct ggml_tensor * ids = ggml_reshape_1d(ctx, indices, n_words * n_seq * n_batch);
    struct ggml_tensor * x = ggml_get_rows(ctx, table, ids);                    // [n_embd, n_words * n_seq * n_batch]
    x = ggml_reshape_3d(ctx, x, hp->n_embd, n_words, n_seq * n_batch);

    struct ggml_tensor * encoded = NULL;
    enum hmem_status status = hmem_encoding_apply(ctx, &model->encoding, x, &encoded);
    if (status != HMEM_STATUS_OK) {
        return status;
    }
    if (model->encoding.type == HMEM_ENCODING_IDENTITY) {
        // per-word vectors, reduce to a bag of words
        encoded = hmem_encoding_sum_words(ctx, encoded);
    }
    encoded = ggml_reshape_3d(ctx, encoded, hp->n_embd, n_seq, n_batch);

    struct ggml_tensor * normed = ggml_norm(ctx, encoded, hp->norm_eps);
    normed = ggml_add(ctx, ggml_mul(ctx, normed, norm_w), norm_b);

    *out = normed;
    return HMEM_STATUS_OK;
}

enum hmem_status hmem_model_build(
    const struct hmem_model  * model,
    struct ggml_context      * ctx,
    struct ggml_tensor       * story,
    struct ggml_tensor       * query,
    struct hmem_model_graph  * out
) {
    if (!model || !ctx || !story || !query || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const struct hmem_model_params * hp = &model->params;

    if (story->type != GGML_TYPE_I32 || query->type != GGML_TYPE_I32) {
        HMEM_LOG_ERROR("%s: story and query must be I32 word indices\n", __func__);
        return HMEM_STATUS_SHAPE_ERROR;
    }
    if (story->ne[0] != hp->n_words || story->ne[1] != hp->n_sentences || story->ne[3] != 1 || !ggml_is_contiguous(story)) {
        HMEM_LOG_ERROR("%s: story must be [%d, %d, n_batch], got [%lld, %lld, %lld, %lld]\n", __func__,
                       hp->n_words, hp->n_sentences,
                       (long long) story->ne[0], (long long) story->ne[1], (long long) story->ne[2], (long long) story->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }
    if (query->ne[1] != hp->n_hops) {
        HMEM_LOG_ERROR("%s: query has %lld hops, the model is configured for %d\n", __func__,
                       (long long) query->ne[1], hp->n_hops);
        return HMEM_STATUS_SHAPE_ERROR;
    }
    if (query->ne[0] != hp->n_words || query->ne[2] != story->ne[2] || query->ne[3] != 1 || !ggml_is_contiguous(query)) {
        HMEM_LOG_ERROR("%s: query must be [%d, %d, %lld], got [%lld, %lld, %lld, %lld]\n", __func__,
                       hp->n_words, hp->n_hops, (long long) story->ne[2],
                       (long long) query->ne[0], (long long) query->ne[1], (long long) query->ne[2], (long long) query->ne[3]);
        return HMEM_STATUS_SHAPE_ERROR;
    }

    // story -> entities -> memory
    struct ggml_tensor * story_encoded = NULL;
    enum hmem_status status = build_sentences(model, ctx, story, model->story_norm_w, model->story_norm_b, &story_encoded);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    struct ggml_tensor * entities = NULL;
    status = hmem_extracting_apply(ctx, &model->extracting, story_encoded, &entities);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    const struct hmem_cell writer = hmem_writing_cell_as_cell(&model->writing);
    struct hmem_cell_step written;
    status = hmem_rnn_scan(ctx, &writer, entities, NULL, NULL, NULL, &written);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    // query -> queried value, memory held constant
    struct ggml_tensor * query_encoded = NULL;
    status = build_sentences(model, ctx, query, model->query_norm_w, model->query_norm_b, &query_encoded);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    const struct hmem_cell reader = hmem_reading_cell_as_cell(&model->reading);
    struct hmem_cell_step read;
    status = hmem_rnn_scan(ctx, &reader, query_encoded, NULL, written.output, NULL, &read);
    if (status != HMEM_STATUS_OK) {
        return status;
    }

    struct ggml_tensor * logits = ggml_mul_mat(ctx, model->output, read.output);
    ggml_set_name(logits, "logits");

    out->entities = entities;
    out->memory   = written.output;
    out->queried  = read.output;
    out->logits   = logits;
    return HMEM_STATUS_OK;
}

struct ggml_tensor * hmem_model_l2(const struct hmem_model * model, struct ggml_context * ctx) {
    struct ggml_tensor * l2 = hmem_extracting_l2(ctx, &model->extracting);
    l2 = ggml_add(ctx, l2, hmem_writing_cell_l2(ctx, &model->writing));
    l2 = ggml_add(ctx, l2, hmem_reading_cell_l2(ctx, &model->reading));
    return l2;
}

int32_t hmem_model_get_tensors(const struct hmem_model * model, struct ggml_tensor ** tensors, int32_t max_tensors) {
    struct ggml_tensor * all[HMEM_MAX_TENSORS];
    int32_t n = 0;

    all[n++] = model->tok_embd;
    if (model->encoding.weights) {
        all[n++] = model->encoding.weights;
    }
    all[n++] = model->story_norm_w;
    all[n++] = model->story_norm_b;
    all[n++] = model->query_norm_w;
    all[n++] = model->query_norm_b;
    all[n++] = model->extracting.kernel;
    all[n++] = model->writing.kernel_v;
    if (model->writing.kernel_r) {
        all[n++] = model->writing.kernel_r;
    }
    all[n++] = model->reading.kernel_q;
    all[n++] = model->reading.kernel_h;
    all[n++] = model->output;

    for (int32_t i = 0; tensors && i < n && i < max_tensors; i++) {
        tensors[i] = all[i];
    }
    return n;
}

size_t hmem_model_compute_mem_size(const struct hmem_model_params * hp, int64_t n_batch) {
    const size_t E = hp->n_embd;
    const size_t M = hp->n_units;
    const size_t V = hp->n_vocab;
    const size_t W = hp->n_words;
    const size_t S = hp->n_sentences;
    const size_t H = hp->n_hops;
    const size_t B = n_batch;
    const size_t f = sizeof(float);

    const size_t memory_bytes = E * M * B * f;
    const size_t node = ggml_tensor_overhead();

    size_t size = 0;
    size += (S + H) * B * W * 4;                                  // index inputs
    size += V * E * f;                                            // masked table
    size += 4 * E * W * (S + H) * B * f;                          // embedding and encoding
    size += 8 * E * (S + H) * B * f;                              // norms
    size += 3 * M * S * B * f;                                    // entities
    size += S * (11 * memory_bytes + 8 * (E + M) * B * f + 32 * node);  // writes
    size += H * (2 * memory_bytes + 16 * (E + M) * B * f + 24 * node);  // reads
    size += 2 * V * B * f;                                        // logits
    size += 64 * node + hmem_graph_overhead();

    return size + size / 4 + 4 * 1024 * 1024;
}

//
// GGUF persistence
//

enum hmem_status hmem_model_save(const struct hmem_model * model, const char * path) {
    if (!model || !path) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const struct hmem_model_params * hp = &model->params;

    struct gguf_context * gguf = gguf_init_empty();
    if (!gguf) {
        return HMEM_STATUS_ALLOC_ERROR;
    }

    gguf_set_val_str (gguf, HMEM_KV_ARCHITECTURE,          "hmem");
    gguf_set_val_i32 (gguf, HMEM_KV_VOCAB_SIZE,            hp->n_vocab);
    gguf_set_val_i32 (gguf, HMEM_KV_MAX_NUM_SENTENCES,     hp->n_sentences);
    gguf_set_val_i32 (gguf, HMEM_KV_MAX_WORDS,             hp->n_words);
    gguf_set_val_i32 (gguf, HMEM_KV_EMBEDDINGS_SIZE,       hp->n_embd);
    gguf_set_val_i32 (gguf, HMEM_KV_MEMORY_SIZE,           hp->n_units);
    gguf_set_val_i32 (gguf, HMEM_KV_HOPS,                  hp->n_hops);
    gguf_set_val_str (gguf, HMEM_KV_ENCODINGS_TYPE,        hmem_encoding_type_name(hp->encoding_type));
    gguf_set_val_bool(gguf, HMEM_KV_READ_BEFORE_WRITE,     hp->read_before_write);
    gguf_set_val_f32 (gguf, HMEM_KV_GAMMA_POS,             hp->gamma_pos);
    gguf_set_val_f32 (gguf, HMEM_KV_GAMMA_NEG,             hp->gamma_neg);
    gguf_set_val_f32 (gguf, HMEM_KV_W_ASSOC_MAX,           hp->w_assoc_max);
    gguf_set_val_str (gguf, HMEM_KV_EXTRACTING_ACTIVATION, hmem_activation_name(hp->extracting_activation));
    gguf_set_val_str (gguf, HMEM_KV_READING_ACTIVATION,    hmem_activation_name(hp->reading_activation));
    gguf_set_val_f32 (gguf, HMEM_KV_L2,                    hp->l2);
    gguf_set_val_f32 (gguf, HMEM_KV_NORM_EPS,              hp->norm_eps);

    struct ggml_tensor * tensors[HMEM_MAX_TENSORS];
    const int32_t n_tensors = hmem_model_get_tensors(model, tensors, HMEM_MAX_TENSORS);
    for (int32_t i = 0; i < n_tensors; i++) {
        gguf_add_tensor(gguf, tensors[i]);
    }

    if (!gguf_write_to_file(gguf, path, false)) {
        HMEM_LOG_ERROR("%s: failed to write '%s'\n", __func__, path);
        gguf_free(gguf);
        return HMEM_STATUS_IO_ERROR;
    }
    gguf_free(gguf);

    HMEM_LOG_INFO("%s: saved %d tensors to '%s'\n", __func__, n_tensors, path);
    return HMEM_STATUS_OK;
}

static bool gguf_read_i32(const struct gguf_context * gguf, const char * key, int32_t * out) {
    const auto key_id = gguf_find_key(gguf, key);
    if (key_id < 0 || gguf_get_kv_type(gguf, key_id) != GGUF_TYPE_INT32) {
        HMEM_LOG_ERROR("%s: missing int32 key '%s'\n", __func__, key);
        return false;
    }
    *out = gguf_get_val_i32(gguf, key_id);
    return true;
}

static bool gguf_read_f32(const struct gguf_context * gguf, const char * key, float * out) {
    const auto key_id = gguf_find_key(gguf, key);
    if (key_id < 0 || gguf_get_kv_type(gguf, key_id) != GGUF_TYPE_FLOAT32) {
        HMEM_LOG_ERROR("%s: missing float32 key '%s'\n", __func__, key);
        return false;
    }
    *out = gguf_get_val_f32(gguf, key_id);
    return true;
}

static bool gguf_read_str(const struct gguf_context * gguf, const char * key, const char ** out) {
    const auto key_id = gguf_find_key(gguf, key);
    if (key_id < 0 || gguf_get_kv_type(gguf, key_id) != GGUF_TYPE_STRING) {
        HMEM_LOG_ERROR("%s: missing string key '%s'\n", __func__, key);
        return false;
    }
    *out = gguf_get_val_str(gguf, key_id);
    return true;
}

static enum hmem_status read_params(const struct gguf_context * gguf, struct hmem_model_params * hp) {
    hmem_model_params_init(hp);

    const char * arch = NULL;
    if (!gguf_read_str(gguf, HMEM_KV_ARCHITECTURE, &arch) || strcmp(arch, "hmem") != 0) {
        HMEM_LOG_ERROR("%s: not an hmem model\n", __func__);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const char * encodings_type = NULL;
    const char * extracting_activation = NULL;
    const char * reading_activation = NULL;

    bool ok = true;
    ok = ok && gguf_read_i32(gguf, HMEM_KV_VOCAB_SIZE,            &hp->n_vocab);
    ok = ok && gguf_read_i32(gguf, HMEM_KV_MAX_NUM_SENTENCES,     &hp->n_sentences);
    ok = ok && gguf_read_i32(gguf, HMEM_KV_MAX_WORDS,             &hp->n_words);
    ok = ok && gguf_read_i32(gguf, HMEM_KV_EMBEDDINGS_SIZE,       &hp->n_embd);
    ok = ok && gguf_read_i32(gguf, HMEM_KV_MEMORY_SIZE,           &hp->n_units);
    ok = ok && gguf_read_i32(gguf, HMEM_KV_HOPS,                  &hp->n_hops);
    ok = ok && gguf_read_str(gguf, HMEM_KV_ENCODINGS_TYPE,        &encodings_type);
    ok = ok && gguf_read_f32(gguf, HMEM_KV_GAMMA_POS,             &hp->gamma_pos);
    ok = ok && gguf_read_f32(gguf, HMEM_KV_GAMMA_NEG,             &hp->gamma_neg);
    ok = ok && gguf_read_f32(gguf, HMEM_KV_W_ASSOC_MAX,           &hp->w_assoc_max);
    ok = ok && gguf_read_str(gguf, HMEM_KV_EXTRACTING_ACTIVATION, &extracting_activation);
    ok = ok && gguf_read_str(gguf, HMEM_KV_READING_ACTIVATION,    &reading_activation);
    ok = ok && gguf_read_f32(gguf, HMEM_KV_L2,                    &hp->l2);
    ok = ok && gguf_read_f32(gguf, HMEM_KV_NORM_EPS,              &hp->norm_eps);
    if (!ok) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const auto rbw_id = gguf_find_key(gguf, HMEM_KV_READ_BEFORE_WRITE);
    if (rbw_id < 0 || gguf_get_kv_type(gguf, rbw_id) != GGUF_TYPE_BOOL) {
        HMEM_LOG_ERROR("%s: missing bool key '%s'\n", __func__, HMEM_KV_READ_BEFORE_WRITE);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    hp->read_before_write = gguf_get_val_bool(gguf, rbw_id);

    enum hmem_status status = hmem_encoding_type_parse(encodings_type, &hp->encoding_type);
    if (status == HMEM_STATUS_OK) status = hmem_activation_parse(extracting_activation, &hp->extracting_activation);
    if (status == HMEM_STATUS_OK) status = hmem_activation_parse(reading_activation, &hp->reading_activation);
    if (status == HMEM_STATUS_OK) status = hmem_model_params_validate(hp);
    return status;
}

enum hmem_status hmem_model_load(const char * path, struct hmem_model ** out) {
    if (!path || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    *out = NULL;

    struct ggml_context * data_ctx = NULL;
    struct gguf_init_params gguf_params = {
        .no_alloc = false,
        .ctx      = &data_ctx,
    };
    struct gguf_context * gguf = gguf_init_from_file(path, gguf_params);
    if (!gguf) {
        HMEM_LOG_ERROR("%s: failed to read '%s'\n", __func__, path);
        return HMEM_STATUS_IO_ERROR;
    }

    struct hmem_model_params hp;
    enum hmem_status status = read_params(gguf, &hp);

    struct hmem_model * model = NULL;
    if (status == HMEM_STATUS_OK) {
        // weights are overwritten below, the generator only sizes the tensors
        struct hmem_rng rng;
        hmem_rng_init(&rng, 0);
        status = hmem_model_init(&hp, &rng, &model);
    }

    if (status == HMEM_STATUS_OK) {
        struct ggml_tensor * tensors[HMEM_MAX_TENSORS];
        const int32_t n_tensors = hmem_model_get_tensors(model, tensors, HMEM_MAX_TENSORS);
        for (int32_t i = 0; i < n_tensors; i++) {
            struct ggml_tensor * dst = tensors[i];
            struct ggml_tensor * src = ggml_get_tensor(data_ctx, ggml_get_name(dst));
            if (!src || src->type != GGML_TYPE_F32 || !ggml_are_same_shape(src, dst)) {
                HMEM_LOG_ERROR("%s: tensor '%s' is missing or has the wrong shape\n", __func__, ggml_get_name(dst));
                status = HMEM_STATUS_SHAPE_ERROR;
                break;
            }
            memcpy(dst->data, src->data, ggml_nbytes(dst));
        }
    }

    gguf_free(gguf);
    if (data_ctx) {
        ggml_free(data_ctx);
    }

    if (status != HMEM_STATUS_OK) {
        hmem_model_free(model);
        return status;
    }

    HMEM_LOG_INFO("%s: loaded '%s' (vocab %d, memory %d x %d, hops %d, %s)\n", __func__, path,
                  hp.n_vocab, hp.n_units, hp.n_embd, hp.n_hops, hmem_encoding_type_name(hp.encoding_type));
    *out = model;
    return HMEM_STATUS_OK;
}
