#include "hmem-eval.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

void hmem_eval_params_init(struct hmem_eval_params * params) {
    if (!params) return;
    params->n_batch    = 32;
    params->n_threads  = 4;
    params->mem_budget = (size_t) 2 * 1024 * 1024 * 1024;
}

float hmem_sparse_cross_entropy(const float * logits, int32_t n_vocab, int32_t target) {
    float max_logit = logits[0];
    for (int32_t i = 1; i < n_vocab; i++) {
        if (logits[i] > max_logit) max_logit = logits[i];
    }
    double sum = 0.0;
    for (int32_t i = 0; i < n_vocab; i++) {
        sum += std::exp((double) (logits[i] - max_logit));
    }
    return (float) (std::log(sum) - (double) (logits[target] - max_logit));
}

int32_t hmem_argmax(const float * logits, int32_t n_vocab) {
    int32_t best = 0;
    for (int32_t i = 1; i < n_vocab; i++) {
        if (logits[i] > logits[best]) best = i;
    }
    return best;
}

// Run one batch of n_batch examples starting at first
static enum hmem_status eval_batch(
    const struct hmem_model       * model,
    const struct hmem_eval_params * params,
    const int32_t                 * stories,
    const int32_t                 * queries,
    int64_t                         first,
    int64_t                         n_batch,
    float                         * logits_out
) {
    const struct hmem_model_params * hp = &model->params;
    const size_t story_size = (size_t) hp->n_words * hp->n_sentences;
    const size_t query_size = (size_t) hp->n_words * hp->n_hops;

    struct ggml_init_params ctx_params = {
        .mem_size   = hmem_model_compute_mem_size(hp, n_batch),
        .mem_buffer = NULL,
        .no_alloc   = false,
    };
    struct ggml_context * ctx = ggml_init(ctx_params);
    if (!ctx) {
        HMEM_LOG_ERROR("%s: failed to allocate %zu bytes\n", __func__, ctx_params.mem_size);
        return HMEM_STATUS_ALLOC_ERROR;
    }

    struct ggml_tensor * story = hmem_model_new_story(model, ctx, n_batch);
    struct ggml_tensor * query = hmem_model_new_query(model, ctx, n_batch);
    memcpy(story->data, stories + first * story_size, ggml_nbytes(story));
    memcpy(query->data, queries + first * query_size, ggml_nbytes(query));

    struct hmem_model_graph graph;
    enum hmem_status status = hmem_model_build(model, ctx, story, query, &graph);
    if (status == HMEM_STATUS_OK) {
        status = hmem_graph_compute(ctx, &graph.logits, 1, params->n_threads);
    }
    if (status == HMEM_STATUS_OK) {
        memcpy(logits_out, graph.logits->data, ggml_nbytes(graph.logits));
    }

    ggml_free(ctx);
    return status;
}

enum hmem_status hmem_eval_run(
    const struct hmem_model       * model,
    const struct hmem_eval_params * params,
    const int32_t                 * stories,
    const int32_t                 * queries,
    const int32_t                 * answers,
    int32_t                         n_examples,
    struct hmem_eval_result       * out
) {
    if (!model || !params || !stories || !queries || !out || n_examples < 0 || params->n_batch < 1) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    memset(out, 0, sizeof(struct hmem_eval_result));
    if (n_examples == 0) {
        return HMEM_STATUS_OK;
    }

    const struct hmem_model_params * hp = &model->params;

    int64_t n_batch = params->n_batch < n_examples ? params->n_batch : n_examples;
    while (n_batch > 1 && hmem_model_compute_mem_size(hp, n_batch) > params->mem_budget) {
        n_batch /= 2;
    }
    if (n_batch < params->n_batch && n_batch < n_examples) {
        HMEM_LOG_WARN("%s: batch reduced from %d to %lld to stay within %zu bytes\n", __func__,
                      params->n_batch, (long long) n_batch, params->mem_budget);
    }

    out->predictions = (int32_t *) calloc(n_examples, sizeof(int32_t));
    float * logits = (float *) malloc(sizeof(float) * (size_t) hp->n_vocab * n_batch);
    if (!out->predictions || !logits) {
        free(logits);
        hmem_eval_result_free(out);
        return HMEM_STATUS_ALLOC_ERROR;
    }
    out->n_examples = n_examples;

    double loss_sum = 0.0;

    for (int64_t first = 0; first < n_examples; first += n_batch) {
        const int64_t cur = (first + n_batch <= n_examples) ? n_batch : n_examples - first;

        enum hmem_status status = eval_batch(model, params, stories, queries, first, cur, logits);
        if (status != HMEM_STATUS_OK) {
            free(logits);
            hmem_eval_result_free(out);
            return status;
        }

        for (int64_t i = 0; i < cur; i++) {
            const float * row = logits + i * hp->n_vocab;
            const int32_t prediction = hmem_argmax(row, hp->n_vocab);
            out->predictions[first + i] = prediction;

            if (answers) {
                const int32_t target = answers[first + i];
                if (target < 0 || target >= hp->n_vocab) {
                    HMEM_LOG_ERROR("%s: answer %d of example %lld is outside the vocabulary\n", __func__,
                                   target, (long long) (first + i));
                    free(logits);
                    hmem_eval_result_free(out);
                    return HMEM_STATUS_SHAPE_ERROR;
                }
                loss_sum += hmem_sparse_cross_entropy(row, hp->n_vocab, target);
                if (prediction == target) {
                    out->n_correct++;
                }
            }
        }

        HMEM_LOG_DEBUG("%s: %lld / %d\n", __func__, (long long) (first + cur), n_examples);
    }

    free(logits);

    if (answers) {
        out->loss     = (float) (loss_sum / n_examples);
        out->accuracy = (float) out->n_correct / (float) n_examples;
    }
    return HMEM_STATUS_OK;
}

void hmem_eval_result_free(struct hmem_eval_result * result) {
    if (!result) return;
    if (result->predictions) {
        free(result->predictions);
    }
    memset(result, 0, sizeof(struct hmem_eval_result));
}
