#pragma once

#include "hmem-common.h"
#include "hmem-model.h"

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Batched forward evaluation over vectorized bAbI examples

struct hmem_eval_params {
    int32_t n_batch;        // examples per graph
    int32_t n_threads;
    size_t  mem_budget;     // upper bound for one compute context, bytes
};

struct hmem_eval_result {
    int32_t  n_examples;
    int32_t  n_correct;
    int32_t* predictions;   // argmax of the logits, one per example
    float    loss;          // mean sparse softmax cross-entropy
    float    accuracy;
};

void hmem_eval_params_init(struct hmem_eval_params * params);

// stories: [n_words, n_sentences, n_examples], queries: [n_words, n_hops, n_examples],
// answers: [n_examples] (may be NULL, loss and accuracy are then zero)
// Caller frees the result with hmem_eval_result_free
enum hmem_status hmem_eval_run(
    const struct hmem_model       * model,
    const struct hmem_eval_params * params,
    const int32_t                 * stories,
    const int32_t                 * queries,
    const int32_t                 * answers,
    int32_t                         n_examples,
    struct hmem_eval_result       * out
);

void hmem_eval_result_free(struct hmem_eval_result * result);

// Cross-entropy of one logits row against a target index
float hmem_sparse_cross_entropy(const float * logits, int32_t n_vocab, int32_t target);

// Index of the largest logit
int32_t hmem_argmax(const float * logits, int32_t n_vocab);

#ifdef __cplusplus
}
#endif
