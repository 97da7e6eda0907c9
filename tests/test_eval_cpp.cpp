// Test suite for batched evaluation

#include "hmem-eval.h"
#include "hmem-model.h"
#include "hmem-common.h"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            fprintf(stderr, "TEST FAILED: %s\n", msg); \
            exit(1); \
        } \
    } while(0)

void test_cross_entropy_and_argmax() {
    printf("Testing cross-entropy and argmax...\n");

    const float uniform[4] = { 0.5f, 0.5f, 0.5f, 0.5f };
    TEST_ASSERT(fabsf(hmem_sparse_cross_entropy(uniform, 4, 2) - logf(4.0f)) < 1e-6f, "Uniform logits give log(V)");

    const float peaked[3] = { -1000.0f, 1000.0f, -1000.0f };
    TEST_ASSERT(hmem_sparse_cross_entropy(peaked, 3, 1) < 1e-6f, "Confident correct logits give zero loss");
    TEST_ASSERT(isfinite(hmem_sparse_cross_entropy(peaked, 3, 0)), "Large logits should not overflow");
    TEST_ASSERT(hmem_argmax(peaked, 3) == 1, "Argmax mismatch");

    printf("  ✓ Cross-entropy and argmax test passed\n");
}

static struct hmem_model * small_model() {
    struct hmem_model_params params;
    hmem_model_params_init(&params);
    params.n_vocab     = 10;
    params.n_sentences = 3;
    params.n_words     = 4;
    params.n_embd      = 6;
    params.n_units     = 5;
    params.n_hops      = 2;

    struct hmem_rng rng;
    hmem_rng_init(&rng, 77);
    struct hmem_model * model = NULL;
    TEST_ASSERT(hmem_model_init(&params, &rng, &model) == HMEM_STATUS_OK, "Model init failed");
    return model;
}

void test_eval_batches_agree() {
    printf("Testing evaluation is independent of batching...\n");

    struct hmem_model * model = small_model();
    const struct hmem_model_params * hp = &model->params;

    const int32_t n_examples = 7;
    std::vector<int32_t> stories((size_t) n_examples * hp->n_sentences * hp->n_words);
    std::vector<int32_t> queries((size_t) n_examples * hp->n_hops * hp->n_words);
    std::vector<int32_t> answers(n_examples);

    struct hmem_rng rng;
    hmem_rng_init(&rng, 3);
    for (auto & id : stories) id = (int32_t) (hmem_rng_next(&rng) % hp->n_vocab);
    for (int32_t e = 0; e < n_examples; e++) {
        for (int32_t w = 0; w < hp->n_words; w++) {
            const int32_t id = (int32_t) (hmem_rng_next(&rng) % hp->n_vocab);
            for (int32_t h = 0; h < hp->n_hops; h++) {
                queries[((size_t) e * hp->n_hops + h) * hp->n_words + w] = id;
            }
        }
        answers[e] = (int32_t) (hmem_rng_next(&rng) % hp->n_vocab);
    }

    struct hmem_eval_params params;
    hmem_eval_params_init(&params);
    params.n_threads = 1;

    params.n_batch = 7;
    struct hmem_eval_result all;
    TEST_ASSERT(hmem_eval_run(model, &params, stories.data(), queries.data(), answers.data(), n_examples, &all) == HMEM_STATUS_OK,
                "Single batch evaluation failed");

    params.n_batch = 3;
    struct hmem_eval_result batched;
    TEST_ASSERT(hmem_eval_run(model, &params, stories.data(), queries.data(), answers.data(), n_examples, &batched) == HMEM_STATUS_OK,
                "Batched evaluation failed");

    // a tiny budget shrinks the batch to one example
    params.n_batch = 4;
    params.mem_budget = 1;
    struct hmem_eval_result shrunk;
    TEST_ASSERT(hmem_eval_run(model, &params, stories.data(), queries.data(), answers.data(), n_examples, &shrunk) == HMEM_STATUS_OK,
                "Shrunk evaluation failed");

    TEST_ASSERT(all.n_examples == n_examples, "Every example should be evaluated");
    for (int32_t e = 0; e < n_examples; e++) {
        TEST_ASSERT(all.predictions[e] >= 0 && all.predictions[e] < hp->n_vocab, "Prediction outside the vocabulary");
        TEST_ASSERT(all.predictions[e] == batched.predictions[e], "Batching changed a prediction");
        TEST_ASSERT(all.predictions[e] == shrunk.predictions[e], "Shrinking changed a prediction");
    }
    TEST_ASSERT(fabsf(all.loss - batched.loss) < 1e-4f && fabsf(all.loss - shrunk.loss) < 1e-4f, "Batching changed the loss");
    TEST_ASSERT(all.loss > 0.0f, "Loss should be positive");
    TEST_ASSERT(all.accuracy >= 0.0f && all.accuracy <= 1.0f, "Accuracy should be a fraction");
    TEST_ASSERT(fabsf(all.accuracy - (float) all.n_correct / n_examples) < 1e-6f, "Accuracy should match the count");

    hmem_eval_result_free(&all);
    hmem_eval_result_free(&batched);
    hmem_eval_result_free(&shrunk);

    // answers outside the vocabulary are rejected
    answers[0] = hp->n_vocab;
    params.mem_budget = (size_t) 1 << 30;
    struct hmem_eval_result bad;
    TEST_ASSERT(hmem_eval_run(model, &params, stories.data(), queries.data(), answers.data(), n_examples, &bad) == HMEM_STATUS_SHAPE_ERROR,
                "Out of range answer should fail");
    TEST_ASSERT(bad.predictions == NULL, "Failed evaluation should release its predictions");

    hmem_model_free(model);
    printf("  ✓ Batching test passed\n");
}

int main() {
    printf("Running H-Mem Evaluation Tests\n");
    printf("==============================\n\n");

    test_cross_entropy_and_argmax();
    test_eval_batches_agree();

    printf("\n==============================\n");
    printf("All tests passed!\n");
    return 0;
}
