// Test suite for the composed H-Mem model

#include "hmem-model.h"
#include "hmem-config.h"
#include "hmem-common.h"
#include "babi_dataset.h"
#include "ggml.h"

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

static void write_file(const char * path, const char * text) {
    FILE * f = fopen(path, "w");
    TEST_ASSERT(f != NULL, "Failed to create test file");
    fputs(text, f);
    fclose(f);
}

static struct ggml_context * new_context(size_t mem_size) {
    struct ggml_init_params params = {
        .mem_size   = mem_size,
        .mem_buffer = NULL,
        .no_alloc   = false,
    };
    return ggml_init(params);
}

static void small_params(struct hmem_model_params * params, int32_t n_vocab, int32_t n_sentences, int32_t n_words) {
    hmem_model_params_init(params);
    params->n_vocab     = n_vocab;
    params->n_sentences = n_sentences;
    params->n_words     = n_words;
    params->n_embd      = 4;
    params->n_units     = 5;
    params->n_hops      = 1;
}

// Forward pass over one vectorized batch, returns the logits
static std::vector<float> forward(const struct hmem_model * model, const int32_t * stories, const int32_t * queries, int64_t n_batch,
                                  std::vector<float> * memory_out) {
    struct ggml_context * ctx = new_context(hmem_model_compute_mem_size(&model->params, n_batch));
    TEST_ASSERT(ctx != NULL, "Compute context creation failed");

    struct ggml_tensor * story = hmem_model_new_story(model, ctx, n_batch);
    struct ggml_tensor * query = hmem_model_new_query(model, ctx, n_batch);
    memcpy(story->data, stories, ggml_nbytes(story));
    memcpy(query->data, queries, ggml_nbytes(query));

    struct hmem_model_graph graph;
    TEST_ASSERT(hmem_model_build(model, ctx, story, query, &graph) == HMEM_STATUS_OK, "Model build failed");

    struct ggml_tensor * results[2] = { graph.logits, graph.memory };
    TEST_ASSERT(hmem_graph_compute(ctx, results, 2, 1) == HMEM_STATUS_OK, "Compute failed");

    std::vector<float> logits((const float *) graph.logits->data,
                              (const float *) graph.logits->data + ggml_nelements(graph.logits));
    if (memory_out) {
        memory_out->assign((const float *) graph.memory->data,
                           (const float *) graph.memory->data + ggml_nelements(graph.memory));
    }
    ggml_free(ctx);
    return logits;
}

void test_model_end_to_end() {
    printf("Testing end-to-end story and query...\n");

    write_file("test_model_task.txt",
               "1 John went to kitchen.\n"
               "2 Where is John?\tkitchen\t1\n");
    write_file("test_model_vocab.txt", "is\njohn\nkitchen\nto\nwent\nwhere\n");

    babi_dataset_t * dataset = babi_dataset_load("test_model_task.txt", false);
    TEST_ASSERT(dataset != NULL && dataset->n_examples == 1, "Task parse failed");

    babi_vocab_t * vocab = babi_vocab_load("test_model_vocab.txt", 1);
    TEST_ASSERT(vocab != NULL && vocab->n_vocab == 8, "Vocabulary should have nil, 6 words and 1 time word");

    babi_tensors_t tensors;
    TEST_ASSERT(babi_vectorize(dataset, vocab, 1, 5, 1, &tensors) == 0, "Vectorize failed");

    struct hmem_model_params params;
    small_params(&params, vocab->n_vocab, 1, 5);

    struct hmem_rng rng;
    hmem_rng_init(&rng, 1234);
    struct hmem_model * model = NULL;
    TEST_ASSERT(hmem_model_init(&params, &rng, &model) == HMEM_STATUS_OK, "Model init failed");

    std::vector<float> memory;
    std::vector<float> logits = forward(model, tensors.stories, tensors.queries, 1, &memory);

    TEST_ASSERT((int32_t) logits.size() == vocab->n_vocab, "Logits length should equal the vocabulary size");
    for (float v : logits) {
        TEST_ASSERT(isfinite(v), "Logits should be finite");
    }
    TEST_ASSERT(memory.size() == 5 * 4, "Memory should be memory_size x embeddings_size");
    for (float w : memory) {
        TEST_ASSERT(w >= -params.w_assoc_max && w <= params.w_assoc_max, "Memory outside the bound after one write");
    }

    hmem_model_free(model);
    babi_tensors_free(&tensors);
    babi_vocab_free(vocab);
    babi_dataset_free(dataset);
    remove("test_model_task.txt");
    remove("test_model_vocab.txt");
    printf("  ✓ End-to-end test passed\n");
}

void test_model_encodings() {
    printf("Testing every encoding builds...\n");

    const enum hmem_encoding_type types[3] = { HMEM_ENCODING_IDENTITY, HMEM_ENCODING_POSITION, HMEM_ENCODING_LEARNED };

    std::vector<int32_t> stories = { 2, 5, 4, 3, 7,   0, 0, 0, 0, 0 };   // [n_words, n_sentences = 2]
    std::vector<int32_t> queries = { 6, 1, 2, 0, 0,   6, 1, 2, 0, 0 };   // [n_words, n_hops = 2]

    for (int i = 0; i < 3; i++) {
        struct hmem_model_params params;
        small_params(&params, 9, 2, 5);
        params.n_hops = 2;
        params.encoding_type = types[i];
        params.read_before_write = i == 2;

        struct hmem_rng rng;
        hmem_rng_init(&rng, 99);
        struct hmem_model * model = NULL;
        TEST_ASSERT(hmem_model_init(&params, &rng, &model) == HMEM_STATUS_OK, "Model init failed");

        std::vector<float> logits = forward(model, stories.data(), queries.data(), 1, NULL);
        TEST_ASSERT(logits.size() == 9, "Logits length should equal the vocabulary size");
        for (float v : logits) {
            TEST_ASSERT(isfinite(v), "Logits should be finite");
        }

        hmem_model_free(model);
    }

    printf("  ✓ Encodings test passed\n");
}

void test_model_shape_errors() {
    printf("Testing shape errors at build time...\n");

    struct hmem_model_params params;
    small_params(&params, 8, 1, 5);
    params.n_hops = 2;

    struct hmem_rng rng;
    hmem_rng_init(&rng, 1);
    struct hmem_model * model = NULL;
    TEST_ASSERT(hmem_model_init(&params, &rng, &model) == HMEM_STATUS_OK, "Model init failed");

    struct ggml_context * ctx = new_context(hmem_model_compute_mem_size(&params, 1));
    struct ggml_tensor * story = hmem_model_new_story(model, ctx, 1);
    struct hmem_model_graph graph;

    struct ggml_tensor * three_hops = ggml_new_tensor_3d(ctx, GGML_TYPE_I32, 5, 3, 1);
    TEST_ASSERT(hmem_model_build(model, ctx, story, three_hops, &graph) == HMEM_STATUS_SHAPE_ERROR,
                "Hop count mismatch should be a shape error");

    struct ggml_tensor * wide = ggml_new_tensor_3d(ctx, GGML_TYPE_I32, 6, 2, 1);
    TEST_ASSERT(hmem_model_build(model, ctx, story, wide, &graph) == HMEM_STATUS_SHAPE_ERROR,
                "Word count mismatch should be a shape error");

    struct ggml_tensor * batch2 = ggml_new_tensor_3d(ctx, GGML_TYPE_I32, 5, 2, 2);
    TEST_ASSERT(hmem_model_build(model, ctx, story, batch2, &graph) == HMEM_STATUS_SHAPE_ERROR,
                "Batch mismatch should be a shape error");

    struct ggml_tensor * floats = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 5, 2, 1);
    TEST_ASSERT(hmem_model_build(model, ctx, story, floats, &graph) == HMEM_STATUS_SHAPE_ERROR,
                "Non-index query should be a shape error");

    ggml_free(ctx);
    hmem_model_free(model);
    printf("  ✓ Shape errors test passed\n");
}

void test_model_from_config() {
    printf("Testing model parameters from config...\n");

    struct hmem_config config;
    hmem_config_init_defaults(&config);

    struct hmem_model_params params;
    TEST_ASSERT(hmem_model_params_from_config(&config, 40, 10, 7, &params) == HMEM_STATUS_OK, "Default config should be valid");
    TEST_ASSERT(params.n_hops == 3 && params.n_units == 100 && params.n_embd == 80, "Sizes should follow the config");
    TEST_ASSERT(params.encoding_type == HMEM_ENCODING_LEARNED, "Default encoding should be learned");

    hmem_config_set(&config, "encodings_type", "bag_of_words");
    TEST_ASSERT(hmem_model_params_from_config(&config, 40, 10, 7, &params) == HMEM_STATUS_CONFIGURATION_ERROR,
                "Unknown encoding should be a configuration error");

    hmem_config_init_defaults(&config);
    config.w_assoc_max = -1.0f;
    TEST_ASSERT(hmem_model_params_from_config(&config, 40, 10, 7, &params) == HMEM_STATUS_CONFIGURATION_ERROR,
                "Negative w_assoc_max should be a configuration error");

    printf("  ✓ Config test passed\n");
}

void test_model_save_load() {
    printf("Testing GGUF save and load...\n");

    struct hmem_model_params params;
    small_params(&params, 9, 2, 5);
    params.n_hops = 2;
    params.read_before_write = true;
    params.encoding_type = HMEM_ENCODING_POSITION;

    struct hmem_rng rng;
    hmem_rng_init(&rng, 4321);
    struct hmem_model * model = NULL;
    TEST_ASSERT(hmem_model_init(&params, &rng, &model) == HMEM_STATUS_OK, "Model init failed");

    std::vector<int32_t> stories = { 2, 5, 4, 3, 7,   1, 5, 4, 6, 8 };
    std::vector<int32_t> queries = { 6, 1, 2, 0, 0,   6, 1, 2, 0, 0 };
    std::vector<float> before = forward(model, stories.data(), queries.data(), 1, NULL);

    TEST_ASSERT(hmem_model_save(model, "test_model.gguf") == HMEM_STATUS_OK, "Save failed");

    struct hmem_model * loaded = NULL;
    TEST_ASSERT(hmem_model_load("test_model.gguf", &loaded) == HMEM_STATUS_OK, "Load failed");
    TEST_ASSERT(loaded->params.n_hops == 2 && loaded->params.read_before_write, "Hyper-parameters should be restored");
    TEST_ASSERT(loaded->params.encoding_type == HMEM_ENCODING_POSITION, "Encoding should be restored");
    TEST_ASSERT(loaded->writing.kernel_r != NULL, "Read-before-write kernel should be restored");

    std::vector<float> after = forward(loaded, stories.data(), queries.data(), 1, NULL);
    TEST_ASSERT(before.size() == after.size(), "Logits size changed");
    for (size_t i = 0; i < before.size(); i++) {
        TEST_ASSERT(before[i] == after[i], "Loaded model should reproduce the logits");
    }

    struct hmem_model * missing = NULL;
    TEST_ASSERT(hmem_model_load("does_not_exist.gguf", &missing) == HMEM_STATUS_IO_ERROR, "Missing file should be an I/O error");
    TEST_ASSERT(missing == NULL, "Failed load should not return a model");

    // parent directory does not exist
    TEST_ASSERT(hmem_model_save(model, "no_such_dir/test_model.gguf") == HMEM_STATUS_IO_ERROR,
                "Unwritable path should be an I/O error");

    hmem_model_free(loaded);
    hmem_model_free(model);
    remove("test_model.gguf");
    printf("  ✓ Save and load test passed\n");
}

void test_model_tensors_and_penalty() {
    printf("Testing parameter list and L2 penalty...\n");

    struct hmem_model_params params;
    small_params(&params, 8, 1, 5);

    struct hmem_rng rng;
    hmem_rng_init(&rng, 2);
    struct hmem_model * model = NULL;
    hmem_model_init(&params, &rng, &model);

    struct ggml_tensor * tensors[32];
    const int32_t n = hmem_model_get_tensors(model, tensors, 32);
    // embd, encoding, 4 norms, extracting, kernel_v, kernel_q, kernel_h, output
    TEST_ASSERT(n == 11, "Learned encoding without read-before-write has 11 parameter tensors");
    for (int32_t i = 0; i < n; i++) {
        TEST_ASSERT(tensors[i] != model->nil_mask, "The nil mask is not a parameter");
    }

    struct ggml_context * ctx = new_context(4 * 1024 * 1024);
    struct ggml_tensor * l2 = hmem_model_l2(model, ctx);
    TEST_ASSERT(hmem_graph_compute(ctx, &l2, 1, 1) == HMEM_STATUS_OK, "Compute failed");

    float expected = 0.0f;
    struct ggml_tensor * kernels[4] = { model->extracting.kernel, model->writing.kernel_v, model->reading.kernel_q, model->reading.kernel_h };
    for (int k = 0; k < 4; k++) {
        const float * w = (const float *) kernels[k]->data;
        for (int64_t i = 0; i < ggml_nelements(kernels[k]); i++) {
            expected += params.l2 * w[i] * w[i];
        }
    }
    TEST_ASSERT(fabsf(ggml_get_f32_1d(l2, 0) - expected) < 1e-5f, "L2 penalty mismatch");

    ggml_free(ctx);
    hmem_model_free(model);
    printf("  ✓ Parameter list test passed\n");
}

int main() {
    printf("Running H-Mem Model Tests\n");
    printf("=========================\n\n");

    test_model_end_to_end();
    test_model_encodings();
    test_model_shape_errors();
    test_model_from_config();
    test_model_save_load();
    test_model_tensors_and_penalty();

    printf("\n=========================\n");
    printf("All tests passed!\n");
    return 0;
}
