// Test suite for sentence encodings

#include "hmem-encoding.h"
#include "hmem-common.h"
#include "ggml.h"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            fprintf(stderr, "TEST FAILED: %s\n", msg); \
            exit(1); \
        } \
    } while(0)

static struct ggml_context * new_context(size_t mem_size) {
    struct ggml_init_params params = {
        .mem_size   = mem_size,
        .mem_buffer = NULL,
        .no_alloc   = false,
    };
    return ggml_init(params);
}

void test_identity_encoding() {
    printf("Testing identity encoding...\n");

    struct ggml_context * ctx = new_context(16 * 1024 * 1024);
    TEST_ASSERT(ctx != NULL, "Context creation failed");

    struct hmem_encoding enc;
    TEST_ASSERT(hmem_encoding_init(ctx, HMEM_ENCODING_IDENTITY, 3, 4, &enc) == HMEM_STATUS_OK, "Identity init failed");
    TEST_ASSERT(enc.weights == NULL, "Identity encoding should have no weights");

    struct ggml_tensor * x = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 4, 3, 2);
    struct hmem_rng rng;
    hmem_rng_init(&rng, 7);
    float * data = (float *) x->data;
    for (int64_t i = 0; i < ggml_nelements(x); i++) {
        data[i] = hmem_rng_uniform(&rng, -1e6f, 1e6f);
    }
    float before[24];
    memcpy(before, data, sizeof(before));

    struct ggml_tensor * out = NULL;
    TEST_ASSERT(hmem_encoding_apply(ctx, &enc, x, &out) == HMEM_STATUS_OK, "Identity apply failed");
    TEST_ASSERT(out == x, "Identity should return its input");
    TEST_ASSERT(memcmp(out->data, before, sizeof(before)) == 0, "Identity output should be bit-identical");

    ggml_free(ctx);
    printf("  ✓ Identity encoding test passed\n");
}

void test_position_encoding_values() {
    printf("Testing position encoding values...\n");

    const int32_t n_words = 3;
    const int32_t n_embd = 4;
    float a[12];
    float b[12];
    hmem_position_encoding_fill(a, n_words, n_embd);
    hmem_position_encoding_fill(b, n_words, n_embd);
    TEST_ASSERT(memcmp(a, b, sizeof(a)) == 0, "Position encoding should be deterministic");

    // j = 1, k = 1: (1 - 1/3) - (1/4) * (1 - 2/3)
    TEST_ASSERT(fabsf(a[0] - (2.0f / 3.0f - 1.0f / 12.0f)) < 1e-6f, "Wrong value at j=1, k=1");
    // j = 3, k = 4: (1 - 1) - 1 * (1 - 2) = 1
    TEST_ASSERT(fabsf(a[2 * n_embd + 3] - 1.0f) < 1e-6f, "Wrong value at j=3, k=4");

    printf("  ✓ Position encoding values test passed\n");
}

void test_position_encoding_apply() {
    printf("Testing position encoding apply...\n");

    struct ggml_context * ctx = new_context(16 * 1024 * 1024);

    struct hmem_encoding enc;
    TEST_ASSERT(hmem_encoding_init(ctx, HMEM_ENCODING_POSITION, 3, 4, &enc) == HMEM_STATUS_OK, "Position init failed");
    TEST_ASSERT(enc.weights != NULL, "Position encoding should have weights");

    // two sentences of ones: output is the per-component sum of l(k, j)
    struct ggml_tensor * x = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 4, 3, 2);
    ggml_set_f32(x, 1.0f);

    struct ggml_tensor * out = NULL;
    TEST_ASSERT(hmem_encoding_apply(ctx, &enc, x, &out) == HMEM_STATUS_OK, "Position apply failed");
    TEST_ASSERT(out->ne[0] == 4 && out->ne[1] == 2, "Output should be [n_embd, n]");

    TEST_ASSERT(hmem_graph_compute(ctx, &out, 1, 1) == HMEM_STATUS_OK, "Compute failed");

    float l[12];
    hmem_position_encoding_fill(l, 3, 4);
    const float * y = (const float *) out->data;
    for (int n = 0; n < 2; n++) {
        for (int k = 0; k < 4; k++) {
            const float expected = l[k] + l[4 + k] + l[8 + k];
            TEST_ASSERT(fabsf(y[n * 4 + k] - expected) < 1e-5f, "Weighted sum mismatch");
        }
    }

    ggml_free(ctx);
    printf("  ✓ Position encoding apply test passed\n");
}

void test_learned_encoding_starts_as_bag_of_words() {
    printf("Testing learned encoding initialization...\n");

    struct ggml_context * ctx = new_context(16 * 1024 * 1024);

    struct hmem_encoding enc;
    TEST_ASSERT(hmem_encoding_init(ctx, HMEM_ENCODING_LEARNED, 2, 3, &enc) == HMEM_STATUS_OK, "Learned init failed");

    struct ggml_tensor * x = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 3, 2, 1);
    float * data = (float *) x->data;
    for (int i = 0; i < 6; i++) {
        data[i] = (float) (i + 1);
    }

    struct ggml_tensor * out = NULL;
    TEST_ASSERT(hmem_encoding_apply(ctx, &enc, x, &out) == HMEM_STATUS_OK, "Learned apply failed");
    TEST_ASSERT(hmem_graph_compute(ctx, &out, 1, 1) == HMEM_STATUS_OK, "Compute failed");

    const float * y = (const float *) out->data;
    TEST_ASSERT(fabsf(y[0] - 5.0f) < 1e-6f && fabsf(y[1] - 7.0f) < 1e-6f && fabsf(y[2] - 9.0f) < 1e-6f,
                "Initial learned encoding should sum the words");

    ggml_free(ctx);
    printf("  ✓ Learned encoding initialization test passed\n");
}

void test_encoding_errors() {
    printf("Testing encoding errors...\n");

    enum hmem_encoding_type type;
    TEST_ASSERT(hmem_encoding_type_parse("fourier_encoding", &type) == HMEM_STATUS_CONFIGURATION_ERROR,
                "Unknown encoding name should be a configuration error");
    TEST_ASSERT(hmem_encoding_type_parse("position_encoding", &type) == HMEM_STATUS_OK && type == HMEM_ENCODING_POSITION,
                "position_encoding should parse");
    TEST_ASSERT(strcmp(hmem_encoding_type_name(HMEM_ENCODING_LEARNED), "learned_encoding") == 0,
                "Name should round trip");

    struct ggml_context * ctx = new_context(1024 * 1024);
    struct hmem_encoding enc;
    TEST_ASSERT(hmem_encoding_init(ctx, HMEM_ENCODING_POSITION, 3, 4, &enc) == HMEM_STATUS_OK, "Position init failed");

    struct ggml_tensor * wrong = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 4, 5, 1);
    struct ggml_tensor * out = NULL;
    TEST_ASSERT(hmem_encoding_apply(ctx, &enc, wrong, &out) == HMEM_STATUS_SHAPE_ERROR,
                "Word count mismatch should be a shape error");

    ggml_free(ctx);
    printf("  ✓ Encoding errors test passed\n");
}

int main() {
    printf("Running H-Mem Encoding Tests\n");
    printf("============================\n\n");

    test_identity_encoding();
    test_position_encoding_values();
    test_position_encoding_apply();
    test_learned_encoding_starts_as_bag_of_words();
    test_encoding_errors();

    printf("\n============================\n");
    printf("All tests passed!\n");
    return 0;
}
