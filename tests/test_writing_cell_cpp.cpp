// Test suite for the associative memory writer

#include "hmem-writing.h"
#include "hmem-rnn.h"
#include "hmem-common.h"
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

static struct ggml_context * new_context(size_t mem_size) {
    struct ggml_init_params params = {
        .mem_size   = mem_size,
        .mem_buffer = NULL,
        .no_alloc   = false,
    };
    return ggml_init(params);
}

static void fill_uniform(struct ggml_tensor * t, struct hmem_rng * rng, float lo, float hi) {
    float * data = (float *) t->data;
    for (int64_t i = 0; i < ggml_nelements(t); i++) {
        data[i] = hmem_rng_uniform(rng, lo, hi);
    }
}

// Scan the writer over entities [n_units, n_steps, n_batch], keep every state
static std::vector<struct ggml_tensor *> run_writer(
    struct ggml_context * ctx,
    const struct hmem_writing_cell * cell,
    struct ggml_tensor * entities
) {
    std::vector<struct ggml_tensor *> states(entities->ne[1]);
    const struct hmem_cell writer = hmem_writing_cell_as_cell(cell);
    struct hmem_cell_step last;
    enum hmem_status status = hmem_rnn_scan(ctx, &writer, entities, NULL, NULL, states.data(), &last);
    TEST_ASSERT(status == HMEM_STATUS_OK, "Writer scan failed");
    TEST_ASSERT(last.output == states.back(), "Last output should be the final state");
    TEST_ASSERT(hmem_graph_compute(ctx, states.data(), (int) states.size(), 2) == HMEM_STATUS_OK, "Compute failed");
    return states;
}

void test_writing_cell_bound() {
    printf("Testing memory bound under large inputs...\n");

    // 1e30 overflows k * v and k^2 to inf in single precision
    const float scales[] = { 1e4f, 1e30f };

    for (int run = 0; run < 4; run++) {
        const int rbw = run / 2;
        const float scale = scales[run % 2];

        struct ggml_context * ctx = new_context(64 * 1024 * 1024);
        struct hmem_rng rng;
        hmem_rng_init(&rng, 11 + rbw);

        struct hmem_writing_cell_params params;
        hmem_writing_cell_params_init(&params, 4, 3);
        params.read_before_write = rbw == 1;
        params.gamma_pos = 0.5f;
        params.gamma_neg = 0.5f;
        params.w_assoc_max = 0.5f;

        struct hmem_writing_cell cell;
        TEST_ASSERT(hmem_writing_cell_init(ctx, &params, &rng, &cell) == HMEM_STATUS_OK, "Init failed");
        TEST_ASSERT((cell.kernel_r != NULL) == (rbw == 1), "kernel_r exists only with read-before-write");

        struct ggml_tensor * entities = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 4, 6, 2);
        fill_uniform(entities, &rng, -scale, scale);

        std::vector<struct ggml_tensor *> states = run_writer(ctx, &cell, entities);
        for (size_t t = 0; t < states.size(); t++) {
            TEST_ASSERT(states[t]->ne[0] == 3 && states[t]->ne[1] == 4 && states[t]->ne[2] == 2,
                        "Memory should be [n_embd, n_units, n_batch]");
            const float * w = (const float *) states[t]->data;
            for (int64_t i = 0; i < ggml_nelements(states[t]); i++) {
                TEST_ASSERT(isfinite(w[i]), "Memory entry should be finite");
                TEST_ASSERT(w[i] >= -0.5f && w[i] <= 0.5f, "Memory entry outside [-w_assoc_max, w_assoc_max]");
            }
        }

        ggml_free(ctx);
    }

    printf("  ✓ Memory bound test passed\n");
}

void test_writing_cell_zero_input() {
    printf("Testing zero entities leave memory at zero...\n");

    for (int rbw = 0; rbw <= 1; rbw++) {
        struct ggml_context * ctx = new_context(64 * 1024 * 1024);
        struct hmem_rng rng;
        hmem_rng_init(&rng, 5);

        struct hmem_writing_cell_params params;
        hmem_writing_cell_params_init(&params, 5, 4);
        params.read_before_write = rbw == 1;

        struct hmem_writing_cell cell;
        TEST_ASSERT(hmem_writing_cell_init(ctx, &params, &rng, &cell) == HMEM_STATUS_OK, "Init failed");

        struct ggml_tensor * entities = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, 5, 3, 2);
        ggml_set_zero(entities);

        std::vector<struct ggml_tensor *> states = run_writer(ctx, &cell, entities);
        for (size_t t = 0; t < states.size(); t++) {
            const float * w = (const float *) states[t]->data;
            for (int64_t i = 0; i < ggml_nelements(states[t]); i++) {
                TEST_ASSERT(w[i] == 0.0f, "Zero entity should not change the memory");
            }
        }

        ggml_free(ctx);
    }

    printf("  ✓ Zero input test passed\n");
}

// Host-side reference of one write for a single sequence
static void reference_write(
    const struct hmem_writing_cell * cell,
    std::vector<float> & W,            // [n_units][n_embd]
    const float * k
) {
    const struct hmem_writing_cell_params * hp = &cell->params;
    const int M = hp->n_units;
    const int E = hp->n_embd;
    const float * kv_w = (const float *) cell->kernel_v->data;   // ne = [M, E]

    std::vector<float> v(E, 0.0f);
    for (int e = 0; e < E; e++) {
        for (int m = 0; m < M; m++) {
            v[e] += kv_w[e * M + m] * k[m];
        }
    }
    if (hp->read_before_write) {
        const float * kr_w = (const float *) cell->kernel_r->data;  // ne = [E, E]
        std::vector<float> v_hat(E, 0.0f);
        for (int e = 0; e < E; e++) {
            for (int m = 0; m < M; m++) {
                v_hat[e] += W[m * E + e] * k[m];
            }
        }
        for (int e = 0; e < E; e++) {
            for (int j = 0; j < E; j++) {
                v[e] += kr_w[e * E + j] * v_hat[j];
            }
        }
    }
    for (int e = 0; e < E; e++) {
        v[e] = v[e] > 0.0f ? v[e] : 0.0f;
    }

    for (int m = 0; m < M; m++) {
        for (int e = 0; e < E; e++) {
            float w = W[m * E + e];
            w += hp->gamma_pos * (hp->w_assoc_max - w) * k[m] * v[e];
            w -= hp->gamma_neg * k[m] * k[m] * W[m * E + e];
            W[m * E + e] = fminf(fmaxf(w, -hp->w_assoc_max), hp->w_assoc_max);
        }
    }
}

void test_writing_cell_matches_reference() {
    printf("Testing write rule against a host reference...\n");

    const int M = 3, E = 2, T = 4;

    for (int rbw = 0; rbw <= 1; rbw++) {
        struct ggml_context * ctx = new_context(64 * 1024 * 1024);
        struct hmem_rng rng;
        hmem_rng_init(&rng, 21);

        struct hmem_writing_cell_params params;
        hmem_writing_cell_params_init(&params, M, E);
        params.read_before_write = rbw == 1;
        params.gamma_pos = 0.3f;
        params.gamma_neg = 0.2f;
        params.w_assoc_max = 1.0f;

        struct hmem_writing_cell cell;
        hmem_writing_cell_init(ctx, &params, &rng, &cell);

        struct ggml_tensor * entities = ggml_new_tensor_3d(ctx, GGML_TYPE_F32, M, T, 1);
        fill_uniform(entities, &rng, 0.0f, 2.0f);

        std::vector<struct ggml_tensor *> states = run_writer(ctx, &cell, entities);

        std::vector<float> W(M * E, 0.0f);
        const float * k = (const float *) entities->data;
        for (int t = 0; t < T; t++) {
            reference_write(&cell, W, k + t * M);
            const float * got = (const float *) states[t]->data;
            for (int i = 0; i < M * E; i++) {
                TEST_ASSERT(fabsf(got[i] - W[i]) < 1e-4f, "Write rule differs from the reference");
            }
        }

        ggml_free(ctx);
    }

    printf("  ✓ Write rule reference test passed\n");
}

void test_writing_cell_errors() {
    printf("Testing writing cell errors...\n");

    struct ggml_context * ctx = new_context(4 * 1024 * 1024);
    struct hmem_rng rng;
    hmem_rng_init(&rng, 0);

    struct hmem_writing_cell_params params;
    hmem_writing_cell_params_init(&params, 4, 3);
    params.w_assoc_max = 0.0f;

    struct hmem_writing_cell cell;
    TEST_ASSERT(hmem_writing_cell_init(ctx, &params, &rng, &cell) == HMEM_STATUS_CONFIGURATION_ERROR,
                "w_assoc_max = 0 should be rejected");

    params.w_assoc_max = 1.0f;
    TEST_ASSERT(hmem_writing_cell_init(ctx, &params, &rng, &cell) == HMEM_STATUS_OK, "Init failed");

    struct ggml_tensor * memory = hmem_writing_cell_initial_state(&cell, ctx, 1);
    struct ggml_tensor * wrong = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, 5, 1);
    struct hmem_cell_step step;
    TEST_ASSERT(hmem_writing_cell_step(&cell, ctx, memory, wrong, &step) == HMEM_STATUS_SHAPE_ERROR,
                "Entity of the wrong width should be a shape error");

    ggml_free(ctx);
    printf("  ✓ Writing cell errors test passed\n");
}

int main() {
    printf("Running H-Mem WritingCell Tests\n");
    printf("===============================\n\n");

    test_writing_cell_bound();
    test_writing_cell_zero_input();
    test_writing_cell_matches_reference();
    test_writing_cell_errors();

    printf("\n===============================\n");
    printf("All tests passed!\n");
    return 0;
}
