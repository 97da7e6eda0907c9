#include "hmem-common.h"

// graph compute moved to the CPU backend header in newer ggml
#if defined(__has_include)
#  if __has_include("ggml-cpu.h")
#    include "ggml-cpu.h"
#  endif
#endif

#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <vector>

const char * hmem_status_str(enum hmem_status status) {
    switch (status) {
        case HMEM_STATUS_OK:                  return "ok";
        case HMEM_STATUS_CONFIGURATION_ERROR: return "configuration error";
        case HMEM_STATUS_SHAPE_ERROR:         return "shape error";
        case HMEM_STATUS_IO_ERROR:            return "i/o error";
        case HMEM_STATUS_ALLOC_ERROR:         return "allocation error";
    }
    return "unknown status";
}

//
// logging
//

static void hmem_log_callback_default(enum ggml_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}

struct hmem_logger_state {
    ggml_log_callback log_callback = hmem_log_callback_default;
    void * log_callback_user_data  = nullptr;
};

static hmem_logger_state g_logger_state;

void hmem_log_set(ggml_log_callback log_callback, void * user_data) {
    g_logger_state.log_callback           = log_callback ? log_callback : hmem_log_callback_default;
    g_logger_state.log_callback_user_data = user_data;
}

static void hmem_log_internal_v(enum ggml_log_level level, const char * format, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);
    char buffer[256];
    int len = vsnprintf(buffer, sizeof(buffer), format, args);
    if (len >= 0 && len < (int) sizeof(buffer)) {
        g_logger_state.log_callback(level, buffer, g_logger_state.log_callback_user_data);
    } else if (len >= 0) {
        std::vector<char> buffer2(len + 1);
        vsnprintf(buffer2.data(), buffer2.size(), format, args_copy);
        g_logger_state.log_callback(level, buffer2.data(), g_logger_state.log_callback_user_data);
    }
    va_end(args_copy);
}

void hmem_log_internal(enum ggml_log_level level, const char * format, ...) {
    va_list args;
    va_start(args, format);
    hmem_log_internal_v(level, format, args);
    va_end(args);
}

//
// rng
//

void hmem_rng_init(struct hmem_rng * rng, uint64_t seed) {
    if (!rng) return;
    rng->state = 0u;
    rng->inc   = (0xda3e39cb94b95bdbULL << 1u) | 1u;
    hmem_rng_next(rng);
    rng->state += seed;
    hmem_rng_next(rng);
}

uint32_t hmem_rng_next(struct hmem_rng * rng) {
    uint64_t oldstate = rng->state;
    rng->state = oldstate * 6364136223846793005ULL + rng->inc;
    uint32_t xorshifted = (uint32_t) (((oldstate >> 18u) ^ oldstate) >> 27u);
    uint32_t rot = (uint32_t) (oldstate >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

float hmem_rng_uniform(struct hmem_rng * rng, float lo, float hi) {
    // 24 random bits -> [0, 1)
    float u = (float) (hmem_rng_next(rng) >> 8) * (1.0f / 16777216.0f);
    return lo + (hi - lo) * u;
}

void hmem_rng_fill_he_uniform(struct hmem_rng * rng, struct ggml_tensor * tensor, int64_t fan_in) {
    GGML_ASSERT(tensor->type == GGML_TYPE_F32);
    GGML_ASSERT(fan_in > 0);

    const float limit = sqrtf(6.0f / (float) fan_in);
    float * data = (float *) tensor->data;
    const int64_t n = ggml_nelements(tensor);
    for (int64_t i = 0; i < n; i++) {
        data[i] = hmem_rng_uniform(rng, -limit, limit);
    }
}

//
// activations
//

enum hmem_status hmem_activation_parse(const char * name, enum hmem_activation * out) {
    if (!name || !out) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }
    if (strcmp(name, "linear") == 0) { *out = HMEM_ACTIVATION_LINEAR; return HMEM_STATUS_OK; }
    if (strcmp(name, "relu")   == 0) { *out = HMEM_ACTIVATION_RELU;   return HMEM_STATUS_OK; }
    if (strcmp(name, "tanh")   == 0) { *out = HMEM_ACTIVATION_TANH;   return HMEM_STATUS_OK; }
    if (strcmp(name, "gelu")   == 0) { *out = HMEM_ACTIVATION_GELU;   return HMEM_STATUS_OK; }

    HMEM_LOG_ERROR("%s: unknown activation '%s'\n", __func__, name);
    return HMEM_STATUS_CONFIGURATION_ERROR;
}

const char * hmem_activation_name(enum hmem_activation activation) {
    switch (activation) {
        case HMEM_ACTIVATION_LINEAR: return "linear";
        case HMEM_ACTIVATION_RELU:   return "relu";
        case HMEM_ACTIVATION_TANH:   return "tanh";
        case HMEM_ACTIVATION_GELU:   return "gelu";
    }
    return "unknown";
}

struct ggml_tensor * hmem_activation_apply(
    struct ggml_context * ctx,
    enum hmem_activation  activation,
    struct ggml_tensor  * x
) {
    switch (activation) {
        case HMEM_ACTIVATION_LINEAR: return x;
        case HMEM_ACTIVATION_RELU:   return ggml_relu(ctx, x);
        case HMEM_ACTIVATION_TANH:   return ggml_tanh(ctx, x);
        case HMEM_ACTIVATION_GELU:   return ggml_gelu(ctx, x);
    }
    return x;
}

struct ggml_tensor * hmem_l2_penalty(
    struct ggml_context * ctx,
    struct ggml_tensor  * weight,
    float                 l2
) {
    return ggml_scale(ctx, ggml_sum(ctx, ggml_sqr(ctx, weight)), l2);
}

//
// graph execution
//

size_t hmem_graph_overhead(void) {
    return ggml_graph_overhead_custom(HMEM_MAX_NODES, false);
}

enum hmem_status hmem_graph_compute(
    struct ggml_context * ctx,
    struct ggml_tensor ** results,
    int                   n_results,
    int                   n_threads
) {
    if (!ctx || !results || n_results <= 0) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    struct ggml_cgraph * gf = ggml_new_graph_custom(ctx, HMEM_MAX_NODES, false);
    for (int i = 0; i < n_results; i++) {
        if (!results[i]) {
            return HMEM_STATUS_SHAPE_ERROR;
        }
        ggml_build_forward_expand(gf, results[i]);
    }

    enum ggml_status status = ggml_graph_compute_with_ctx(ctx, gf, n_threads > 0 ? n_threads : 1);
    if (status != GGML_STATUS_SUCCESS) {
        HMEM_LOG_ERROR("%s: graph compute failed (%d)\n", __func__, (int) status);
        return HMEM_STATUS_ALLOC_ERROR;
    }

    return HMEM_STATUS_OK;
}
