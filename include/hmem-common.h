#pragma once

#include "ggml.h"

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Status codes returned by every construction and graph-building call.
// Zero is success, errors are negative.
enum hmem_status {
    HMEM_STATUS_OK                  =  0,
    HMEM_STATUS_CONFIGURATION_ERROR = -1,  // invalid option value (e.g. unknown encodings_type)
    HMEM_STATUS_SHAPE_ERROR         = -2,  // tensor shape mismatch at graph construction
    HMEM_STATUS_IO_ERROR            = -3,  // file could not be read or written
    HMEM_STATUS_ALLOC_ERROR         = -4,  // ggml context or buffer allocation failed
};

const char * hmem_status_str(enum hmem_status status);

// Logging
// Uses ggml's callback type so one sink can serve both libraries.
// Passing NULL restores the default sink (stderr).
void hmem_log_set(ggml_log_callback log_callback, void * user_data);

#ifdef __GNUC__
__attribute__((format(printf, 2, 3)))
#endif
void hmem_log_internal(enum ggml_log_level level, const char * format, ...);

#define HMEM_LOG_ERROR(...) hmem_log_internal(GGML_LOG_LEVEL_ERROR, __VA_ARGS__)
#define HMEM_LOG_WARN(...)  hmem_log_internal(GGML_LOG_LEVEL_WARN,  __VA_ARGS__)
#define HMEM_LOG_INFO(...)  hmem_log_internal(GGML_LOG_LEVEL_INFO,  __VA_ARGS__)
#define HMEM_LOG_DEBUG(...) hmem_log_internal(GGML_LOG_LEVEL_DEBUG, __VA_ARGS__)

// Seeded generator (PCG32)
// Passed explicitly into every component that initializes weights.
struct hmem_rng {
    uint64_t state;
    uint64_t inc;
};

void     hmem_rng_init(struct hmem_rng * rng, uint64_t seed);
uint32_t hmem_rng_next(struct hmem_rng * rng);
float    hmem_rng_uniform(struct hmem_rng * rng, float lo, float hi);

// Fill an F32 tensor with U(-sqrt(6/fan_in), sqrt(6/fan_in))
void hmem_rng_fill_he_uniform(struct hmem_rng * rng, struct ggml_tensor * tensor, int64_t fan_in);

// Nonlinearities shared by the dense layers
enum hmem_activation {
    HMEM_ACTIVATION_LINEAR,
    HMEM_ACTIVATION_RELU,
    HMEM_ACTIVATION_TANH,
    HMEM_ACTIVATION_GELU,
};

enum hmem_status hmem_activation_parse(const char * name, enum hmem_activation * out);
const char *     hmem_activation_name(enum hmem_activation activation);

struct ggml_tensor * hmem_activation_apply(
    struct ggml_context * ctx,
    enum hmem_activation  activation,
    struct ggml_tensor  * x
);

// L2 penalty node: l2 * sum(w^2)
struct ggml_tensor * hmem_l2_penalty(
    struct ggml_context * ctx,
    struct ggml_tensor  * weight,
    float                 l2
);

// Graph execution
// Builds a forward graph over all results and runs it on the CPU.
#define HMEM_MAX_NODES 16384

size_t hmem_graph_overhead(void);

enum hmem_status hmem_graph_compute(
    struct ggml_context * ctx,
    struct ggml_tensor ** results,
    int                   n_results,
    int                   n_threads
);

#ifdef __cplusplus
}
#endif
