#pragma once

#include "ggml.h"
#include "hmem-common.h"

#ifdef __cplusplus
extern "C" {
#endif

// Sentence encoding
// Turns embedded words [n_embd, n_words, n] into one vector per sentence [n_embd, n].
enum hmem_encoding_type {
    HMEM_ENCODING_IDENTITY,   // pass-through, per-word vectors are kept
    HMEM_ENCODING_POSITION,   // fixed position weighting, then sum over words
    HMEM_ENCODING_LEARNED,    // trainable position weighting, then sum over words
};

// "identity_encoding", "position_encoding", "learned_encoding"
enum hmem_status hmem_encoding_type_parse(const char * name, enum hmem_encoding_type * out);
const char *     hmem_encoding_type_name(enum hmem_encoding_type type);

struct hmem_encoding {
    enum hmem_encoding_type type;
    int32_t n_words;
    int32_t n_embd;
    struct ggml_tensor * weights;  // [n_embd, n_words], NULL for identity
};

// Allocate the weighting tensor in ctx (a weights context, no_alloc = false)
enum hmem_status hmem_encoding_init(
    struct ggml_context  * ctx,
    enum hmem_encoding_type type,
    int32_t                n_words,
    int32_t                n_embd,
    struct hmem_encoding * out
);

// l(k, j) = (1 - j/J) - (k/d) * (1 - 2j/J), j = 1..J words, k = 1..d components
// out: n_embd * n_words floats, component-major within each word
void hmem_position_encoding_fill(float * out, int32_t n_words, int32_t n_embd);

// x: [n_embd, n_words, n]
// identity: returns x itself; otherwise [n_embd, n]
enum hmem_status hmem_encoding_apply(
    struct ggml_context        * ctx,
    const struct hmem_encoding * encoding,
    struct ggml_tensor         * x,
    struct ggml_tensor        ** out
);

// Sum over the word axis: [n_embd, n_words, n] -> [n_embd, n]
struct ggml_tensor * hmem_encoding_sum_words(
    struct ggml_context * ctx,
    struct ggml_tensor  * x
);

#ifdef __cplusplus
}
#endif
