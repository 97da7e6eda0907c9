#pragma once

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// bAbI question answering tasks (story, query, answer) and their vectorization

// Tokenized sentence, lowercased, trailing '.' / '?' removed
typedef struct {
    int32_t n_tokens;
    char** tokens;
} babi_sentence_t;

// One question with the story seen up to it
typedef struct {
    int32_t n_sentences;
    babi_sentence_t* story;   // statements in order of appearance
    babi_sentence_t query;
    babi_sentence_t answer;   // answer text as a single token
} babi_example_t;

typedef struct {
    int32_t n_examples;
    babi_example_t* examples;
} babi_dataset_t;

typedef struct {
    int32_t max_story_size;     // sentences
    int32_t mean_story_size;    // sentences
    int32_t max_sentence_size;  // words, including the time word
    int32_t max_query_size;     // words
} babi_stats_t;

// Vocabulary: index 0 is "nil", file words follow, then n_time_words time words.
// tokens[i] names index i; time word of age a (0 = newest) is "time{a+1}".
typedef struct {
    int32_t n_words;       // words read from the file
    int32_t n_time_words;
    int32_t n_vocab;       // 1 + n_words + n_time_words
    char** tokens;
} babi_vocab_t;

// Integer tensors in ggml order (innermost first):
//   stories [n_words, n_sentences, n_examples]
//   queries [n_words, n_hops, n_examples]
//   answers [n_examples]
typedef struct {
    int32_t n_examples;
    int32_t n_sentences;
    int32_t n_words;
    int32_t n_hops;
    int32_t* stories;
    int32_t* queries;
    int32_t* answers;
} babi_tensors_t;

// Tokenize one line of text. Returns false on allocation failure.
bool babi_tokenize(const char* text, babi_sentence_t* out);
void babi_sentence_free(babi_sentence_t* sentence);

// Parse a bAbI task file (e.g. qa1_single-supporting-fact_test.txt)
// only_supporting keeps just the supporting facts of each question
// Returns NULL on failure
babi_dataset_t* babi_dataset_load(const char* path, bool only_supporting);

void babi_dataset_free(babi_dataset_t* dataset);

// Statistics over one or more datasets (NULL entries are skipped)
void babi_dataset_stats(const babi_dataset_t* const* datasets, int32_t n_datasets, babi_stats_t* out);

// Load vocabulary file, one word per line. Returns NULL on failure
babi_vocab_t* babi_vocab_load(const char* path, int32_t n_time_words);
void babi_vocab_free(babi_vocab_t* vocab);

// Index of a word (-1 if not found), of a time word by age (-1 if out of range)
int32_t babi_vocab_id(const babi_vocab_t* vocab, const char* word);
int32_t babi_vocab_time_id(const babi_vocab_t* vocab, int32_t age);

// Token for an index, NULL if out of range
const char* babi_vocab_token(const babi_vocab_t* vocab, int32_t id);

// Vectorize examples. Sentences keep one slot for the time word, so
// n_words must exceed the longest sentence. Returns 0 on success, -1 on
// unknown words or sizes that do not fit.
int babi_vectorize(
    const babi_dataset_t* dataset,
    const babi_vocab_t* vocab,
    int32_t n_sentences,
    int32_t n_words,
    int32_t n_hops,
    babi_tensors_t* out
);

void babi_tensors_free(babi_tensors_t* tensors);

#ifdef __cplusplus
}
#endif
