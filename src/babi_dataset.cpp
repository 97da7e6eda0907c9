#include "babi_dataset.h"
#include "hmem-common.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

// Helper: trim whitespace
static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Helper: split string by delimiter
static std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(s);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(trim(token));
    }
    return tokens;
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Word runs and punctuation runs become separate tokens, whitespace separates
static std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    bool current_is_word = false;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(current);
            current.clear();
            continue;
        }
        const bool word = is_word_char(c);
        if (!current.empty() && word != current_is_word) {
            tokens.push_back(current);
            current.clear();
        }
        current_is_word = word;
        current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!current.empty()) tokens.push_back(current);

    if (!tokens.empty() && (tokens.back() == "." || tokens.back() == "?")) {
        tokens.pop_back();
    }
    return tokens;
}

// answers stay whole: "apple,football" and "n,s" are single vocabulary entries
static std::vector<std::string> answer_token(const std::string& text) {
    std::string answer = trim(text);
    for (auto& c : answer) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (answer.empty()) {
        return {};
    }
    return { answer };
}

static bool sentence_from_tokens(const std::vector<std::string>& tokens, babi_sentence_t* out) {
    out->n_tokens = static_cast<int32_t>(tokens.size());
    out->tokens = nullptr;
    if (tokens.empty()) return true;

    out->tokens = static_cast<char**>(calloc(tokens.size(), sizeof(char*)));
    if (!out->tokens) {
        out->n_tokens = 0;
        return false;
    }
    for (size_t i = 0; i < tokens.size(); i++) {
        out->tokens[i] = strdup(tokens[i].c_str());
        if (!out->tokens[i]) {
            babi_sentence_free(out);
            return false;
        }
    }
    return true;
}

bool babi_tokenize(const char* text, babi_sentence_t* out) {
    if (!text || !out) return false;
    return sentence_from_tokens(tokenize(text), out);
}

void babi_sentence_free(babi_sentence_t* sentence) {
    if (!sentence) return;
    if (sentence->tokens) {
        for (int32_t i = 0; i < sentence->n_tokens; i++) {
            if (sentence->tokens[i]) free(sentence->tokens[i]);
        }
        free(sentence->tokens);
    }
    sentence->tokens = nullptr;
    sentence->n_tokens = 0;
}

struct parsed_example {
    std::vector<std::vector<std::string>> story;
    std::vector<std::string> query;
    std::vector<std::string> answer;
};

babi_dataset_t* babi_dataset_load(const char* path, bool only_supporting) {
    std::ifstream file(path);
    if (!file.is_open()) {
        HMEM_LOG_ERROR("%s: failed to open '%s'\n", __func__, path);
        return nullptr;
    }

    std::vector<parsed_example> parsed;

    // statements of the current story, keyed by line id
    std::vector<std::vector<std::string>> story;
    std::map<int32_t, size_t> line_to_statement;

    std::string line;
    int32_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        const size_t space = line.find(' ');
        if (space == std::string::npos) {
            HMEM_LOG_ERROR("%s: %s:%d: missing line id\n", __func__, path, line_no);
            return nullptr;
        }
        char* end = nullptr;
        const long id = strtol(line.c_str(), &end, 10);
        if (end != line.c_str() + space || id < 1) {
            HMEM_LOG_ERROR("%s: %s:%d: invalid line id\n", __func__, path, line_no);
            return nullptr;
        }
        const std::string text = line.substr(space + 1);

        if (id == 1) {
            story.clear();
            line_to_statement.clear();
        }

        if (text.find('\t') == std::string::npos) {
            line_to_statement[static_cast<int32_t>(id)] = story.size();
            story.push_back(tokenize(text));
            continue;
        }

        // question \t answer \t supporting ids
        auto fields = split(text, '\t');
        if (fields.size() < 2) {
            HMEM_LOG_ERROR("%s: %s:%d: question without an answer\n", __func__, path, line_no);
            return nullptr;
        }

        parsed_example example;
        example.query  = tokenize(fields[0]);
        example.answer = answer_token(fields[1]);

        if (only_supporting && fields.size() >= 3) {
            for (const auto& sid : split(fields[2], ' ')) {
                if (sid.empty()) continue;
                auto it = line_to_statement.find(static_cast<int32_t>(strtol(sid.c_str(), nullptr, 10)));
                if (it == line_to_statement.end()) {
                    HMEM_LOG_ERROR("%s: %s:%d: unknown supporting fact '%s'\n", __func__, path, line_no, sid.c_str());
                    return nullptr;
                }
                example.story.push_back(story[it->second]);
            }
        } else {
            example.story = story;
        }

        parsed.push_back(std::move(example));
    }
    file.close();

    babi_dataset_t* dataset = static_cast<babi_dataset_t*>(malloc(sizeof(babi_dataset_t)));
    if (!dataset) return nullptr;
    memset(dataset, 0, sizeof(babi_dataset_t));

    if (parsed.empty()) {
        return dataset;
    }

    dataset->examples = static_cast<babi_example_t*>(calloc(parsed.size(), sizeof(babi_example_t)));
    if (!dataset->examples) {
        babi_dataset_free(dataset);
        return nullptr;
    }
    dataset->n_examples = static_cast<int32_t>(parsed.size());

    for (size_t i = 0; i < parsed.size(); i++) {
        const auto& src = parsed[i];
        babi_example_t* dst = &dataset->examples[i];

        if (!src.story.empty()) {
            dst->story = static_cast<babi_sentence_t*>(calloc(src.story.size(), sizeof(babi_sentence_t)));
            if (!dst->story) {
                babi_dataset_free(dataset);
                return nullptr;
            }
            dst->n_sentences = static_cast<int32_t>(src.story.size());
        }

        bool ok = true;
        for (size_t s = 0; s < src.story.size() && ok; s++) {
            ok = sentence_from_tokens(src.story[s], &dst->story[s]);
        }
        ok = ok && sentence_from_tokens(src.query, &dst->query);
        ok = ok && sentence_from_tokens(src.answer, &dst->answer);
        if (!ok) {
            babi_dataset_free(dataset);
            return nullptr;
        }
    }

    return dataset;
}

void babi_dataset_free(babi_dataset_t* dataset) {
    if (!dataset) return;

    if (dataset->examples) {
        for (int32_t i = 0; i < dataset->n_examples; i++) {
            babi_example_t* example = &dataset->examples[i];
            if (example->story) {
                for (int32_t s = 0; s < example->n_sentences; s++) {
                    babi_sentence_free(&example->story[s]);
                }
                free(example->story);
            }
            babi_sentence_free(&example->query);
            babi_sentence_free(&example->answer);
        }
        free(dataset->examples);
    }

    free(dataset);
}

void babi_dataset_stats(const babi_dataset_t* const* datasets, int32_t n_datasets, babi_stats_t* out) {
    if (!out) return;
    memset(out, 0, sizeof(babi_stats_t));

    int64_t total_sentences = 0;
    int64_t total_examples = 0;
    int32_t max_sentence = 0;

    for (int32_t d = 0; d < n_datasets; d++) {
        const babi_dataset_t* dataset = datasets[d];
        if (!dataset) continue;

        for (int32_t i = 0; i < dataset->n_examples; i++) {
            const babi_example_t* example = &dataset->examples[i];
            if (example->n_sentences > out->max_story_size) out->max_story_size = example->n_sentences;
            if (example->query.n_tokens > out->max_query_size) out->max_query_size = example->query.n_tokens;
            for (int32_t s = 0; s < example->n_sentences; s++) {
                if (example->story[s].n_tokens > max_sentence) max_sentence = example->story[s].n_tokens;
            }
            total_sentences += example->n_sentences;
            total_examples++;
        }
    }

    out->mean_story_size = total_examples > 0 ? static_cast<int32_t>(total_sentences / total_examples) : 0;
    out->max_sentence_size = max_sentence + 1;  // +1 for the time word
}

babi_vocab_t* babi_vocab_load(const char* path, int32_t n_time_words) {
    if (!path || n_time_words < 0) return nullptr;

    std::ifstream file(path);
    if (!file.is_open()) {
        HMEM_LOG_ERROR("%s: failed to open '%s'\n", __func__, path);
        return nullptr;
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        words.push_back(line);
    }
    file.close();

    if (words.empty()) {
        HMEM_LOG_ERROR("%s: '%s' has no words\n", __func__, path);
        return nullptr;
    }

    babi_vocab_t* vocab = static_cast<babi_vocab_t*>(malloc(sizeof(babi_vocab_t)));
    if (!vocab) return nullptr;
    memset(vocab, 0, sizeof(babi_vocab_t));

    const int32_t n_vocab = 1 + static_cast<int32_t>(words.size()) + n_time_words;
    vocab->tokens = static_cast<char**>(calloc(n_vocab, sizeof(char*)));
    if (!vocab->tokens) {
        free(vocab);
        return nullptr;
    }
    vocab->n_words = static_cast<int32_t>(words.size());
    vocab->n_time_words = n_time_words;
    vocab->n_vocab = n_vocab;

    vocab->tokens[0] = strdup("nil");
    for (int32_t i = 0; i < vocab->n_words; i++) {
        vocab->tokens[1 + i] = strdup(words[i].c_str());
    }
    for (int32_t a = 0; a < n_time_words; a++) {
        char name[32];
        snprintf(name, sizeof(name), "time%d", a + 1);
        vocab->tokens[1 + vocab->n_words + a] = strdup(name);
    }

    for (int32_t i = 0; i < n_vocab; i++) {
        if (!vocab->tokens[i]) {
            babi_vocab_free(vocab);
            return nullptr;
        }
    }

    return vocab;
}

void babi_vocab_free(babi_vocab_t* vocab) {
    if (!vocab) return;
    if (vocab->tokens) {
        for (int32_t i = 0; i < vocab->n_vocab; i++) {
            if (vocab->tokens[i]) free(vocab->tokens[i]);
        }
        free(vocab->tokens);
    }
    free(vocab);
}

int32_t babi_vocab_id(const babi_vocab_t* vocab, const char* word) {
    if (!vocab || !word) return -1;
    for (int32_t i = 1; i <= vocab->n_words; i++) {
        if (strcmp(vocab->tokens[i], word) == 0) {
            return i;
        }
    }
    return -1;
}

int32_t babi_vocab_time_id(const babi_vocab_t* vocab, int32_t age) {
    if (!vocab || age < 0 || age >= vocab->n_time_words) return -1;
    return vocab->n_words + 1 + age;
}

const char* babi_vocab_token(const babi_vocab_t* vocab, int32_t id) {
    if (!vocab || id < 0 || id >= vocab->n_vocab) return nullptr;
    return vocab->tokens[id];
}

// Write word ids of a sentence into dst, the rest stays nil
static bool encode_sentence(const babi_vocab_t* vocab, const babi_sentence_t* sentence, int32_t* dst) {
    for (int32_t w = 0; w < sentence->n_tokens; w++) {
        const int32_t id = babi_vocab_id(vocab, sentence->tokens[w]);
        if (id < 0) {
            HMEM_LOG_ERROR("babi_vectorize: word '%s' is not in the vocabulary\n", sentence->tokens[w]);
            return false;
        }
        dst[w] = id;
    }
    return true;
}

int babi_vectorize(
    const babi_dataset_t* dataset,
    const babi_vocab_t* vocab,
    int32_t n_sentences,
    int32_t n_words,
    int32_t n_hops,
    babi_tensors_t* out
) {
    if (!dataset || !vocab || !out || n_sentences < 1 || n_words < 2 || n_hops < 1) {
        return -1;
    }
    if (vocab->n_time_words < n_sentences) {
        HMEM_LOG_ERROR("%s: vocabulary has %d time words, %d needed\n", __func__, vocab->n_time_words, n_sentences);
        return -1;
    }

    memset(out, 0, sizeof(babi_tensors_t));

    const size_t n_examples = static_cast<size_t>(dataset->n_examples);
    const size_t story_size = static_cast<size_t>(n_sentences) * n_words;
    const size_t query_size = static_cast<size_t>(n_hops) * n_words;

    out->stories = static_cast<int32_t*>(calloc(n_examples * story_size + 1, sizeof(int32_t)));
    out->queries = static_cast<int32_t*>(calloc(n_examples * query_size + 1, sizeof(int32_t)));
    out->answers = static_cast<int32_t*>(calloc(n_examples + 1, sizeof(int32_t)));
    if (!out->stories || !out->queries || !out->answers) {
        babi_tensors_free(out);
        return -1;
    }
    out->n_examples  = dataset->n_examples;
    out->n_sentences = n_sentences;
    out->n_words     = n_words;
    out->n_hops      = n_hops;

    for (size_t e = 0; e < n_examples; e++) {
        const babi_example_t* example = &dataset->examples[e];
        int32_t* story = out->stories + e * story_size;
        int32_t* query = out->queries + e * query_size;

        // most recent sentences that fit
        const int32_t n_kept = example->n_sentences < n_sentences ? example->n_sentences : n_sentences;
        const int32_t first = example->n_sentences - n_kept;

        for (int32_t s = 0; s < n_kept; s++) {
            const babi_sentence_t* sentence = &example->story[first + s];
            if (sentence->n_tokens > n_words - 1) {
                HMEM_LOG_ERROR("%s: example %zu: sentence of %d words does not fit %d slots and a time word\n",
                               __func__, e, sentence->n_tokens, n_words - 1);
                babi_tensors_free(out);
                return -1;
            }
            int32_t* dst = story + static_cast<size_t>(s) * n_words;
            if (!encode_sentence(vocab, sentence, dst)) {
                babi_tensors_free(out);
                return -1;
            }
            // age 0 is the newest kept sentence
            dst[n_words - 1] = babi_vocab_time_id(vocab, n_kept - 1 - s);
        }

        if (example->query.n_tokens > n_words) {
            HMEM_LOG_ERROR("%s: example %zu: query of %d words does not fit %d slots\n",
                           __func__, e, example->query.n_tokens, n_words);
            babi_tensors_free(out);
            return -1;
        }
        if (!encode_sentence(vocab, &example->query, query)) {
            babi_tensors_free(out);
            return -1;
        }
        for (int32_t h = 1; h < n_hops; h++) {
            memcpy(query + static_cast<size_t>(h) * n_words, query, n_words * sizeof(int32_t));
        }

        if (example->answer.n_tokens < 1) {
            HMEM_LOG_ERROR("%s: example %zu has an empty answer\n", __func__, e);
            babi_tensors_free(out);
            return -1;
        }
        const int32_t answer = babi_vocab_id(vocab, example->answer.tokens[0]);
        if (answer < 0) {
            HMEM_LOG_ERROR("%s: answer '%s' is not in the vocabulary\n", __func__, example->answer.tokens[0]);
            babi_tensors_free(out);
            return -1;
        }
        out->answers[e] = answer;
    }

    return 0;
}

void babi_tensors_free(babi_tensors_t* tensors) {
    if (!tensors) return;
    if (tensors->stories) free(tensors->stories);
    if (tensors->queries) free(tensors->queries);
    if (tensors->answers) free(tensors->answers);
    memset(tensors, 0, sizeof(babi_tensors_t));
}
