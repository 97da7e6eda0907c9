// hmem-babi: evaluate an H-Mem model on one bAbI task file
//
//   hmem-babi --data_file qa1_single-supporting-fact_test.txt --vocab_file qa1.vocab \
//             [--model_file model.gguf] [--save_file out.gguf] [--config run.json] [--key value ...]

#include "babi_dataset.h"
#include "hmem-common.h"
#include "hmem-config.h"
#include "hmem-eval.h"
#include "hmem-model.h"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

static void log_callback(enum ggml_log_level level, const char * text, void * user_data) {
    const int32_t verbose = *(const int32_t *) user_data;
    if (level == GGML_LOG_LEVEL_DEBUG && verbose < 2) return;
    if (level == GGML_LOG_LEVEL_INFO && verbose < 1) return;
    fputs(text, stderr);
    fflush(stderr);
}

static void print_usage(const char * prog) {
    printf("usage: %s --data_file FILE --vocab_file FILE [options]\n", prog);
    printf("\n");
    printf("  --config FILE             load options from a JSON object\n");
    printf("  --model_file FILE         GGUF model to evaluate (default: fresh weights)\n");
    printf("  --save_file FILE          write the model to FILE\n");
    printf("  --max_num_sentences N     story sentences kept, -1 for the longest story\n");
    printf("  --hops N                  reading hops\n");
    printf("  --memory_size N           memory rows\n");
    printf("  --embeddings_size N       embedding width\n");
    printf("  --read_before_write 0|1\n");
    printf("  --encodings_type NAME     identity_encoding, position_encoding, learned_encoding\n");
    printf("  --random_state N          weight seed, negative draws one from the clock\n");
    printf("  --n_threads N\n");
    printf("  --verbose N\n");
    printf("\n");
    printf("every configuration key is accepted as --key value, HMEM_<KEY> sets it from the environment\n");
}

static void print_vectorized(const babi_tensors_t * tensors, const babi_vocab_t * vocab, int32_t i) {
    const int32_t * story = tensors->stories + (size_t) i * tensors->n_sentences * tensors->n_words;
    HMEM_LOG_DEBUG("story %d (sentence, word):\n", i);
    for (int32_t s = 0; s < tensors->n_sentences; s++) {
        std::string line;
        for (int32_t w = 0; w < tensors->n_words; w++) {
            line += " " + std::to_string(story[s * tensors->n_words + w]);
        }
        HMEM_LOG_DEBUG(" [%s ]\n", line.c_str());
    }
    const int32_t * query = tensors->queries + (size_t) i * tensors->n_hops * tensors->n_words;
    std::string line;
    for (int32_t w = 0; w < tensors->n_words; w++) {
        line += " " + std::to_string(query[w]);
    }
    HMEM_LOG_DEBUG("query (x%d): [%s ]\n", tensors->n_hops, line.c_str());
    HMEM_LOG_DEBUG("answer: %d (%s)\n", tensors->answers[i], babi_vocab_token(vocab, tensors->answers[i]));
}

int main(int argc, char ** argv) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }

    struct hmem_config config;
    hmem_config_init_defaults(&config);
    hmem_log_set(log_callback, &config.verbose);

    hmem_config_load_from_env(&config);
    if (hmem_config_parse_args(&config, argc, argv) != HMEM_STATUS_OK) {
        print_usage(argv[0]);
        return 1;
    }
    if (hmem_config_validate(&config) != HMEM_STATUS_OK) {
        return 1;
    }
    if (config.data_file[0] == '\0' || config.vocab_file[0] == '\0') {
        HMEM_LOG_ERROR("%s: --data_file and --vocab_file are required\n", __func__);
        print_usage(argv[0]);
        return 1;
    }

    uint64_t seed = (uint64_t) config.random_state;
    if (config.random_state < 0) {
        seed = (uint64_t) time(NULL);
        HMEM_LOG_INFO("%s: seed = %llu\n", __func__, (unsigned long long) seed);
    }

    babi_dataset_t * dataset = babi_dataset_load(config.data_file, false);
    if (!dataset) {
        return 1;
    }
    if (dataset->n_examples == 0) {
        HMEM_LOG_ERROR("%s: '%s' has no questions\n", __func__, config.data_file);
        babi_dataset_free(dataset);
        return 1;
    }

    babi_stats_t stats;
    const babi_dataset_t * datasets[] = { dataset };
    babi_dataset_stats(datasets, 1, &stats);

    // a loaded model fixes the input shape, otherwise it follows the data
    struct hmem_model * model = NULL;
    int32_t n_sentences = stats.max_story_size;
    int32_t n_words = stats.max_sentence_size > stats.max_query_size ? stats.max_sentence_size : stats.max_query_size;

    if (config.model_file[0] != '\0') {
        if (hmem_model_load(config.model_file, &model) != HMEM_STATUS_OK) {
            babi_dataset_free(dataset);
            return 1;
        }
        if (model->params.n_hops != config.hops) {
            HMEM_LOG_WARN("%s: using the model's %d hops instead of %d\n", __func__, model->params.n_hops, config.hops);
        }
        if (n_words > model->params.n_words) {
            HMEM_LOG_ERROR("%s: sentences of %d words do not fit the model's %d\n", __func__, n_words, model->params.n_words);
            hmem_model_free(model);
            babi_dataset_free(dataset);
            return 1;
        }
        n_sentences = model->params.n_sentences;
        n_words = model->params.n_words;
    } else if (config.max_num_sentences != -1 && config.max_num_sentences < n_sentences) {
        n_sentences = config.max_num_sentences;
    }

    babi_vocab_t * vocab = babi_vocab_load(config.vocab_file, n_sentences);
    if (!vocab) {
        hmem_model_free(model);
        babi_dataset_free(dataset);
        return 1;
    }

    HMEM_LOG_INFO("-\n");
    HMEM_LOG_INFO("task %d: %d questions from '%s'\n", config.task_id, dataset->n_examples, config.data_file);
    HMEM_LOG_INFO("vocab size: %d unique words (including \"nil\" word and \"time\" words)\n", vocab->n_vocab);
    HMEM_LOG_INFO("story max length: %d sentences\n", stats.max_story_size);
    HMEM_LOG_INFO("story mean length: %d sentences\n", stats.mean_story_size);
    HMEM_LOG_INFO("sentence max length: %d words (including \"time\" word)\n", stats.max_sentence_size);
    HMEM_LOG_INFO("query max length: %d words\n", stats.max_query_size);
    HMEM_LOG_INFO("-\n");

    int ret = 1;
    babi_tensors_t tensors;
    memset(&tensors, 0, sizeof(tensors));
    struct hmem_eval_result result;
    memset(&result, 0, sizeof(result));

    do {
        if (!model) {
            struct hmem_model_params params;
            if (hmem_model_params_from_config(&config, vocab->n_vocab, n_sentences, n_words, &params) != HMEM_STATUS_OK) {
                break;
            }
            struct hmem_rng rng;
            hmem_rng_init(&rng, seed);
            if (hmem_model_init(&params, &rng, &model) != HMEM_STATUS_OK) {
                break;
            }
        } else if (model->params.n_vocab != vocab->n_vocab) {
            HMEM_LOG_ERROR("%s: vocabulary has %d entries, the model %d\n", __func__, vocab->n_vocab, model->params.n_vocab);
            break;
        }

        if (babi_vectorize(dataset, vocab, n_sentences, n_words, model->params.n_hops, &tensors) != 0) {
            break;
        }
        HMEM_LOG_INFO("stories: [%d, %d, %d], queries: [%d, %d, %d]\n",
                      tensors.n_words, tensors.n_sentences, tensors.n_examples,
                      tensors.n_words, tensors.n_hops, tensors.n_examples);
        print_vectorized(&tensors, vocab, 0);

        struct hmem_eval_params eval_params;
        hmem_eval_params_init(&eval_params);
        eval_params.n_batch   = config.batch_size_per_replica;
        eval_params.n_threads = config.n_threads;

        const int64_t t_start = ggml_time_us();
        if (hmem_eval_run(model, &eval_params, tensors.stories, tensors.queries, tensors.answers,
                          tensors.n_examples, &result) != HMEM_STATUS_OK) {
            break;
        }
        const double t_eval = (ggml_time_us() - t_start) / 1e6;

        printf("task %d: loss = %.4f, accuracy = %.4f (%d / %d), %.2f s\n", config.task_id,
               result.loss, result.accuracy, result.n_correct, result.n_examples, t_eval);

        if (config.save_file[0] != '\0') {
            if (hmem_model_save(model, config.save_file) != HMEM_STATUS_OK) {
                break;
            }
            if (config.logging) {
                const std::string config_path = std::string(config.save_file) + ".json";
                if (hmem_config_save_to_json(&config, config_path.c_str()) != HMEM_STATUS_OK) {
                    break;
                }
                HMEM_LOG_INFO("%s: configuration written to '%s'\n", __func__, config_path.c_str());
            }
        }

        ret = 0;
    } while (false);

    hmem_eval_result_free(&result);
    babi_tensors_free(&tensors);
    babi_vocab_free(vocab);
    hmem_model_free(model);
    babi_dataset_free(dataset);

    return ret;
}
