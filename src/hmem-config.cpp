#include "hmem-config.h"
#include "hmem-encoding.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

// Key table: every config field is addressable by name
enum hmem_config_value_type {
    HMEM_CONFIG_STR,
    HMEM_CONFIG_INT,
    HMEM_CONFIG_FLOAT,
    HMEM_CONFIG_BOOL,
};

struct hmem_config_key {
    const char * name;
    enum hmem_config_value_type type;
    size_t offset;
    size_t size;
};

static const struct hmem_config_key HMEM_CONFIG_KEYS[] = {
    { "data_file",              HMEM_CONFIG_STR,   offsetof(struct hmem_config, data_file), sizeof(hmem_config::data_file) },
    { "vocab_file",             HMEM_CONFIG_STR,   offsetof(struct hmem_config, vocab_file), sizeof(hmem_config::vocab_file) },
    { "model_file",             HMEM_CONFIG_STR,   offsetof(struct hmem_config, model_file), sizeof(hmem_config::model_file) },
    { "save_file",              HMEM_CONFIG_STR,   offsetof(struct hmem_config, save_file), sizeof(hmem_config::save_file) },
    { "task_id",                HMEM_CONFIG_INT,   offsetof(struct hmem_config, task_id), sizeof(hmem_config::task_id) },
    { "max_num_sentences",      HMEM_CONFIG_INT,   offsetof(struct hmem_config, max_num_sentences), sizeof(hmem_config::max_num_sentences) },
    { "training_set_size",      HMEM_CONFIG_STR,   offsetof(struct hmem_config, training_set_size), sizeof(hmem_config::training_set_size) },
    { "epochs",                 HMEM_CONFIG_INT,   offsetof(struct hmem_config, epochs), sizeof(hmem_config::epochs) },
    { "learning_rate",          HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, learning_rate), sizeof(hmem_config::learning_rate) },
    { "batch_size_per_replica", HMEM_CONFIG_INT,   offsetof(struct hmem_config, batch_size_per_replica), sizeof(hmem_config::batch_size_per_replica) },
    { "random_state",           HMEM_CONFIG_INT,   offsetof(struct hmem_config, random_state), sizeof(hmem_config::random_state) },
    { "max_grad_norm",          HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, max_grad_norm), sizeof(hmem_config::max_grad_norm) },
    { "validation_split",       HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, validation_split), sizeof(hmem_config::validation_split) },
    { "hops",                   HMEM_CONFIG_INT,   offsetof(struct hmem_config, hops), sizeof(hmem_config::hops) },
    { "memory_size",            HMEM_CONFIG_INT,   offsetof(struct hmem_config, memory_size), sizeof(hmem_config::memory_size) },
    { "embeddings_size",        HMEM_CONFIG_INT,   offsetof(struct hmem_config, embeddings_size), sizeof(hmem_config::embeddings_size) },
    { "read_before_write",      HMEM_CONFIG_BOOL,  offsetof(struct hmem_config, read_before_write), sizeof(hmem_config::read_before_write) },
    { "gamma_pos",              HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, gamma_pos), sizeof(hmem_config::gamma_pos) },
    { "gamma_neg",              HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, gamma_neg), sizeof(hmem_config::gamma_neg) },
    { "w_assoc_max",            HMEM_CONFIG_FLOAT, offsetof(struct hmem_config, w_assoc_max), sizeof(hmem_config::w_assoc_max) },
    { "encodings_type",         HMEM_CONFIG_STR,   offsetof(struct hmem_config, encodings_type), sizeof(hmem_config::encodings_type) },
    { "n_threads",              HMEM_CONFIG_INT,   offsetof(struct hmem_config, n_threads), sizeof(hmem_config::n_threads) },
    { "verbose",                HMEM_CONFIG_INT,   offsetof(struct hmem_config, verbose), sizeof(hmem_config::verbose) },
    { "logging",                HMEM_CONFIG_BOOL,  offsetof(struct hmem_config, logging), sizeof(hmem_config::logging) },
};


static const size_t HMEM_N_CONFIG_KEYS = sizeof(HMEM_CONFIG_KEYS) / sizeof(HMEM_CONFIG_KEYS[0]);

static const struct hmem_config_key * find_config_key(const char * name) {
    for (size_t i = 0; i < HMEM_N_CONFIG_KEYS; i++) {
        if (strcmp(HMEM_CONFIG_KEYS[i].name, name) == 0) {
            return &HMEM_CONFIG_KEYS[i];
        }
    }
    return NULL;
}

static void copy_string(char * dst, size_t dst_size, const char * src) {
    strncpy(dst, src, dst_size - 1);
    dst[dst_size - 1] = '\0';
}

void hmem_config_init_defaults(struct hmem_config * config) {
    if (!config) return;

    memset(config, 0, sizeof(struct hmem_config));

    config->task_id           = 1;
    config->max_num_sentences = -1;
    copy_string(config->training_set_size, sizeof(config->training_set_size), "10k");

    config->epochs                 = 100;
    config->learning_rate          = 0.003f;
    config->batch_size_per_replica = 128;
    config->random_state           = -1;
    config->max_grad_norm          = 20.0f;
    config->validation_split       = 0.1f;

    config->hops              = 3;
    config->memory_size       = 100;
    config->embeddings_size   = 80;
    config->read_before_write = false;
    config->gamma_pos         = 0.01f;
    config->gamma_neg         = 0.01f;
    config->w_assoc_max       = 1.0f;
    copy_string(config->encodings_type, sizeof(config->encodings_type), "learned_encoding");

    config->n_threads = 4;
    config->verbose   = 1;
    config->logging   = false;
}

static bool parse_bool_text(const char * text, bool * out) {
    if (strcmp(text, "1") == 0 || strcasecmp(text, "true") == 0) {
        *out = true;
        return true;
    }
    if (strcmp(text, "0") == 0 || strcasecmp(text, "false") == 0) {
        *out = false;
        return true;
    }
    return false;
}

enum hmem_status hmem_config_set(struct hmem_config * config, const char * key, const char * value) {
    if (!config || !key || !value) return HMEM_STATUS_CONFIGURATION_ERROR;

    const struct hmem_config_key * entry = find_config_key(key);
    if (!entry) {
        HMEM_LOG_ERROR("%s: unknown config key '%s'\n", __func__, key);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    char * field = (char *) config + entry->offset;
    char * end = NULL;
    errno = 0;

    switch (entry->type) {
        case HMEM_CONFIG_STR: {
            if (strlen(value) >= entry->size) {
                HMEM_LOG_ERROR("%s: value for '%s' is too long\n", __func__, key);
                return HMEM_STATUS_CONFIGURATION_ERROR;
            }
            copy_string(field, entry->size, value);
        } break;
        case HMEM_CONFIG_INT: {
            long v = strtol(value, &end, 10);
            if (end == value || *end != '\0' || errno == ERANGE || v < INT32_MIN || v > INT32_MAX) {
                HMEM_LOG_ERROR("%s: '%s' expects an integer, got '%s'\n", __func__, key, value);
                return HMEM_STATUS_CONFIGURATION_ERROR;
            }
            *(int32_t *) field = (int32_t) v;
        } break;
        case HMEM_CONFIG_FLOAT: {
            float v = strtof(value, &end);
            if (end == value || *end != '\0' || errno == ERANGE) {
                HMEM_LOG_ERROR("%s: '%s' expects a number, got '%s'\n", __func__, key, value);
                return HMEM_STATUS_CONFIGURATION_ERROR;
            }
            *(float *) field = v;
        } break;
        case HMEM_CONFIG_BOOL: {
            if (!parse_bool_text(value, (bool *) field)) {
                HMEM_LOG_ERROR("%s: '%s' expects 0/1/true/false, got '%s'\n", __func__, key, value);
                return HMEM_STATUS_CONFIGURATION_ERROR;
            }
        } break;
    }

    return HMEM_STATUS_OK;
}

enum hmem_status hmem_config_get(const struct hmem_config * config, const char * key, char * out, size_t out_size) {
    if (!config || !key || !out || out_size == 0) return HMEM_STATUS_CONFIGURATION_ERROR;

    const struct hmem_config_key * entry = find_config_key(key);
    if (!entry) {
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    const char * field = (const char *) config + entry->offset;
    int n = 0;
    switch (entry->type) {
        case HMEM_CONFIG_STR:   n = snprintf(out, out_size, "%s", field);                            break;
        case HMEM_CONFIG_INT:   n = snprintf(out, out_size, "%d", *(const int32_t *) field);         break;
        case HMEM_CONFIG_FLOAT: n = snprintf(out, out_size, "%g", (double) *(const float *) field);  break;
        case HMEM_CONFIG_BOOL:  n = snprintf(out, out_size, "%d", *(const bool *) field ? 1 : 0);    break;
    }

    return (n >= 0 && (size_t) n < out_size) ? HMEM_STATUS_OK : HMEM_STATUS_CONFIGURATION_ERROR;
}

void hmem_config_load_from_env(struct hmem_config * config) {
    if (!config) return;

    char env_name[64];
    for (size_t i = 0; i < HMEM_N_CONFIG_KEYS; i++) {
        const char * name = HMEM_CONFIG_KEYS[i].name;
        size_t n = snprintf(env_name, sizeof(env_name), "HMEM_%s", name);
        for (size_t j = 5; j < n && j < sizeof(env_name); j++) {
            env_name[j] = (char) toupper((unsigned char) env_name[j]);
        }

        const char * env_val = getenv(env_name);
        if (env_val && hmem_config_set(config, name, env_val) != HMEM_STATUS_OK) {
            HMEM_LOG_WARN("%s: ignoring %s='%s'\n", __func__, env_name, env_val);
        }
    }
}

// Simple JSON parser helpers (flat objects only)
static void skip_whitespace(const char ** p) {
    while (**p && isspace((unsigned char) **p)) (*p)++;
}

static bool parse_string(const char ** p, char * out, size_t out_size) {
    skip_whitespace(p);
    if (**p != '"') return false;
    (*p)++;

    size_t i = 0;
    while (**p && **p != '"') {
        char c = **p;
        if (c == '\\') {
            (*p)++;
            if      (**p == 'n')  c = '\n';
            else if (**p == 't')  c = '\t';
            else if (**p == '\0') return false;
            else                  c = **p;
        }
        if (i + 1 >= out_size) return false;
        out[i++] = c;
        (*p)++;
    }
    out[i] = '\0';

    if (**p != '"') return false;
    (*p)++;
    return true;
}

// Bare token: number, true, false
static bool parse_token(const char ** p, char * out, size_t out_size) {
    skip_whitespace(p);
    size_t i = 0;
    while (**p && **p != ',' && **p != '}' && !isspace((unsigned char) **p)) {
        if (i + 1 >= out_size) return false;
        out[i++] = **p;
        (*p)++;
    }
    out[i] = '\0';
    return i > 0;
}

static enum hmem_status parse_json_object(struct hmem_config * config, const char * text) {
    const char * p = text;
    skip_whitespace(&p);
    if (*p != '{') return HMEM_STATUS_CONFIGURATION_ERROR;
    p++;

    char key[64];
    char value[512];
    while (true) {
        skip_whitespace(&p);
        if (*p == '}') break;

        if (!parse_string(&p, key, sizeof(key))) return HMEM_STATUS_CONFIGURATION_ERROR;
        skip_whitespace(&p);
        if (*p != ':') return HMEM_STATUS_CONFIGURATION_ERROR;
        p++;
        skip_whitespace(&p);

        bool ok = (*p == '"') ? parse_string(&p, value, sizeof(value)) : parse_token(&p, value, sizeof(value));
        if (!ok) return HMEM_STATUS_CONFIGURATION_ERROR;

        enum hmem_status status = hmem_config_set(config, key, value);
        if (status != HMEM_STATUS_OK) return status;

        skip_whitespace(&p);
        if (*p == ',') {
            p++;
        } else if (*p != '}') {
            return HMEM_STATUS_CONFIGURATION_ERROR;
        }
    }

    return HMEM_STATUS_OK;
}

enum hmem_status hmem_config_load_from_json(struct hmem_config * config, const char * json_path) {
    if (!config || !json_path) return HMEM_STATUS_CONFIGURATION_ERROR;

    FILE * f = fopen(json_path, "r");
    if (!f) {
        HMEM_LOG_ERROR("%s: failed to open '%s'\n", __func__, json_path);
        return HMEM_STATUS_IO_ERROR;
    }

    // Read entire file (config files are small)
    fseek(f, 0, SEEK_END);
    long size = ftell(f);
    fseek(f, 0, SEEK_SET);

    if (size <= 0 || size > 65536) {
        fclose(f);
        HMEM_LOG_ERROR("%s: '%s' has unexpected size %ld\n", __func__, json_path, size);
        return HMEM_STATUS_CONFIGURATION_ERROR;
    }

    char * buffer = (char *) malloc(size + 1);
    if (!buffer) {
        fclose(f);
        return HMEM_STATUS_ALLOC_ERROR;
    }

    size_t n_read = fread(buffer, 1, size, f);
    buffer[n_read] = '\0';
    fclose(f);

    enum hmem_status status = parse_json_object(config, buffer);
    free(buffer);

    if (status != HMEM_STATUS_OK) {
        HMEM_LOG_ERROR("%s: failed to parse '%s': %s\n", __func__, json_path, hmem_status_str(status));
    }
    return status;
}

enum hmem_status hmem_config_save_to_json(const struct hmem_config * config, const char * json_path) {
    if (!config || !json_path) return HMEM_STATUS_CONFIGURATION_ERROR;

    FILE * f = fopen(json_path, "w");
    if (!f) {
        HMEM_LOG_ERROR("%s: failed to open '%s' for writing\n", __func__, json_path);
        return HMEM_STATUS_IO_ERROR;
    }

    char value[512];
    fprintf(f, "{\n");
    for (size_t i = 0; i < HMEM_N_CONFIG_KEYS; i++) {
        const struct hmem_config_key * entry = &HMEM_CONFIG_KEYS[i];
        hmem_config_get(config, entry->name, value, sizeof(value));

        const char * sep = (i + 1 < HMEM_N_CONFIG_KEYS) ? "," : "";
        if (entry->type == HMEM_CONFIG_STR) {
            fprintf(f, "  \"%s\": \"", entry->name);
            for (const char * c = value; *c; c++) {
                if (*c == '"' || *c == '\\') fputc('\\', f);
                fputc(*c, f);
            }
            fprintf(f, "\"%s\n", sep);
        } else if (entry->type == HMEM_CONFIG_BOOL) {
            fprintf(f, "  \"%s\": %s%s\n", entry->name, strcmp(value, "1") == 0 ? "true" : "false", sep);
        } else {
            fprintf(f, "  \"%s\": %s%s\n", entry->name, value, sep);
        }
    }
    fprintf(f, "}\n");

    if (fclose(f) != 0) {
        return HMEM_STATUS_IO_ERROR;
    }
    return HMEM_STATUS_OK;
}

enum hmem_status hmem_config_parse_args(struct hmem_config * config, int argc, char ** argv) {
    if (!config) return HMEM_STATUS_CONFIGURATION_ERROR;

    for (int i = 1; i < argc; i++) {
        const char * arg = argv[i];
        if (strncmp(arg, "--", 2) != 0 || i + 1 >= argc) {
            HMEM_LOG_ERROR("%s: expected '--key value', got '%s'\n", __func__, arg);
            return HMEM_STATUS_CONFIGURATION_ERROR;
        }

        const char * key = arg + 2;
        const char * value = argv[++i];

        enum hmem_status status = strcmp(key, "config") == 0
            ? hmem_config_load_from_json(config, value)
            : hmem_config_set(config, key, value);
        if (status != HMEM_STATUS_OK) {
            return status;
        }
    }

    return HMEM_STATUS_OK;
}

// Logs the formatted message when the check fails
static bool config_check(bool ok, const char * format, ...) {
    if (ok) {
        return true;
    }
    char msg[256];
    va_list args;
    va_start(args, format);
    vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);
    HMEM_LOG_ERROR("%s", msg);
    return false;
}

enum hmem_status hmem_config_validate(const struct hmem_config * config) {
    if (!config) return HMEM_STATUS_CONFIGURATION_ERROR;

    enum hmem_encoding_type encoding_type;
    const bool ok =
        config_check(hmem_encoding_type_parse(config->encodings_type, &encoding_type) == HMEM_STATUS_OK,
                     "%s: invalid encodings_type '%s'\n", __func__, config->encodings_type) &&
        config_check(config->hops >= 1,            "%s: hops must be >= 1 (got %d)\n", __func__, config->hops) &&
        config_check(config->memory_size >= 1,     "%s: memory_size must be >= 1 (got %d)\n", __func__, config->memory_size) &&
        config_check(config->embeddings_size >= 1, "%s: embeddings_size must be >= 1 (got %d)\n", __func__, config->embeddings_size) &&
        config_check(config->w_assoc_max > 0.0f && std::isfinite(config->w_assoc_max),
                     "%s: w_assoc_max must be > 0 (got %g)\n", __func__, (double) config->w_assoc_max) &&
        config_check(std::isfinite(config->gamma_pos) && std::isfinite(config->gamma_neg),
                     "%s: gamma_pos and gamma_neg must be finite\n", __func__) &&
        config_check(config->max_num_sentences == -1 || config->max_num_sentences >= 1,
                     "%s: max_num_sentences must be -1 or >= 1 (got %d)\n", __func__, config->max_num_sentences) &&
        config_check(strcmp(config->training_set_size, "1k") == 0 || strcmp(config->training_set_size, "10k") == 0,
                     "%s: training_set_size must be '1k' or '10k' (got '%s')\n", __func__, config->training_set_size) &&
        config_check(config->batch_size_per_replica >= 1,
                     "%s: batch_size_per_replica must be >= 1 (got %d)\n", __func__, config->batch_size_per_replica) &&
        config_check(config->learning_rate > 0.0f, "%s: learning_rate must be > 0\n", __func__) &&
        config_check(config->epochs >= 0, "%s: epochs must be >= 0\n", __func__) &&
        config_check(config->validation_split >= 0.0f && config->validation_split < 1.0f,
                     "%s: validation_split must be in [0, 1)\n", __func__) &&
        config_check(config->max_grad_norm >= 0.0f, "%s: max_grad_norm must be >= 0\n", __func__) &&
        config_check(config->n_threads >= 1, "%s: n_threads must be >= 1\n", __func__);

    return ok ? HMEM_STATUS_OK : HMEM_STATUS_CONFIGURATION_ERROR;
}

float hmem_config_learning_rate(const struct hmem_config * config, int32_t epoch) {
    if (config->read_before_write) {
        if (epoch < 150) {
            return config->learning_rate;
        }
        return config->learning_rate * expf(0.01f * (float) (150 - epoch));
    }
    return config->learning_rate * powf(0.85f, floorf((float) epoch / 20.0f));
}
