/**
 * Symform - Configuration
 *
 * TOML settings for the REPL host, read with tomlc99.
 */

#include "symform/config.h"
#include "symform/error.h"
#include "symform/log.h"
#include "toml.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>

#if defined(_WIN32)
    #define DEFAULT_LOG_FILE "symform.log"
#else
    #define DEFAULT_LOG_FILE "/tmp/symform.log"
#endif

static const char *s_sample_config =
    "# Symform configuration\n"
    "# Place this file at ~/.symformrc or ./.symformrc\n"
    "\n"
    "[settings]\n"
    "# Log statement evaluation and rule applications at debug level\n"
    "verbose = false\n"
    "\n"
    "# Print the elapsed time after each statement\n"
    "show_timing = false\n"
    "\n"
    "# Interactive prompt\n"
    "prompt = \"FORM> \"\n"
    "\n"
    "[log]\n"
    "# Log file location (supports ~ for the home directory)\n"
    "file = \"/tmp/symform.log\"\n"
    "\n"
    "# error, warning, info or debug\n"
    "level = \"info\"\n"
    "\n"
    "# Echo log lines to the console\n"
    "console = false\n";

/* ============================================================================
 * Helpers
 * ============================================================================ */

static void read_bool(toml_table_t *table, const char *key, bool *out) {
    toml_datum_t d = toml_bool_in(table, key);
    if (d.ok) {
        *out = d.u.b != 0;
    }
}

static void read_string(toml_table_t *table, const char *key, char *out, size_t out_size) {
    toml_datum_t d = toml_string_in(table, key);
    if (d.ok) {
        snprintf(out, out_size, "%s", d.u.s);
        free(d.u.s);
    }
}

static bool apply_toml(Symform_Config *config, toml_table_t *root) {
    toml_table_t *settings = toml_table_in(root, "settings");
    if (settings) {
        read_bool(settings, "verbose", &config->verbose);
        read_bool(settings, "show_timing", &config->show_timing);
        read_string(settings, "prompt", config->prompt, sizeof(config->prompt));
    }

    toml_table_t *log = toml_table_in(root, "log");
    if (log) {
        char file[SYMFORM_CONFIG_PATH_LEN] = {0};
        read_string(log, "file", file, sizeof(file));
        if (file[0] != '\0') {
            symform_config_expand_path(file, config->log_file, sizeof(config->log_file));
        }

        toml_datum_t level = toml_string_in(log, "level");
        if (level.ok) {
            bool known = symform_log_level_from_string(level.u.s, &config->log_level);
            if (!known) {
                symform_set_error("Unknown log level '%s'", level.u.s);
            }
            free(level.u.s);
            if (!known) return false;
        }

        read_bool(log, "console", &config->log_console);
    }

    return true;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

void symform_config_defaults(Symform_Config *config) {
    if (!config) return;
    memset(config, 0, sizeof(*config));

    config->verbose = false;
    config->show_timing = false;
    snprintf(config->prompt, sizeof(config->prompt), "%s", "FORM> ");

    snprintf(config->log_file, sizeof(config->log_file), "%s", DEFAULT_LOG_FILE);
    config->log_level = SYMFORM_LOG_LEVEL_INFO;
    config->log_console = false;
}

bool symform_config_load_file(Symform_Config *config, const char *path) {
    if (!config || !path) {
        symform_set_error("Invalid parameters");
        return false;
    }

    FILE *fp = fopen(path, "r");
    if (!fp) {
        symform_set_error("Cannot open file: %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        symform_set_error("TOML parse error in %s: %s", path, errbuf);
        return false;
    }

    /* Apply to a copy so a bad value leaves config untouched */
    Symform_Config loaded = *config;
    bool ok = apply_toml(&loaded, root);
    toml_free(root);

    if (!ok) return false;

    snprintf(loaded.source_path, sizeof(loaded.source_path), "%s", path);
    *config = loaded;
    return true;
}

bool symform_config_load_string(Symform_Config *config, const char *toml_string) {
    if (!config || !toml_string) {
        symform_set_error("Invalid parameters");
        return false;
    }

    /* toml_parse needs a mutable string */
    char *copy = strdup(toml_string);
    if (!copy) {
        symform_set_error("Out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        symform_set_error("TOML parse error: %s", errbuf);
        return false;
    }

    Symform_Config loaded = *config;
    bool ok = apply_toml(&loaded, root);
    toml_free(root);

    if (!ok) return false;

    *config = loaded;
    return true;
}

bool symform_config_load(Symform_Config *config) {
    if (!config) return false;
    symform_config_defaults(config);

    const char *candidates[] = {
        ".symformrc",
        ".symform.toml",
        "~/.symformrc",
        "~/.config/symform/config.toml",
    };

    for (size_t i = 0; i < sizeof(candidates) / sizeof(candidates[0]); i++) {
        char path[SYMFORM_CONFIG_PATH_LEN];
        symform_config_expand_path(candidates[i], path, sizeof(path));

        FILE *fp = fopen(path, "r");
        if (!fp) continue;
        fclose(fp);

        if (symform_config_load_file(config, path)) {
            symform_log_info(SYMFORM_LOG_CONFIG, "Loaded configuration from %s", path);
            return true;
        }
        symform_log_warning(SYMFORM_LOG_CONFIG, "Failed to parse config at %s: %s",
                            path, symform_get_last_error());
        symform_clear_error();
    }

    return false;
}

int symform_config_expand_path(const char *path, char *out, size_t out_size) {
    if (!path) return snprintf(out, out_size, "%s", "");

    if (path[0] == '~') {
        const char *home = getenv("HOME");
#if defined(_WIN32)
        if (!home) home = getenv("USERPROFILE");
#endif
        if (home) {
            const char *rest = path + 1;
            while (*rest == '/' || *rest == '\\') {
                rest++;
            }
            return snprintf(out, out_size, "%s/%s", home, rest);
        }
    }
    return snprintf(out, out_size, "%s", path);
}

const char *symform_config_sample(void) {
    return s_sample_config;
}
