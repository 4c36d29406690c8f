#ifndef SYMFORM_CONFIG_H
#define SYMFORM_CONFIG_H

#include "symform/log.h"
#include <stdbool.h>
#include <stddef.h>

/**
 * Symform Configuration
 *
 * TOML settings for the REPL host:
 *
 *   [settings]
 *   verbose = false
 *   show_timing = false
 *   prompt = "FORM> "
 *
 *   [log]
 *   file = "/tmp/symform.log"
 *   level = "info"
 *   console = false
 *
 * Missing keys keep their defaults.
 */

#define SYMFORM_CONFIG_PATH_LEN 512
#define SYMFORM_CONFIG_PROMPT_LEN 32

typedef struct Symform_Config {
    /* [settings] */
    bool verbose;
    bool show_timing;
    char prompt[SYMFORM_CONFIG_PROMPT_LEN];

    /* [log] */
    char log_file[SYMFORM_CONFIG_PATH_LEN];
    Symform_LogLevel log_level;
    bool log_console;

    /* Path the configuration was read from (empty for defaults) */
    char source_path[SYMFORM_CONFIG_PATH_LEN];
} Symform_Config;

/**
 * Fill a config with default values.
 */
void symform_config_defaults(Symform_Config *config);

/**
 * Load settings from a TOML file on top of the values already in config.
 * @return true on success, false on I/O or parse error (see symform_get_last_error())
 */
bool symform_config_load_file(Symform_Config *config, const char *path);

/**
 * Load settings from a TOML string on top of the values already in config.
 */
bool symform_config_load_string(Symform_Config *config, const char *toml_string);

/**
 * Reset config to defaults, then load the first readable file among
 * ./.symformrc, ./.symform.toml, ~/.symformrc, ~/.config/symform/config.toml.
 * A file that fails to parse is logged as a warning and skipped.
 *
 * @return true if a file was loaded, false if defaults are in use
 */
bool symform_config_load(Symform_Config *config);

/**
 * Expand a leading '~' to the home directory.
 * @return Number of characters written (snprintf-style)
 */
int symform_config_expand_path(const char *path, char *out, size_t out_size);

/**
 * Sample configuration file content.
 */
const char *symform_config_sample(void);

#endif /* SYMFORM_CONFIG_H */
