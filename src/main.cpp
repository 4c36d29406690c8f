/**
 * Symform - Command Line Entry Point
 *
 * symform [options] [script]
 *
 * Without a script the interactive REPL runs on stdin. With a script every
 * line is executed in order and the exit status is non-zero if any failed.
 */

#include "symform/symform.h"
#include <stdio.h>
#include <string.h>

static void print_usage(const char *program) {
    printf("Usage: %s [options] [script]\n", program);
    printf("\n");
    printf("Options:\n");
    printf("  --config <path>  Read settings from a TOML file\n");
    printf("  --verbose        Log statement evaluation and rule applications\n");
    printf("  --timing         Show the evaluation time of each statement\n");
    printf("  --help           Show this message\n");
}

int main(int argc, char *argv[]) {
    const char *config_path = NULL;
    const char *script_path = NULL;
    bool verbose = false;
    bool timing = false;

    for (int i = 1; i < argc; i++) {
        const char *arg = argv[i];
        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(arg, "--timing") == 0) {
            timing = true;
        } else if (strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                fprintf(stderr, "Missing path after --config\n");
                return 2;
            }
            config_path = argv[++i];
        } else if (arg[0] == '-' && arg[1] == '-') {
            fprintf(stderr, "Unknown option: %s\n", arg);
            print_usage(argv[0]);
            return 2;
        } else if (!script_path) {
            script_path = arg;
        } else {
            fprintf(stderr, "Only one script may be given\n");
            return 2;
        }
    }

    /* Configuration: explicit file, else the search path, else defaults */
    Symform_Config config;
    if (config_path) {
        symform_config_defaults(&config);
        if (!symform_config_load_file(&config, config_path)) {
            fprintf(stderr, "Failed to load config: %s\n", symform_get_last_error());
            return 1;
        }
    } else {
        symform_config_load(&config);
    }

    if (verbose) {
        config.verbose = true;
        config.log_level = SYMFORM_LOG_LEVEL_DEBUG;
    }
    if (timing) config.show_timing = true;

    if (!symform_log_open(config.log_file)) {
        fprintf(stderr, "Warning: could not open log file %s\n", config.log_file);
    }
    symform_log_set_level(config.log_level);
    symform_log_set_console_output(config.log_console);

    if (config.source_path[0]) {
        symform_log_info(SYMFORM_LOG_CONFIG, "Loaded config from %s", config.source_path);
    }

    Symform_Repl *repl = symform_repl_create(&config);
    if (!repl) {
        fprintf(stderr, "Failed to initialize: %s\n", symform_get_last_error());
        symform_log_close();
        return 1;
    }

    int status = 0;
    if (script_path) {
        FILE *script = fopen(script_path, "r");
        if (!script) {
            fprintf(stderr, "Cannot open script: %s\n", script_path);
            status = 1;
        } else {
            symform_log_info(SYMFORM_LOG_REPL, "Running script %s", script_path);
            int failures = symform_repl_run_stream(repl, script, stdout, stderr);
            fclose(script);
            status = failures > 0 ? 1 : 0;
        }
    } else {
        symform_repl_run_interactive(repl);
    }

    symform_repl_destroy(repl);
    symform_log_close();
    return status;
}
