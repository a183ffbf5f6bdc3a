#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load command line options from a YAML file.
 *
 * Top-level scalar keys become options named `--<key>`. A top-level map is
 * treated as a section and its scalar keys are read the same way, so
 *
 * @code{.yaml}
 * org: electronicarts
 * clone:
 *   workers: 4
 *   mirror: true
 * @endcode
 *
 * yields `--org`, `--workers` and `--mirror`. Sequences are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by flag name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load command line options from a JSON file.
 *
 * Same layout rules as load_yaml_config(); the root must be an object.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values keyed by flag name.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
