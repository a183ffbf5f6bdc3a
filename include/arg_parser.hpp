#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Small command line parser for long style options.
 *
 * Recognizes `--flag`, `--opt value` and `--opt=value`. Only options listed in
 * @a value_flags consume the following argument, so a boolean switch such as
 * `--ssh` never swallows a positional argument. Values that look like negative
 * numbers (`--workers -3`) are accepted as values. Flags not present in the
 * known set are collected separately so the caller can report them. A mapping
 * of short options (like `-h`) to their long counterparts may be supplied.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> value_flags_;          ///< Flags that expect a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    static bool looks_like_flag(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-')
            return false;
        // "-5" is a value, not a flag
        return !(arg[1] >= '0' && arg[1] <= '9');
    }

    void store(const std::string& key, const std::string* value) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
        else if (value_flags_.count(key))
            missing_values_.push_back(key);
    }

    void consume(const std::string& key, int& i, int argc, char* argv[]) {
        if (value_flags_.count(key) && i + 1 < argc && !looks_like_flag(argv[i + 1])) {
            std::string val = argv[++i];
            store(key, &val);
        } else {
            store(key, nullptr);
        }
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are known.
     * @param value_flags Flags that take a value.
     * @param short_map   Mapping from single character options to long form.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    std::string val = arg.substr(eq + 1);
                    store(key, &val);
                } else {
                    consume(arg, i, argc, argv);
                }
            } else if (looks_like_flag(arg) && arg.size() == 2 && short_map_.count(arg[1])) {
                consume(short_map_.at(arg[1]), i, argc, argv);
            } else if (looks_like_flag(arg)) {
                unknown_flags_.push_back(arg);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /** @return `true` if the flag (including leading `--`) was present. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
