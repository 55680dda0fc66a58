#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <polyexec/concat_tostr.hh>
#include <polyexec/string_transform.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
    public:
        explicit ParseError(const std::string& msg) : runtime_error(msg) {}

        template <class... Args>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            auto lower = [&](std::string_view s) {
                if (s.size() != str_.size()) {
                    return false;
                }
                for (size_t i = 0; i < s.size(); ++i) {
                    if (to_lower(str_[i]) != s[i]) {
                        return false;
                    }
                }
                return true;
            };
            return (str_ == "1" or lower("on") or lower("true"));
        }

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static const Variable null_var;

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars)& get_vars() const noexcept { return vars; }

    /**
     * @brief Loads config (variables) form file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether load all variables from @p pathname or load only
     *   these from variable set
     *
     * @errors Throws an exception std::runtime_error if an open(2) error
     *   occurs and all exceptions from load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) form string @p config
     * @details Format: one `name: value` (or `name = value`) per line, `#` starts
     *   a comment. A value is a string literal, a 'single-quoted' string (with ''
     *   as an escaped '), a "double-quoted" string with C escape sequences or an
     *   array [value, ...] that may span multiple lines.
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);
};

inline const ConfigFile::Variable ConfigFile::null_var{};
