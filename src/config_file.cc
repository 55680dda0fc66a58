#include <algorithm>
#include <polyexec/config_file.hh>
#include <polyexec/file_contents.hh>
#include <utility>

using std::string;

namespace {

constexpr bool is_name_char(char c) noexcept {
    return ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '-' or c == '_' or c == '.');
}

constexpr bool is_ws(char c) noexcept { return (c != '\n' and is_space(c)); }

constexpr int hex2dec(char c) noexcept {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto throw_parse_error = [&](auto&&... args) {
        size_t line_beg = config.rfind('\n', pos == 0 ? 0 : pos - 1);
        line_beg = (line_beg == string::npos or pos == 0 ? 0 : line_beg + 1);
        size_t line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        throw ParseError(line, pos - line_beg + 1, std::forward<decltype(args)>(args)...);
    };

    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    if (config[pos + 1] != '\'') { // Safe (newline is at the end)
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case '0': res += '\0'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 't': res += '\t'; continue;
                case 'v': res += '\v'; continue;
                case 'x': {
                    int hi = hex2dec(config[++pos]);
                    if (hi < 0) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    int lo = hex2dec(config[++pos]);
                    if (lo < 0) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>((hi << 4) | lo);
                    continue;
                }
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t end = pos;
        while (config[end] != '\n' and config[end] != '#' and
               (not is_in_array or (config[end] != ']' and config[end] != ',')))
        {
            ++end;
        }
        size_t value_end = end;
        while (is_space(config[value_end - 1])) {
            --value_end;
        }
        res = config.substr(pos, value_end - pos);
        pos = end;
        return res;
    };

    Variable ignored;
    while (pos < config.size()) {
        skip_ws();
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        // Variable name
        size_t name_beg = pos;
        while (is_name_char(config[pos])) {
            ++pos;
        }
        if (pos == name_beg) {
            throw_parse_error("Invalid or missing variable's name");
        }
        string name = config.substr(name_beg, pos - name_beg);

        // Assignment operator
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_ws();

        Variable* varp = &ignored;
        if (load_all) {
            varp = &vars[name];
        } else if (auto it = vars.find(name); it != vars.end()) {
            varp = &it->second;
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') {
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else {
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [
            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos == config.size()) {
                    --pos;
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
            }
        }

        // After the value
        skip_ws();
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
        }
        ++pos; // Newline
    }
}
