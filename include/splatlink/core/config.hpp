#pragma once

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace splatlink::core {

class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }

        std::istringstream iss(*value);
        T result;
        iss >> result;
        if (iss.fail() || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;

    std::string trim(const std::string& str) const;
};

} // namespace splatlink::core
