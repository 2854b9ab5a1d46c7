// Copyright (C) 2020 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_KEYFILE_HPP_
#define TANDEM_KEYFILE_HPP_

#include "strings.hpp"

#include <istream>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <initializer_list>
#include <utility>

namespace tandem {
// INI style key/value groups. Keys before any [section] land in "_". Groups
// are kept in name order so callers can walk them predictably.
class keyfile {
public:
    using keys = std::map<std::string, std::string>;
    using iterator = std::map<std::string, keys>::const_iterator;

    keyfile() : ptr_(std::make_shared<keyfile::data>()) {}

    auto operator[](const std::string& id) -> auto& {
        return ptr_->sections[id];
    }

    auto at(const std::string& id = "_") const -> const keys& {
        return ptr_->sections.at(id);
    }

    auto exists(const std::string& id = "_") const {
        return ptr_->sections.count(id) > 0;
    }

    auto empty() const {
        return ptr_->sections.empty();
    }

    auto size() const {
        return ptr_->sections.size();
    }

    auto load(const std::string& path) {
        std::ifstream file(path);
        if(!file.is_open())
            return false;
        parse(file);
        return true;
    }

    auto load(std::istream& input) -> auto& {
        parse(input);
        return *this;
    }

    auto load(const std::string& id, std::initializer_list<std::pair<std::string, std::string>> list) -> auto& {
        auto& group = ptr_->sections[id];
        for(const auto& [key, value] : list)
            group[key] = value;
        return *this;
    }

    void clear() {
        ptr_->sections.clear();
    }

    auto begin() const -> iterator {
        return ptr_->sections.cbegin();
    }

    auto end() const -> iterator {
        return ptr_->sections.cend();
    }

private:
    struct data final {
        std::map<std::string, keys> sections;
    };

    std::shared_ptr<data> ptr_;

    void parse(std::istream& input) {
        std::string buffer;
        std::string section = "_";

        while(std::getline(input, buffer)) {
            auto line = strip(buffer);
            if(line.empty() || line[0] == '#' || line[0] == ';')
                continue;

            if(line[0] == '[' && line.back() == ']') {
                section = std::string(strip(line.substr(1, line.size() - 2)));
                continue;
            }

            auto pos = line.find_first_of('=');
            if(pos == 0 || pos == std::string_view::npos)
                continue;

            auto key = strip(line.substr(0, pos));
            auto value = unquote(strip(line.substr(++pos)));
            ptr_->sections[section][std::string(key)] = std::string(value);
        }
    }
};

inline auto key_or(const keyfile::keys& keys, const std::string& id, const std::string& or_else = "") {
    auto it = keys.find(id);
    if(it == keys.end())
        return or_else;
    return it->second;
}
} // end namespace
#endif
