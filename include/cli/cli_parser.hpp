#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace pdfimg {

// Very small CLI parser:
//   --key value
//   --flag          (declared boolean flags never take a value)
class CliParser {
public:
    CliParser() = default;
    explicit CliParser(std::initializer_list<std::string> bool_flags) : bool_flags_(bool_flags) {}

    // Throws std::runtime_error on a stray positional argument.
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    bool flag(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
private:
    std::unordered_set<std::string> bool_flags_;
    std::unordered_map<std::string, std::string> kv_;
};

} // namespace pdfimg
