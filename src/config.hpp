#pragma once

#include <cstddef>
#include <string>

struct Config {
    // Logging
    std::string log_file;          // empty: stderr
    std::string log_level = "info";

    // Output
    bool sort_output = false;      // order attributes with Attribute::compare
    bool hex_uppercase = false;
    size_t hex_wrap = 0;           // 0 disables wrapping
};

bool load_config(const std::string& path, Config& out, std::string& err);
