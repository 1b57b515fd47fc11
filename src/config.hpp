#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

#include "log.hpp"

struct DictConf {
    std::vector<std::string> dictionaries;
    bool include_relative_to_file { false };
    uint32_t max_include_depth { 32 };
    LOGL log_level { LOGL::INFO };
};

#endif
