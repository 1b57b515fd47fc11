#ifndef YAML_HPP
#define YAML_HPP

#include <cstdint>
#include <yaml-cpp/yaml.h>

enum class LOGL: uint8_t;
struct DictConf;

namespace YAML {
    template <>
    struct convert<LOGL>
    {
        static Node encode(const LOGL &rhs);
        static bool decode(const Node &node, LOGL &rhs);
    };

    template <>
    struct convert<DictConf>
    {
        static Node encode(const DictConf &rhs);
        static bool decode(const Node &node, DictConf &rhs);
    };
}

#endif
