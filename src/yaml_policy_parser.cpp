#include "pfverify/yaml_policy_parser.hpp"

#include "pfverify/exceptions.hpp"

#include <yaml-cpp/yaml.h>

namespace pfverify
{
namespace
{
Json scalar_to_json(const YAML::Node& node)
{
    const auto& raw = node.Scalar();
    // Quoted scalars carry the non-specific "!" tag and are always strings.
    if (node.Tag() == "!")
        return raw;

    bool b = false;
    if (YAML::convert<bool>::decode(node, b))
        return b;
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i))
        return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d))
        return d;
    return raw;
}

Json node_to_json(const YAML::Node& node)
{
    switch (node.Type())
    {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return nullptr;
    case YAML::NodeType::Scalar:
        return scalar_to_json(node);
    case YAML::NodeType::Sequence:
    {
        Json arr = Json::array();
        for (const auto& item : node)
            arr.push_back(node_to_json(item));
        return arr;
    }
    case YAML::NodeType::Map:
    {
        Json obj = Json::object();
        for (const auto& kv : node)
        {
            if (!kv.first.IsScalar())
                throw DecodeError("policy keys must be scalars");
            obj[kv.first.Scalar()] = node_to_json(kv.second);
        }
        return obj;
    }
    }
    return nullptr;
}
} // namespace

Json YamlPolicyParser::parse(const std::string& text) const
{
    YAML::Node root;
    try
    {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception& e)
    {
        throw DecodeError(e.what());
    }

    // An empty document is an empty policy.
    if (!root || root.IsNull())
        return Json::object();
    return node_to_json(root);
}

} // namespace pfverify
