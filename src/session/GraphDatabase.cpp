//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the JSON-backed build graph.  The export is read once with
// nlohmann::json; evaluation of deferred values goes through the generator
// expression evaluator with this database acting as its target context.
//
//===----------------------------------------------------------------------===//

#include "session/GraphDatabase.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

support::Diag makeGraphErr(const std::string &origin, const std::string &msg)
{
    return makeError(ErrorCode::InvalidConfiguration, origin + ": " + msg);
}

/// @brief Read a property value given either as a string or a string array.
Expected<std::vector<std::string>> readStringList(const nlohmann::json &value,
                                                  const std::string &origin,
                                                  const std::string &what)
{
    std::vector<std::string> items;
    if (value.is_string())
    {
        items.push_back(value.get<std::string>());
        return items;
    }
    if (!value.is_array())
        return makeGraphErr(origin, what + " must be a string or an array of strings");
    for (const auto &item : value)
    {
        if (!item.is_string())
            return makeGraphErr(origin, what + " must contain only strings");
        items.push_back(item.get<std::string>());
    }
    return items;
}

Expected<TargetRecord> readTarget(const std::string &name, const nlohmann::json &node, const std::string &origin)
{
    if (!node.is_object())
        return makeGraphErr(origin, "target '" + name + "' must be an object");

    TargetRecord record;
    record.info.name = name;

    const std::string type = node.value("type", std::string("SHARED_LIBRARY"));
    auto kind = parseTargetKind(type);
    if (!kind)
        return makeGraphErr(origin, "target '" + name + "' has unknown type '" + type + "'");
    record.info.kind = *kind;

    record.file = node.value("file", std::string());

    if (node.contains("cxx_standard"))
    {
        const auto &level = node.at("cxx_standard");
        std::optional<CxxStandard> standard;
        if (level.is_number_integer())
            standard = cxxStandardFromNumber(level.get<int>());
        else if (level.is_string())
            standard = parseCxxStandard(level.get<std::string>());
        if (!standard)
            return makeGraphErr(origin, "target '" + name + "' declares an unknown cxx_standard " + level.dump());
        record.info.standard = standard;
    }

    if (node.contains("properties"))
    {
        const auto &props = node.at("properties");
        if (!props.is_object())
            return makeGraphErr(origin, "properties of target '" + name + "' must be an object");
        for (const auto &[key, value] : props.items())
        {
            auto items = readStringList(value, origin, "property " + key + " of target '" + name + "'");
            if (!items)
                return items.error();
            record.properties[key] = std::move(items.value());
        }
    }

    if (node.contains("interface_link_libraries"))
    {
        auto links = readStringList(node.at("interface_link_libraries"), origin,
                                    "interface_link_libraries of target '" + name + "'");
        if (!links)
            return links.error();
        record.interfaceLinks = std::move(links.value());
    }

    return record;
}

std::string joinList(const std::vector<std::string> &items)
{
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i != 0)
            joined.push_back(';');
        joined += items[i];
    }
    return joined;
}

} // namespace

GraphDatabase::GraphDatabase(std::string projectName) : project_(std::move(projectName)) {}

Expected<GraphDatabase> GraphDatabase::parse(std::string_view text, const std::string &origin)
{
    try
    {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object())
            return makeGraphErr(origin, "graph document must be a JSON object");

        GraphDatabase graph(json.value("project", std::string()));

        if (json.contains("targets"))
        {
            const auto &targets = json.at("targets");
            if (!targets.is_object())
                return makeGraphErr(origin, "'targets' must be an object keyed by target name");
            for (const auto &[name, node] : targets.items())
            {
                auto record = readTarget(name, node, origin);
                if (!record)
                    return record.error();
                graph.addTarget(std::move(record.value()));
            }
        }
        return graph;
    }
    catch (const nlohmann::json::exception &e)
    {
        return makeGraphErr(origin, e.what());
    }
}

Expected<GraphDatabase> GraphDatabase::load(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::Io, "cannot open build graph: " + path.string());

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.string());
}

void GraphDatabase::addTarget(TargetRecord record)
{
    std::string name = record.info.name;
    targets_.insert_or_assign(std::move(name), std::move(record));
}

std::string GraphDatabase::projectName() const
{
    return project_;
}

const TargetInfo *GraphDatabase::findTarget(std::string_view name) const
{
    auto it = targets_.find(name);
    if (it == targets_.end())
        return nullptr;
    return &it->second.info;
}

Expected<std::vector<std::string>> GraphDatabase::resolve(const PropertyValue &value) const
{
    if (const auto *literal = std::get_if<LiteralValue>(&value))
    {
        std::vector<std::string> items;
        if (!literal->text.empty())
            items.push_back(literal->text);
        return items;
    }

    auto expanded = evaluateGeneratorExpression(std::get<DeferredValue>(value).expression, *this);
    if (!expanded)
        return expanded.error();
    return splitList(expanded.value());
}

Expected<std::string> GraphDatabase::targetFile(std::string_view target) const
{
    auto it = targets_.find(target);
    if (it == targets_.end())
    {
        return makeError(ErrorCode::UnknownTarget,
                         "$<TARGET_FILE:" + std::string(target) + "> names an unknown target");
    }
    if (it->second.file.empty())
    {
        return makeError(ErrorCode::InvalidConfiguration,
                         "target " + std::string(target) + " has no artifact file");
    }
    return it->second.file;
}

Expected<std::string> GraphDatabase::targetProperty(std::string_view target, std::string_view property) const
{
    auto it = targets_.find(target);
    if (it == targets_.end())
    {
        return makeError(ErrorCode::UnknownTarget,
                         "$<TARGET_PROPERTY:" + std::string(target) + "," + std::string(property) +
                             "> names an unknown target");
    }

    const bool transitive = property.rfind("INTERFACE_", 0) == 0;
    std::vector<std::string> items;
    auto ok = collect(it->second, property, transitive, items);
    if (!ok)
        return ok.error();
    return joinList(items);
}

Expected<void> GraphDatabase::collect(const TargetRecord &record,
                                      std::string_view property,
                                      bool transitive,
                                      std::vector<std::string> &out) const
{
    const std::string key = record.info.name + "/" + std::string(property);
    if (std::find(evaluationStack_.begin(), evaluationStack_.end(), key) != evaluationStack_.end())
    {
        return makeError(ErrorCode::InvalidConfiguration,
                         "cyclic evaluation of " + std::string(property) + " on target " + record.info.name);
    }
    evaluationStack_.push_back(key);

    auto append = [&out](std::string item) {
        if (std::find(out.begin(), out.end(), item) == out.end())
            out.push_back(std::move(item));
    };

    Expected<void> result;
    if (auto prop = record.properties.find(std::string(property)); prop != record.properties.end())
    {
        for (const auto &raw : prop->second)
        {
            auto expanded = evaluateGeneratorExpression(raw, *this);
            if (!expanded)
            {
                result = expanded.error();
                break;
            }
            for (auto &item : splitList(expanded.value()))
                append(std::move(item));
        }
    }

    if (result && transitive)
    {
        for (const auto &link : record.interfaceLinks)
        {
            auto dep = targets_.find(link);
            // Plain linker inputs such as "m" or "-pthread" carry no usage requirements.
            if (dep == targets_.end())
                continue;
            result = collect(dep->second, property, true, out);
            if (!result)
                break;
        }
    }

    evaluationStack_.pop_back();
    return result;
}

} // namespace clingkit::session
