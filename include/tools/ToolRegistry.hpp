#pragma once
#include <string>
#include <map>
#include <functional>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scout {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string parameter_schema;
};

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    virtual std::string execute(const std::string& args_json) = 0;
};

class GenericTool : public ITool {
    ToolMetadata meta_;
    std::function<std::string(const std::string&)> action_;
public:
    GenericTool(std::string name, std::string desc, std::string schema,
                std::function<std::string(const std::string&)> action)
        : meta_{std::move(name), std::move(desc), std::move(schema)}, action_(std::move(action)) {}
    ToolMetadata get_metadata() override { return meta_; }
    std::string execute(const std::string& args) override { return action_(args); }
};

// Per-capability tool set. Populated at startup, read-only afterwards.
class ToolRegistry {
private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        auto name = tool->get_metadata().name;
        spdlog::debug("🔧 Tool Integrated: {}", name);
        tools_[name] = std::move(tool);
    }

    bool has(const std::string& name) const { return tools_.count(name) > 0; }
    size_t size() const { return tools_.size(); }

    nlohmann::json get_manifest_json() const {
        auto manifest = nlohmann::json::array();
        for (const auto& [name, tool] : tools_) {
            auto meta = tool->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"parameters", meta.parameter_schema}
            });
        }
        return manifest;
    }

    std::string dispatch(const std::string& name, const nlohmann::json& args) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) return "ERROR: Tool '" + name + "' not found.";

        auto start = std::chrono::steady_clock::now();
        std::string res = it->second->execute(args.dump());
        double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

        spdlog::debug("🔧 {} finished in {:.2f} ms ({} bytes)", name, duration, res.size());
        return res;
    }

    std::string get_manifest() const {
        return get_manifest_json().dump(2);
    }
};

} // namespace scout
