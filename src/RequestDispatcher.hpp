#pragma once
#include <json/json.h>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

// JSON-RPC error codes used on both sides of the bridge.
namespace rpc {
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kTimeout = -32001;
constexpr int kProcessTerminated = -32002;
constexpr int kCancelled = -32800;
}

// Thrown by handlers to produce a specific error response.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

// Routes inbound requests: "use_tool" by tool name, "access_resource" by URI
// template, plus any method registered explicitly.
class RequestDispatcher {
public:
    using ToolHandler = std::function<Json::Value(const Json::Value& arguments)>;
    using ResourceHandler = std::function<Json::Value(const std::string& uri, const std::map<std::string, std::string>& variables)>;
    using MethodHandler = std::function<Json::Value(const Json::Value& params)>;

    void registerTool(const std::string& name, const std::string& description, ToolHandler handler);
    void registerResource(const std::string& uriTemplate, const std::string& name, ResourceHandler handler);
    void registerMethod(const std::string& method, MethodHandler handler);

    Json::Value listTools() const;
    Json::Value listResources() const;

    // Throw RpcError on unknown tool or unmatched URI.
    Json::Value callTool(const std::string& name, const Json::Value& arguments) const;
    Json::Value readResource(const std::string& uri) const;

    // Returns the complete response object for `request`.
    Json::Value dispatch(const Json::Value& request) const;

    // Variables bound by `{name}` placeholders, or nullopt on mismatch. A
    // placeholder matches one non-empty path segment.
    static std::optional<std::map<std::string, std::string>> matchTemplate(const std::string& uriTemplate, const std::string& uri);

private:
    struct Tool {
        std::string description;
        ToolHandler handler;
    };
    struct Resource {
        std::string uriTemplate;
        std::string name;
        ResourceHandler handler;
    };

    std::map<std::string, Tool> tools_;
    std::vector<Resource> resources_;
    std::map<std::string, MethodHandler> methods_;
    mutable std::mutex mutex_;
};
