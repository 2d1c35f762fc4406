#include "RequestDispatcher.hpp"
#include "JsonRpcPeer.hpp"

void RequestDispatcher::registerTool(const std::string& name, const std::string& description, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = Tool{description, std::move(handler)};
}

void RequestDispatcher::registerResource(const std::string& uriTemplate, const std::string& name, ResourceHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_.push_back(Resource{uriTemplate, name, std::move(handler)});
}

void RequestDispatcher::registerMethod(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    methods_[method] = std::move(handler);
}

Json::Value RequestDispatcher::listTools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Json::Value result;
    result["tools"] = Json::Value(Json::arrayValue);
    for (const auto& [name, tool] : tools_) {
        Json::Value item;
        item["name"] = name;
        item["description"] = tool.description;
        result["tools"].append(item);
    }
    return result;
}

Json::Value RequestDispatcher::listResources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Json::Value result;
    result["resources"] = Json::Value(Json::arrayValue);
    for (const auto& resource : resources_) {
        Json::Value item;
        item["uriTemplate"] = resource.uriTemplate;
        item["name"] = resource.name;
        result["resources"].append(item);
    }
    return result;
}

std::optional<std::map<std::string, std::string>> RequestDispatcher::matchTemplate(const std::string& uriTemplate, const std::string& uri) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string pattern;
    std::vector<std::string> names;
    for (std::size_t i = 0; i < uriTemplate.size(); ++i) {
        char c = uriTemplate[i];
        if (c == '{') {
            auto close = uriTemplate.find('}', i);
            if (close != std::string::npos && close > i + 1) {
                names.push_back(uriTemplate.substr(i + 1, close - i - 1));
                pattern += "([^/]+)";
                i = close;
                continue;
            }
        }
        if (special.find(c) != std::string::npos) pattern += '\\';
        pattern += c;
    }

    std::smatch match;
    std::regex expression(pattern);
    if (!std::regex_match(uri, match, expression)) {
        return std::nullopt;
    }
    std::map<std::string, std::string> variables;
    for (std::size_t i = 0; i < names.size(); ++i) {
        variables[names[i]] = match[i + 1].str();
    }
    return variables;
}

Json::Value RequestDispatcher::callTool(const std::string& name, const Json::Value& arguments) const {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw RpcError(rpc::kInvalidParams, "Unknown tool: " + name);
        }
        handler = it->second.handler;
    }
    return handler(arguments);
}

Json::Value RequestDispatcher::readResource(const std::string& uri) const {
    ResourceHandler handler;
    std::map<std::string, std::string> variables;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& resource : resources_) {
            if (auto bound = matchTemplate(resource.uriTemplate, uri)) {
                handler = resource.handler;
                variables = *bound;
                break;
            }
        }
    }
    if (!handler) {
        throw RpcError(rpc::kInvalidParams, "No resource matches URI: " + uri);
    }
    return handler(uri, variables);
}

Json::Value RequestDispatcher::dispatch(const Json::Value& request) const {
    const Json::Value& id = request["id"];
    std::string method = request["method"].asString();
    const Json::Value& params = request["params"];

    try {
        if (method == "use_tool") {
            if (!params["tool_name"].isString()) {
                throw RpcError(rpc::kInvalidParams, "use_tool requires a string 'tool_name'");
            }
            return JsonRpcPeer::createResponse(id, callTool(params["tool_name"].asString(), params["arguments"]));
        }
        if (method == "access_resource") {
            if (!params["uri"].isString()) {
                throw RpcError(rpc::kInvalidParams, "access_resource requires a string 'uri'");
            }
            return JsonRpcPeer::createResponse(id, readResource(params["uri"].asString()));
        }
        if (method == "list_tools") {
            return JsonRpcPeer::createResponse(id, listTools());
        }
        if (method == "list_resources") {
            return JsonRpcPeer::createResponse(id, listResources());
        }

        MethodHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = methods_.find(method);
            if (it != methods_.end()) handler = it->second;
        }
        if (!handler) {
            return JsonRpcPeer::createError(id, rpc::kMethodNotFound, "Method not found: " + method);
        }
        return JsonRpcPeer::createResponse(id, handler(params));
    } catch (const RpcError& e) {
        return JsonRpcPeer::createError(id, e.code(), e.what());
    } catch (const std::exception& e) {
        return JsonRpcPeer::createError(id, rpc::kInternalError, e.what());
    }
}
