// SPDX-License-Identifier: Apache-2.0
#include "ProxyServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Protocol.hpp>

#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace envproxy
{

namespace
{

    auto objectSchema(nlohmann::json properties, nlohmann::json required) -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "object" },
            { "properties", std::move(properties) },
            { "required", std::move(required) },
        };
    }

    auto textContent(std::string text, bool isError) -> nlohmann::json
    {
        return nlohmann::json {
            { "content", nlohmann::json::array({ { { "type", "text" }, { "text", std::move(text) } } }) },
            { "isError", isError },
        };
    }

    /// @brief Backend results that already are tool results are relayed as they are.
    auto isToolResult(const nlohmann::json& value) -> bool
    {
        return value.is_object() && value.contains("content") && value["content"].is_array();
    }

} // namespace

ProxyServer::ProxyServer(ProxyFacade& facade): _facade(facade)
{
}

auto ProxyServer::run(std::istream& in, std::ostream& out) -> int
{
    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        auto response = std::optional<nlohmann::json> {};
        auto message = json::parse(line);
        if (!message)
        {
            log::warning("Failed to parse request: {}", message.error().message);
            response = jsonrpc::makeErrorResponse(
                nullptr, jsonrpc::RpcError { .code = jsonrpc::codes::ParseError, .message = "Parse error" });
        }
        else
        {
            response = handleMessage(*message);
        }

        if (response)
        {
            out << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            out.flush();
        }
    }

    log::info("Input closed, stopping server");
    return 0;
}

auto ProxyServer::handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
    {
        if (!message.is_object() || !message.contains("id") || message.contains("result")
            || message.contains("error"))
            return std::nullopt;
        return jsonrpc::makeErrorResponse(
            message["id"],
            jsonrpc::RpcError { .code = jsonrpc::codes::InvalidRequest, .message = request.error().message });
    }

    if (request->isNotification())
    {
        log::debug("Notification received: {}", request->method);
        return std::nullopt;
    }

    auto const& id = *request->id;
    log::debug("Request {}: {}", id.dump(), request->method);

    if (request->method == "initialize")
        return jsonrpc::makeResultResponse(id, handleInitialize(request->params));
    if (request->method == "ping")
        return jsonrpc::makeResultResponse(id, nlohmann::json::object());
    if (request->method == "tools/list")
        return jsonrpc::makeResultResponse(id, handleToolsList());
    if (request->method == "tools/call")
    {
        auto result = handleToolsCall(request->params);
        if (!result)
        {
            return jsonrpc::makeErrorResponse(
                id, jsonrpc::RpcError { .code = jsonrpc::codes::InvalidParams, .message = result.error().message });
        }
        return jsonrpc::makeResultResponse(id, std::move(*result));
    }

    return jsonrpc::makeErrorResponse(
        id,
        jsonrpc::RpcError { .code = jsonrpc::codes::MethodNotFound,
                            .message = std::format("Method not found: {}", request->method) });
}

auto ProxyServer::handleInitialize(const nlohmann::json& params) const -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", json::getStringOr(params, "protocolVersion", mcp::ProtocolVersion) },
        { "capabilities", { { "tools", nlohmann::json::object() } } },
        { "serverInfo", { { "name", mcp::ImplementationName }, { "version", mcp::ImplementationVersion } } },
    };
}

auto ProxyServer::handleToolsList() const -> nlohmann::json
{
    auto const noArguments = objectSchema(nlohmann::json::object(), nlohmann::json::array());

    auto tools = nlohmann::json::array({
        {
            { "name", "list_contexts" },
            { "description",
              "List all available contexts, showing which is currently active and which have a running "
              "backend." },
            { "inputSchema", noArguments },
        },
        {
            { "name", "switch_context" },
            { "description",
              "Switch to a different context. This changes the backend server connection and the environment "
              "variables (e.g. credentials, region) it runs with." },
            { "inputSchema",
              objectSchema({ { "context_name",
                               { { "type", "string" }, { "description", "Name of the context to switch to" } } } },
                           { "context_name" }) },
        },
        {
            { "name", "get_current_context" },
            { "description", "Get information about the current context, including its available tools." },
            { "inputSchema", noArguments },
        },
        {
            { "name", "proxy_tool" },
            { "description",
              "Call a tool on the current context's backend server with that context's environment." },
            { "inputSchema",
              objectSchema(
                  {
                      { "tool_name", { { "type", "string" }, { "description", "Name of the tool to call" } } },
                      { "arguments", { { "type", "object" }, { "description", "Arguments to pass to the tool" } } },
                  },
                  { "tool_name" }) },
        },
        {
            { "name", "list_proxied_tools" },
            { "description", "List the tools available from the current context's backend server." },
            { "inputSchema", noArguments },
        },
    });

    return nlohmann::json { { "tools", std::move(tools) } };
}

auto ProxyServer::handleToolsCall(const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto name = json::getString(params, "name");
    if (!name)
        return std::unexpected(name.error());

    auto const arguments = params.value("arguments", nlohmann::json::object());
    if (!arguments.is_object() && !arguments.is_null())
        return makeError(ErrorCode::InvalidArgument, "arguments must be an object");

    auto result = callTool(*name, arguments);
    if (!result)
    {
        if (result.error().code == ErrorCode::InvalidArgument)
            return std::unexpected(result.error());

        log::warning("Tool '{}' failed: {}", *name, result.error());
        auto text = std::format("{}", result.error());
        if (!result.error().payload.is_null())
            text += std::format("\n{}", result.error().payload.dump(2));
        return textContent(std::move(text), true);
    }

    if (*name == "proxy_tool" && isToolResult(*result))
        return std::move(*result);

    return textContent(result->dump(2, ' ', false, nlohmann::json::error_handler_t::replace), false);
}

auto ProxyServer::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (name == "list_contexts")
    {
        auto contexts = nlohmann::json::array();
        for (const auto& summary: _facade.listContexts())
            contexts.push_back(toJson(summary));
        return contexts;
    }

    if (name == "switch_context")
    {
        auto contextName = json::getString(arguments, "context_name");
        if (!contextName)
            return std::unexpected(contextName.error());
        return _facade.switchContext(*contextName).transform([](const ContextInfo& info) { return toJson(info); });
    }

    if (name == "get_current_context")
    {
        return _facade.getCurrentContext().transform(
            [](const std::optional<CurrentContext>& current) { return toJson(current); });
    }

    if (name == "proxy_tool")
    {
        auto toolName = json::getString(arguments, "tool_name");
        if (!toolName)
            return std::unexpected(toolName.error());

        auto const toolArguments = arguments.value("arguments", nlohmann::json::object());
        if (!toolArguments.is_object() && !toolArguments.is_null())
            return makeError(ErrorCode::InvalidArgument, "arguments must be an object");

        return _facade.invokeTool(*toolName, toolArguments);
    }

    if (name == "list_proxied_tools")
    {
        return _facade.listAvailableTools().transform(
            [](const std::vector<ToolDescriptor>& tools) { return toJson(tools); });
    }

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown tool: {}", name));
}

} // namespace envproxy
