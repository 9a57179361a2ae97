#include "remote_backend.hpp"

#include "diagnostic_manager.hpp"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace layout_sim::backend {

namespace {

constexpr const char* kComponent = "RemoteBackend";

void formatNumber(std::ostringstream& oss, double v)
{
    oss << std::setprecision(15) << v;
}

} // namespace

// ---- HttpCommandTransport ----

HttpCommandTransport::HttpCommandTransport(config::RemoteConfig cfg)
    : m_cfg(std::move(cfg))
    , m_loopThread("RemoteBackendLoop")
{
    m_loopThread.run();
    m_client = drogon::HttpClient::newHttpClient(m_cfg.url, m_loopThread.getLoop());
    if (!m_client)
        throw BackendError("Unable to create HTTP client for " + m_cfg.url);
}

HttpCommandTransport::~HttpCommandTransport()
{
    m_client.reset();
}

std::string HttpCommandTransport::execute(const std::string& command)
{
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(m_cfg.endpoint);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    req->setBody(nlohmann::json{{"command", command}}.dump());

    auto [result, resp] = m_client->sendRequest(req, m_cfg.timeoutSec);
    if (result != drogon::ReqResult::Ok || !resp)
        throw BackendError("Transport failure (" + std::to_string(static_cast<int>(result)) + ") sending command to " +
                           m_cfg.url + m_cfg.endpoint);

    const auto status = static_cast<int>(resp->getStatusCode());
    const std::string body(resp->body());
    if (status < 200 || status >= 300)
        throw BackendError("Remote returned HTTP " + std::to_string(status) + ": " + body);

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
        return body;

    if (parsed.contains("ok") && parsed["ok"].is_boolean() && !parsed["ok"].get<bool>()) {
        std::string error = "Command rejected";
        if (parsed.contains("error") && parsed["error"].is_string())
            error = parsed["error"].get<std::string>();
        throw BackendError(error);
    }
    if (!parsed.contains("result"))
        return {};
    const auto& res = parsed["result"];
    return res.is_string() ? res.get<std::string>() : res.dump();
}

// ---- command formatting ----

std::string quoteString(const std::string& text)
{
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string formatCommandValue(const PropertyValue& value)
{
    std::ostringstream oss;
    if (const auto* s = std::get_if<std::string>(&value))
        return quoteString(*s);
    if (const auto* handle = std::get_if<ObjectHandle>(&value))
        return handle->path;
    if (const auto* i = std::get_if<long long>(&value))
        oss << *i;
    else if (const auto* d = std::get_if<double>(&value))
        formatNumber(oss, *d);
    else if (const auto* list = std::get_if<std::vector<double>>(&value)) {
        oss << '[';
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (i)
                oss << ", ";
            formatNumber(oss, (*list)[i]);
        }
        oss << ']';
    }
    return oss.str();
}

// ---- RemoteBackend ----

RemoteBackend::RemoteBackend(std::unique_ptr<CommandTransport> transport, diag::DiagnosticManager* diag)
    : m_transport(std::move(transport))
    , m_diag(diag)
{
    if (!m_transport)
        throw BackendError("Remote backend requires a command transport");
}

std::string RemoteBackend::send(const std::string& command)
{
    if (m_diag)
        m_diag->log(diag::Severity::DEBUG, kComponent, command);
    try {
        auto reply = m_transport->execute(command);
        ++m_commandsSent;
        return reply;
    } catch (const BackendError&) {
        throw;
    } catch (const std::exception& ex) {
        throw BackendError(std::string("Command failed: ") + ex.what());
    }
}

ObjectHandle RemoteBackend::resolveTemplate(const std::string& path)
{
    if (path.empty())
        throw BackendError("Empty template path");
    auto dot = path.rfind('.');
    return ObjectHandle{path, dot == std::string::npos ? path : path.substr(dot + 1)};
}

ObjectHandle RemoteBackend::derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name)
{
    send(templ.path + ".derive(" + parent.path + ", " + quoteString(name) + ")");
    return ObjectHandle{childPath(parent.path, name), name};
}

void RemoteBackend::setProperty(const ObjectHandle& object, const std::string& propertyPath,
                                const PropertyValue& value)
{
    send(object.path + "." + propertyPath + " := " + formatCommandValue(value));
}

void RemoteBackend::connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to)
{
    send(connector.path + ".connect(" + from.path + ", " + to.path + ")");
}

} // namespace layout_sim::backend
