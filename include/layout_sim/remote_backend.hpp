#pragma once

#include <memory>
#include <string>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

#include "backend_adapter.hpp"

namespace layout_sim::backend {

// Delivers one textual command to the simulation process and returns its reply.
class CommandTransport
{
public:
    virtual ~CommandTransport() = default;

    virtual std::string execute(const std::string& command) = 0;
};

/**
 * POSTs {"command": "..."} to the configured endpoint. The reply body may
 * be plain text or {"ok": bool, "result": ..., "error": "..."}. Transport
 * failures, timeouts, non-2xx statuses and "ok": false raise BackendError.
 */
class HttpCommandTransport : public CommandTransport
{
public:
    explicit HttpCommandTransport(config::RemoteConfig cfg);
    ~HttpCommandTransport() override;

    std::string execute(const std::string& command) override;

private:
    config::RemoteConfig     m_cfg;
    trantor::EventLoopThread m_loopThread;
    drogon::HttpClientPtr    m_client;
};

// Quotes and escapes a string literal for the command language.
std::string quoteString(const std::string& text);
std::string formatCommandValue(const PropertyValue& value);

/**
 * Translates each adapter call into one command of the simulator's
 * scripting language:
 *
 *   <template>.derive(<parent>, "<name>")
 *   <object>.<property> := <value>
 *   <connector>.connect(<from>, <to>)
 *
 * Template resolution is local; the remote side reports unknown paths on use.
 */
class RemoteBackend : public BackendAdapter
{
public:
    explicit RemoteBackend(std::unique_ptr<CommandTransport> transport, diag::DiagnosticManager* diag = nullptr);

    const char* name() const override { return "remote"; }

    ObjectHandle resolveTemplate(const std::string& path) override;
    ObjectHandle derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name) override;
    void setProperty(const ObjectHandle& object, const std::string& propertyPath, const PropertyValue& value) override;
    void connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to) override;

    std::size_t commandsSent() const { return m_commandsSent; }

private:
    std::string send(const std::string& command);

    std::unique_ptr<CommandTransport> m_transport;
    diag::DiagnosticManager*          m_diag{nullptr};
    std::size_t                       m_commandsSent{0};
};

} // namespace layout_sim::backend
