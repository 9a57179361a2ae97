#include "backend_adapter.hpp"

#include "in_process_backend.hpp"
#include "mock_backend.hpp"
#include "remote_backend.hpp"

#include <sstream>

namespace layout_sim::backend {

bool operator==(const ObjectHandle& a, const ObjectHandle& b)
{
    return a.path == b.path;
}

PropertyValue toPropertyValue(const data::Value& value)
{
    return std::visit([](const auto& v) -> PropertyValue { return v; }, value);
}

std::string propertyValueToString(const PropertyValue& value)
{
    if (const auto* handle = std::get_if<ObjectHandle>(&value))
        return handle->path;

    std::ostringstream oss;
    if (const auto* s = std::get_if<std::string>(&value))
        return *s;
    if (const auto* i = std::get_if<long long>(&value))
        oss << *i;
    else if (const auto* d = std::get_if<double>(&value))
        oss << *d;
    else if (const auto* list = std::get_if<std::vector<double>>(&value)) {
        oss << '[';
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (i)
                oss << ", ";
            oss << (*list)[i];
        }
        oss << ']';
    }
    return oss.str();
}

std::string childPath(const std::string& parentPath, const std::string& name)
{
    if (parentPath.empty())
        return "." + name;
    if (parentPath.back() == '.')
        return parentPath + name;
    return parentPath + "." + name;
}

std::unique_ptr<BackendAdapter> createBackend(const config::PipelineSettings& settings, diag::DiagnosticManager* diag)
{
    switch (settings.backend) {
    case config::BackendKind::REMOTE:
        return std::make_unique<RemoteBackend>(std::make_unique<HttpCommandTransport>(settings.remote), diag);
    case config::BackendKind::IN_PROCESS: {
        auto backend = std::make_unique<InProcessBackend>(diag);
        for (const auto& path : settings.inProcessTemplates)
            backend->registerTemplate(path);
        return backend;
    }
    case config::BackendKind::MOCK:
        return std::make_unique<MockBackend>(diag);
    }
    throw BackendError("Unsupported backend kind");
}

} // namespace layout_sim::backend
