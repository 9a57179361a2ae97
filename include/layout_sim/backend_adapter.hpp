#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "config_manager.hpp"
#include "data_types.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace layout_sim::backend {

class BackendError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Reference to an object in the target model, addressed by its full path.
struct ObjectHandle
{
    std::string path;
    std::string name;

    bool valid() const { return !path.empty(); }
};

bool operator==(const ObjectHandle& a, const ObjectHandle& b);

// Values a backend accepts for set_property; ObjectHandle assigns an object reference.
using PropertyValue = std::variant<std::string, long long, double, std::vector<double>, ObjectHandle>;

PropertyValue toPropertyValue(const data::Value& value);
std::string   propertyValueToString(const PropertyValue& value);

// Joins a parent path and a child name the way the target model addresses objects.
std::string childPath(const std::string& parentPath, const std::string& name);

/**
 * Capability set every execution backend provides. All calls are blocking
 * and report failures by throwing BackendError; callers never need to know
 * which backend is active.
 */
class BackendAdapter
{
public:
    virtual ~BackendAdapter() = default;

    virtual const char* name() const = 0;

    virtual ObjectHandle resolveTemplate(const std::string& path) = 0;
    virtual ObjectHandle derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name) = 0;
    virtual void setProperty(const ObjectHandle& object, const std::string& propertyPath, const PropertyValue& value) = 0;
    virtual void connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to) = 0;
};

std::unique_ptr<BackendAdapter> createBackend(const config::PipelineSettings& settings,
                                              diag::DiagnosticManager* diag = nullptr);

} // namespace layout_sim::backend
